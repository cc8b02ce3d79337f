#include "foldsync.h"
#include <QDebug>
#include <QTimer>
#include <algorithm>

namespace jdv {

namespace {

int keyFrom(quint64 key) { return int(quint32(key >> 32)); }

Side otherSide(Side s) { return s == Side::Before ? Side::After : Side::Before; }

} // namespace

FoldSyncCoordinator::FoldSyncCoordinator(FoldPane* before, FoldPane* after, QObject* parent)
    : QObject(parent) {
    m_before.pane = before;
    m_after.pane  = after;
    m_before.snapshot = snapshotOf(before);
    m_after.snapshot  = snapshotOf(after);

    if (before)
        connect(before, &FoldPane::foldsChanged, this, [this] { onFoldsChanged(Side::Before); });
    if (after)
        connect(after, &FoldPane::foldsChanged, this, [this] { onFoldsChanged(Side::After); });
}

void FoldSyncCoordinator::setLineMap(const QVector<LineMapping>& lineMap) {
    m_lineMap = lineMap;
}

QSet<quint64> FoldSyncCoordinator::snapshotOf(const FoldPane* pane) {
    QSet<quint64> keys;
    if (!pane) return keys;
    for (const auto& r : pane->foldedRanges())
        keys.insert(r.key());
    return keys;
}

QString FoldSyncCoordinator::blockIdAtLine(int line) const {
    if (line < 1 || line > m_lineMap.size()) return {};
    return m_lineMap[line - 1].blockId;
}

void FoldSyncCoordinator::beginApplying(Side target) {
    state(target).phase = SyncPhase::Applying;
    QTimer::singleShot(0, this, [this, target] {
        PaneState& st = state(target);
        st.phase = SyncPhase::Synced;
        st.snapshot = snapshotOf(st.pane);
    });
}

void FoldSyncCoordinator::onFoldsChanged(Side source) {
    PaneState& src = state(source);
    PaneState& dst = state(otherSide(source));
    if (!src.pane) return;

    const QVector<FoldRange> ranges = src.pane->foldedRanges();
    QSet<quint64> current;
    for (const auto& r : ranges) current.insert(r.key());

    if (!m_enabled || src.phase == SyncPhase::Applying) {
        src.snapshot = current;
        return;
    }

    QVector<int> foldedLines;
    for (const auto& r : ranges)
        if (!src.snapshot.contains(r.key()))
            foldedLines.append(src.pane->lineAt(r.from));

    QVector<int> unfoldedLines;
    for (quint64 key : src.snapshot)
        if (!current.contains(key))
            unfoldedLines.append(src.pane->lineAt(keyFrom(key)));
    std::sort(unfoldedLines.begin(), unfoldedLines.end());

    src.snapshot = current;
    if (foldedLines.isEmpty() && unfoldedLines.isEmpty()) return;

    for (int line : foldedLines) {
        QString id = blockIdAtLine(line);
        if (!id.isEmpty()) src.manualFolds.insert(id);
    }
    // an unfold applies to both panes, so neither keeps the manual fold
    for (int line : unfoldedLines) {
        QString id = blockIdAtLine(line);
        if (id.isEmpty()) continue;
        src.manualFolds.remove(id);
        dst.manualFolds.remove(id);
    }

    if (!dst.pane) return;
    beginApplying(otherSide(source));

    int folded = 0, unfolded = 0;
    for (int line : foldedLines) {
        if (line < 1 || line > dst.pane->lineCount()) continue;
        if (dst.pane->isFolded(line) || !dst.pane->isFoldable(line)) continue;
        if (dst.pane->foldLine(line)) folded++;
    }
    for (int line : unfoldedLines) {
        if (line < 1 || line > dst.pane->lineCount()) continue;
        if (!dst.pane->isFolded(line)) continue;
        if (dst.pane->unfoldLine(line)) unfolded++;
    }
    emit foldsMirrored(source, folded, unfolded);
}

void FoldSyncCoordinator::applyFilterDelta(const FoldDelta& delta,
                                           const QHash<QString, LineRange>& blockLineRanges) {
    if (delta.isEmpty()) return;

    for (Side side : {Side::Before, Side::After}) {
        PaneState& st = state(side);
        if (!st.pane) continue;
        beginApplying(side);

        for (const auto& id : delta.toFold) {
            auto it = blockLineRanges.constFind(id);
            if (it == blockLineRanges.constEnd()) continue;
            const int line = it->start;
            if (line < 1 || line > st.pane->lineCount()) continue;
            if (!st.pane->isFolded(line) && st.pane->isFoldable(line))
                st.pane->foldLine(line);
        }

        for (const auto& id : delta.toUnfold) {
            if (m_before.manualFolds.contains(id) || m_after.manualFolds.contains(id))
                continue;
            auto it = blockLineRanges.constFind(id);
            if (it == blockLineRanges.constEnd()) continue;
            const int line = it->start;
            if (line < 1 || line > st.pane->lineCount()) continue;
            if (st.pane->isFolded(line))
                st.pane->unfoldLine(line);
        }
    }

    for (const auto& id : delta.toFold)   m_filterFolds.insert(id);
    for (const auto& id : delta.toUnfold) m_filterFolds.remove(id);
}

void FoldSyncCoordinator::foldAll() {
    for (Side side : {Side::Before, Side::After}) {
        PaneState& st = state(side);
        if (!st.pane) continue;
        beginApplying(side);
        // innermost first so every header gets its own fold
        for (int line = st.pane->lineCount(); line >= 1; line--) {
            if (!st.pane->isFoldable(line) || st.pane->isFolded(line)) continue;
            if (st.pane->foldLine(line)) {
                QString id = blockIdAtLine(line);
                if (!id.isEmpty()) st.manualFolds.insert(id);
            }
        }
    }
}

void FoldSyncCoordinator::unfoldAll() {
    for (Side side : {Side::Before, Side::After}) {
        PaneState& st = state(side);
        if (!st.pane) continue;
        beginApplying(side);
        for (int line = 1; line <= st.pane->lineCount(); line++)
            if (st.pane->isFolded(line))
                st.pane->unfoldLine(line);
        st.manualFolds.clear();
    }
    m_filterFolds.clear();
}

void FoldSyncCoordinator::revealBlocks(const QStringList& blockIds,
                                       const QHash<QString, LineRange>& blockLineRanges) {
    for (Side side : {Side::Before, Side::After}) {
        PaneState& st = state(side);
        if (!st.pane) continue;
        bool touched = false;
        for (const auto& id : blockIds) {
            auto it = blockLineRanges.constFind(id);
            if (it == blockLineRanges.constEnd()) continue;
            const int line = it->start;
            if (line < 1 || line > st.pane->lineCount() || !st.pane->isFolded(line)) continue;
            if (!touched) {
                beginApplying(side);
                touched = true;
            }
            st.pane->unfoldLine(line);
            st.manualFolds.remove(id);
        }
    }
}

QSet<QString> FoldSyncCoordinator::foldedBlockIds(Side side) const {
    QSet<QString> ids;
    const PaneState& st = state(side);
    if (!st.pane) return ids;
    for (const auto& r : st.pane->foldedRanges()) {
        QString id = blockIdAtLine(st.pane->lineAt(r.from));
        if (!id.isEmpty()) ids.insert(id);
    }
    return ids;
}

void FoldSyncCoordinator::restoreFolds(const QSet<QString>& blockIds,
                                       const QHash<QString, LineRange>& blockLineRanges) {
    if (blockIds.isEmpty()) return;
    for (Side side : {Side::Before, Side::After}) {
        PaneState& st = state(side);
        if (!st.pane) continue;
        beginApplying(side);
        for (const auto& id : blockIds) {
            auto it = blockLineRanges.constFind(id);
            if (it == blockLineRanges.constEnd()) continue;
            const int line = it->start;
            if (line < 1 || line > st.pane->lineCount()) continue;
            if (st.pane->isFolded(line) || !st.pane->isFoldable(line)) continue;
            if (st.pane->foldLine(line))
                st.manualFolds.insert(id);
        }
    }
}

void FoldSyncCoordinator::resync() {
    m_before.snapshot = snapshotOf(m_before.pane);
    m_after.snapshot  = snapshotOf(m_after.pane);
    m_before.manualFolds.clear();
    m_after.manualFolds.clear();
    m_filterFolds.clear();
}

} // namespace jdv
