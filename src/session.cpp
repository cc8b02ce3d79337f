#include "session.h"
#include <QJsonObject>
#include <QDebug>

namespace jdv {

DiffSession::DiffSession(QObject* parent) : QObject(parent) {}

DiffSession::~DiffSession() {
    // navigation holds references into m_root / m_index
    delete m_nav;
    m_nav = nullptr;
}

void DiffSession::setResult(ChangeNode root, const QJsonValue& merged) {
    delete m_nav;
    m_nav = nullptr;

    m_root = std::move(root);
    m_merged = merged;
    m_hasResult = true;

    if (!verifyCounts(m_root)) {
        qWarning() << "Session: change counts inconsistent, recomputing";
        recomputeCounts(m_root);
    }

    m_index = BlockTreeIndex::build(m_root);
    m_filterFold.setIndex(&m_index);
    m_nav = new NavigationIndex(m_root, m_index, m_merged, this);
    connect(m_nav, &NavigationIndex::navigated, this, &DiffSession::onNavigated);

    qDebug() << "Session: loaded" << m_index.byId.size() << "blocks,"
             << m_index.changedBlocks.size() << "changed";
    rebuild();

    if (!m_options.filters.isEmpty())
        emit filterFoldsChanged(m_filterFold.setFilters(m_options.filters));
}

bool DiffSession::loadResult(const QJsonObject& json) {
    if (!json.value("tree").isObject()) {
        qWarning() << "Session: result has no tree object";
        return false;
    }
    setResult(ChangeNode::fromJson(json.value("tree").toObject()), json.value("merged"));
    return true;
}

void DiffSession::clear() {
    delete m_nav;
    m_nav = nullptr;
    m_root = ChangeNode{};
    m_merged = QJsonValue();
    m_hasResult = false;
    m_index = BlockTreeIndex{};
    m_filterFold.setIndex(&m_index);
    m_aligned = AlignmentResult{};
    m_unified = UnifiedResult{};
    emit contentRebuilt();
}

void DiffSession::setOptions(const DiffOptions& opts) {
    if (opts == m_options) return;
    const bool layoutChanged = opts.format != m_options.format
        || opts.displayMode != m_options.displayMode
        || opts.wordDiffMode != m_options.wordDiffMode
        || opts.inlineWordDiff != m_options.inlineWordDiff;
    const bool filtersChanged = opts.filters != m_options.filters;
    // deltas sent while folding was off were never applied to the panes
    const bool foldingTurnedOn = opts.enableFolding && !m_options.enableFolding;

    m_options = opts;
    emit optionsChanged();
    if (!m_hasResult) return;

    if (layoutChanged || foldingTurnedOn) {
        if (layoutChanged)
            rebuild();
        // the panes start unfolded, re-apply the whole filter
        m_filterFold.setIndex(&m_index);
        if (!m_options.filters.isEmpty())
            emit filterFoldsChanged(m_filterFold.setFilters(m_options.filters));
    } else if (filtersChanged) {
        emit filterFoldsChanged(m_filterFold.setFilters(m_options.filters));
    }
}

void DiffSession::setFilters(const QVector<DiffType>& types) {
    m_options.filters = types;
    if (!m_hasResult) return;
    FoldDelta delta = m_filterFold.setFilters(types);
    if (!delta.isEmpty())
        emit filterFoldsChanged(delta);
}

void DiffSession::rebuild() {
    if (isUnified()) {
        m_unified = composeUnified(m_root, m_options.format, m_options.unifiedOptions());
        m_aligned = AlignmentResult{};
    } else {
        m_aligned = composeAligned(m_root, m_options.format, m_options.alignOptions());
        m_unified = UnifiedResult{};
    }
    emit contentRebuilt();
}

const QVector<LineMapping>& DiffSession::lineMap() const {
    return isUnified() ? m_unified.lineMap : m_aligned.lineMap;
}

const QHash<QString, LineRange>& DiffSession::blockLineRanges() const {
    return isUnified() ? m_unified.blockLineRanges : m_aligned.blockLineRanges;
}

int DiffSession::lineForBlock(const QString& blockId) const {
    const auto& ranges = blockLineRanges();
    auto it = ranges.constFind(blockId);
    return it == ranges.constEnd() ? -1 : it->start;
}

QVector<LineWordDiff> DiffSession::wordDiff(Side side, int fromRow, int toRow) const {
    if (m_options.wordDiffMode == WordDiffMode::None && !isUnified())
        return {};
    if (isUnified()) {
        if (!m_options.inlineWordDiff) return {};
        return buildInlineWordDiffData(m_unified.lines, m_unified.lineMap,
                                       m_unified.beforeContentMap, m_options.wordDiffMode);
    }
    return buildWordDiffData(m_aligned.lineMap, m_aligned.beforeLines, m_aligned.afterLines,
                             side, m_options.wordDiffMode, fromRow, toRow);
}

void DiffSession::onNavigated(const QString& path) {
    if (!m_nav) return;
    emit revealRequested(m_nav->ancestorIds(path), lineForBlock(path));
}

} // namespace jdv
