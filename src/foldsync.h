#pragma once
#include "core.h"
#include "foldpane.h"
#include <QPointer>

namespace jdv {

enum class SyncPhase : uint8_t { Synced, Applying };

// Mirrors fold/unfold actions between the before and after panes, which share
// the same row alignment. A pane receiving mirrored folds is Applying until
// the next event loop turn so its own change signal is not sent back.
class FoldSyncCoordinator : public QObject {
    Q_OBJECT
public:
    FoldSyncCoordinator(FoldPane* before, FoldPane* after, QObject* parent = nullptr);

    void setLineMap(const QVector<LineMapping>& lineMap);

    // Disabled: snapshots are still tracked, nothing is mirrored.
    void setEnabled(bool on) { m_enabled = on; }
    bool isEnabled() const { return m_enabled; }

    SyncPhase phase(Side side) const { return state(side).phase; }

    // Folds toFold and unfolds toUnfold on both panes. Blocks the user folded
    // by hand stay folded.
    void applyFilterDelta(const FoldDelta& delta,
                          const QHash<QString, LineRange>& blockLineRanges);

    void foldAll();
    void unfoldAll();

    // Unfold the given blocks on both panes (ancestors of a navigation target).
    void revealBlocks(const QStringList& blockIds,
                      const QHash<QString, LineRange>& blockLineRanges);

    // Block ids of the folded header lines of one pane.
    QSet<QString> foldedBlockIds(Side side) const;

    // Re-fold blocks by id after the content was rebuilt.
    void restoreFolds(const QSet<QString>& blockIds,
                      const QHash<QString, LineRange>& blockLineRanges);

    // Re-read both panes' fold state without mirroring (after a content reload).
    void resync();

    const QSet<QString>& manualFolds(Side side) const { return state(side).manualFolds; }
    const QSet<QString>& filterFolds() const { return m_filterFolds; }

signals:
    void foldsMirrored(jdv::Side source, int folded, int unfolded);

private:
    struct PaneState {
        QPointer<FoldPane> pane;
        SyncPhase          phase = SyncPhase::Synced;
        QSet<quint64>      snapshot;      // FoldRange::key of folded ranges
        QSet<QString>      manualFolds;
    };

    PaneState&       state(Side s)       { return s == Side::Before ? m_before : m_after; }
    const PaneState& state(Side s) const { return s == Side::Before ? m_before : m_after; }

    void onFoldsChanged(Side source);
    void beginApplying(Side target);
    QString blockIdAtLine(int line) const;
    static QSet<quint64> snapshotOf(const FoldPane* pane);

    PaneState            m_before;
    PaneState            m_after;
    QSet<QString>        m_filterFolds;
    QVector<LineMapping> m_lineMap;
    bool                 m_enabled = true;
};

} // namespace jdv
