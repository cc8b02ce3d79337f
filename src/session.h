#pragma once
#include "core.h"
#include "blockindex.h"
#include "filterfold.h"
#include "navigation.h"
#include "options.h"
#include "worddiff.h"
#include <QObject>
#include <QJsonValue>

namespace jdv {

// One compare result: the change tree, the merged document, and everything
// derived from them for the current options.
class DiffSession : public QObject {
    Q_OBJECT
public:
    explicit DiffSession(QObject* parent = nullptr);
    ~DiffSession() override;

    void setResult(ChangeNode root, const QJsonValue& merged = QJsonValue());
    bool loadResult(const QJsonObject& json);   // {"tree": {...}, "merged": ...}
    void clear();

    void setOptions(const DiffOptions& opts);
    const DiffOptions& options() const { return m_options; }
    void setFilters(const QVector<DiffType>& types);

    bool hasResult() const { return m_hasResult; }
    const ChangeNode& root() const { return m_root; }
    const BlockTreeIndex& index() const { return m_index; }
    NavigationIndex* navigation() const { return m_nav; }

    bool isUnified() const { return m_options.displayMode == DisplayMode::Inline; }
    const AlignmentResult& alignment() const { return m_aligned; }
    const UnifiedResult& unified() const { return m_unified; }
    const QVector<LineMapping>& lineMap() const;
    const QHash<QString, LineRange>& blockLineRanges() const;

    // First editor line of a block, -1 when the block renders no row.
    int lineForBlock(const QString& blockId) const;

    // Word ranges for rows [fromRow, toRow] of one pane. In the unified
    // layout the side is ignored and added ranges are returned.
    QVector<LineWordDiff> wordDiff(Side side, int fromRow = 0, int toRow = 0) const;

signals:
    void optionsChanged();
    void contentRebuilt();
    void filterFoldsChanged(const jdv::FoldDelta& delta);
    // Ancestors to unfold and the editor line to scroll to.
    void revealRequested(const QStringList& ancestorIds, int line);

private:
    void rebuild();
    void onNavigated(const QString& path);

    ChangeNode        m_root;
    QJsonValue        m_merged;
    bool              m_hasResult = false;
    DiffOptions       m_options;
    BlockTreeIndex    m_index;
    FilterFoldEngine  m_filterFold;
    NavigationIndex*  m_nav = nullptr;
    AlignmentResult   m_aligned;
    UnifiedResult     m_unified;
};

} // namespace jdv
