#pragma once
#include "blockindex.h"

namespace jdv {

// Folds every container whose subtree holds no change of an active filter
// type. Holds only the previous fold set, so it can be driven repeatedly.
class FilterFoldEngine {
public:
    explicit FilterFoldEngine(const BlockTreeIndex* index = nullptr) : m_index(index) {}

    void setIndex(const BlockTreeIndex* index);

    // Returns what to fold and unfold to move from the previous fold set to
    // the one for types. Both lists follow container document order.
    FoldDelta setFilters(const QVector<DiffType>& types);

    // Clears the filter. Returns the delta that unfolds everything folded so far.
    FoldDelta reset() { return setFilters({}); }

    const QSet<QString>&     foldSet() const { return m_foldSet; }
    const QVector<DiffType>& filters() const { return m_filters; }

    static QSet<QString> computeFoldSet(const BlockTreeIndex& index,
                                        const QVector<DiffType>& types);

private:
    const BlockTreeIndex* m_index;
    QSet<QString>         m_foldSet;
    QVector<DiffType>     m_filters;
};

} // namespace jdv
