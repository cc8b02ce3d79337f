#include "filterfold.h"
#include <QDebug>

namespace jdv {

QSet<QString> FilterFoldEngine::computeFoldSet(const BlockTreeIndex& index,
                                               const QVector<DiffType>& types) {
    QSet<QString> fold;
    if (types.isEmpty()) return fold;

    // Start from every container, drop the ones holding a matching change
    for (const auto& id : index.containerIds) fold.insert(id);
    for (DiffType t : types) {
        auto it = index.containersByMatchingType.constFind(diffTypeIndex(t));
        if (it == index.containersByMatchingType.constEnd()) continue;
        for (const auto& id : *it) fold.remove(id);
    }
    return fold;
}

void FilterFoldEngine::setIndex(const BlockTreeIndex* index) {
    m_index = index;
    m_foldSet.clear();
    m_filters.clear();
}

FoldDelta FilterFoldEngine::setFilters(const QVector<DiffType>& types) {
    FoldDelta delta;
    m_filters = types;
    if (!m_index) {
        qWarning() << "FilterFold: no block index, filter ignored";
        return delta;
    }

    QSet<QString> next = computeFoldSet(*m_index, types);
    for (const auto& id : m_index->containerIds) {
        const bool was = m_foldSet.contains(id);
        const bool now = next.contains(id);
        if (now && !was) delta.toFold.append(id);
        else if (was && !now) delta.toUnfold.append(id);
    }
    m_foldSet = next;
    return delta;
}

} // namespace jdv
