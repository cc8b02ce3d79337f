#include "blockindex.h"
#include <QDebug>

namespace jdv {

namespace {

struct WalkItem {
    const ChangeNode* node;
    QString           parentId;
    QStringList       ancestors;
    int               depth;
};

} // namespace

BlockTreeIndex BlockTreeIndex::build(const ChangeNode& root) {
    BlockTreeIndex idx;
    for (int t = 0; t < kDiffTypeCount; t++)
        idx.containersByMatchingType.insert(t, {});

    QVector<WalkItem> stack;
    stack.append({&root, QString(), QStringList(), 0});
    while (!stack.isEmpty()) {
        WalkItem it = stack.takeLast();
        const ChangeNode& n = *it.node;

        if (!n.id.isEmpty()) {
            if (idx.byId.contains(n.id))
                qWarning() << "BlockIndex: duplicate block id" << n.id;
            idx.byId.insert(n.id, {&n, it.parentId, it.depth, it.ancestors});

            if (n.hasDiff())
                idx.changedBlocks.append({n.id, n.diff.type});

            if (n.isContainer()) {
                idx.containerIds.append(n.id);
                bool anyChange = false;
                for (int t = 0; t < kDiffTypeCount; t++) {
                    if (n.counts[1 + t] > 0) {
                        idx.containersByMatchingType[t].insert(n.id);
                        anyChange = true;
                    }
                }
                if (!anyChange)
                    idx.unchangedContainers.insert(n.id);
            }
        }

        QString childParent = n.id.isEmpty() ? it.parentId : n.id;
        QStringList childAncestors = it.ancestors;
        if (!n.id.isEmpty()) childAncestors.append(n.id);
        for (auto c = n.children.rbegin(); c != n.children.rend(); ++c)
            stack.append({&*c, childParent, childAncestors, it.depth + 1});
    }
    return idx;
}

QVector<ChangedBlock> BlockTreeIndex::changedOfTypes(const QVector<DiffType>& types) const {
    if (types.isEmpty()) return changedBlocks;
    QVector<ChangedBlock> out;
    for (const auto& c : changedBlocks)
        if (types.contains(c.type)) out.append(c);
    return out;
}

} // namespace jdv
