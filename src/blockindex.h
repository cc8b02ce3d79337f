#pragma once
#include "core.h"

namespace jdv {

struct BlockEntry {
    const ChangeNode* node = nullptr;
    QString           parentId;      // nearest addressable ancestor, empty at top level
    int               depth = 0;
    QStringList       ancestorIds;   // root first, excludes the block itself
};

struct ChangedBlock {
    QString  blockId;
    DiffType type = DiffType::Unclassified;
};

// Flat lookup tables over one change tree. Built once per tree; node
// pointers stay valid as long as the tree is not modified or destroyed.
struct BlockTreeIndex {
    QHash<QString, BlockEntry> byId;
    QStringList                containerIds;              // document order
    QHash<int, QSet<QString>>  containersByMatchingType;  // diffTypeIndex -> ids
    QSet<QString>              unchangedContainers;
    QVector<ChangedBlock>      changedBlocks;             // document order

    static BlockTreeIndex build(const ChangeNode& root);

    const BlockEntry* entry(const QString& id) const {
        auto it = byId.constFind(id);
        return it == byId.constEnd() ? nullptr : &*it;
    }

    // Changed blocks whose type is in types, document order. Empty types = all.
    QVector<ChangedBlock> changedOfTypes(const QVector<DiffType>& types) const;
};

} // namespace jdv
