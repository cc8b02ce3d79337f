#pragma once
#include "blockindex.h"
#include <QObject>
#include <QJsonValue>

namespace jdv {

// Path based queries and change cycling over one compare result. Holds
// non-owning references: the tree and its index must outlive this object.
class NavigationIndex : public QObject {
    Q_OBJECT
public:
    NavigationIndex(const ChangeNode& root, const BlockTreeIndex& index,
                    const QJsonValue& merged = QJsonValue(), QObject* parent = nullptr);

    // Cycle through changed blocks, optionally only those of the given types.
    // Returns the block path, or a null string when there is no such change.
    QString nextChange(const QVector<DiffType>& types = {});
    QString prevChange(const QVector<DiffType>& types = {});

    // Moves the cursor onto path. Returns false when path is not a block.
    bool goToPath(const QString& path);

    QString currentPath() const { return m_currentPath; }
    int cursor() const { return m_cursor; }
    void resetCursor();

    ChangeSummary changeSummary() const;
    QVector<PathSearchResult> findPaths(const QString& text,
                                        const FindPathsOptions& opts = {}) const;
    QVector<ChildKeyInfo> childKeys(const QString& path = QString()) const;

    // path <-> block id. Misses return a null string / empty list.
    QString blockIdForPath(const QStringList& segments) const;
    QStringList pathForBlockId(const QString& blockId) const;
    QStringList ancestorIds(const QString& blockId) const;

signals:
    void navigated(const QString& path);

private:
    QString step(const QVector<DiffType>& types, bool forward);

    const ChangeNode&     m_root;
    const BlockTreeIndex& m_index;
    QJsonValue            m_merged;
    int                   m_cursor = -1;
    QString               m_currentPath;
};

} // namespace jdv
