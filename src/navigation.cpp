#include "navigation.h"
#include "path.h"
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>
#include <algorithm>

namespace jdv {

namespace {

bool hasContent(const QJsonValue& v) {
    if (v.isObject()) {
        QJsonObject o = v.toObject();
        return o.size() > (o.contains(kMetaKey) ? 1 : 0);
    }
    if (v.isArray()) return !v.toArray().isEmpty();
    return false;
}

QString primitiveText(const QJsonValue& v) {
    switch (v.type()) {
    case QJsonValue::String: return v.toString();
    case QJsonValue::Bool:   return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: return v.toVariant().toString();
    default: break;
    }
    return {};
}

bool isPrimitive(const QJsonValue& v) {
    return v.isString() || v.isBool() || v.isDouble();
}

QJsonValue valueAt(const QJsonValue& root, const QStringList& segments) {
    QJsonValue cur = root;
    for (const auto& seg : segments) {
        if (cur.isObject()) {
            QJsonObject o = cur.toObject();
            auto it = o.constFind(seg);
            if (it == o.constEnd()) return QJsonValue(QJsonValue::Undefined);
            cur = *it;
        } else if (cur.isArray()) {
            bool ok = false;
            int i = seg.toInt(&ok);
            QJsonArray a = cur.toArray();
            if (!ok || i < 0 || i >= a.size()) return QJsonValue(QJsonValue::Undefined);
            cur = a.at(i);
        } else {
            return QJsonValue(QJsonValue::Undefined);
        }
    }
    return cur;
}

std::array<int, kDiffTypeCount> typeCounts(const BlockEntry* e) {
    std::array<int, kDiffTypeCount> c{};
    if (!e) return c;
    for (int t = 0; t < kDiffTypeCount; t++)
        c[t] = e->node->counts[1 + t];
    return c;
}

// Depth-first search state for findPaths
struct PathSearch {
    QString                   needle;
    FindPathsOptions          opts;
    QVector<PathSearchResult> results;

    bool full() const { return opts.limit >= 0 && results.size() >= opts.limit; }

    bool matches(const QString& s) const {
        return s.contains(needle, opts.caseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive);
    }

    void add(const QString& path, const QString& text, MatchLocation where,
             const QJsonObject& meta) {
        PathSearchResult r;
        r.path = path;
        r.matchedText = text;
        r.matchLocation = where;
        if (!meta.isEmpty()) {
            r.hasDiffType = true;
            r.diffType = diffTypeFromString(meta.value(QStringLiteral("type")).toString());
        }
        results.append(r);
    }

    void walk(const QJsonValue& node, QStringList& segments) {
        if (full()) return;

        if (node.isObject()) {
            const QJsonObject obj = node.toObject();
            const QJsonObject diffMeta = obj.value(kMetaKey).toObject();
            for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
                if (full()) return;
                const QString key = it.key();
                if (key == kMetaKey) continue;

                segments.append(key);
                const QString path = formatPath(segments);
                const QJsonObject childMeta = diffMeta.value(key).toObject();

                if (opts.searchIn != SearchIn::Values && matches(key)) {
                    add(path, key, MatchLocation::Key, childMeta);
                    if (full()) { segments.removeLast(); return; }
                }
                const QJsonValue value = it.value();
                if (opts.searchIn != SearchIn::Keys && isPrimitive(value)) {
                    const QString text = primitiveText(value);
                    if (matches(text)) {
                        add(path, text, MatchLocation::Value, childMeta);
                        if (full()) { segments.removeLast(); return; }
                    }
                }
                walk(value, segments);
                segments.removeLast();
            }
        } else if (node.isArray()) {
            const QJsonArray arr = node.toArray();
            for (int i = 0; i < arr.size(); i++) {
                if (full()) return;
                segments.append(QString::number(i));
                walk(arr.at(i), segments);
                segments.removeLast();
            }
        }
    }
};

struct SummaryItem {
    const ChangeNode* node;
    bool              parentSubsumes;
};

} // namespace

NavigationIndex::NavigationIndex(const ChangeNode& root, const BlockTreeIndex& index,
                                 const QJsonValue& merged, QObject* parent)
    : QObject(parent), m_root(root), m_index(index), m_merged(merged) {}

void NavigationIndex::resetCursor() {
    m_cursor = -1;
    m_currentPath.clear();
}

QString NavigationIndex::step(const QVector<DiffType>& types, bool forward) {
    const QVector<ChangedBlock> blocks = m_index.changedOfTypes(types);
    const int n = blocks.size();
    if (n == 0) return {};

    // cursor may be stale after switching to a shorter filtered list: step
    // from just outside the list so the wrap lands on the first or last entry
    if (m_cursor >= n) m_cursor = forward ? -1 : n;
    if (forward)
        m_cursor = (m_cursor + 1) % n;
    else
        m_cursor = m_cursor <= 0 ? n - 1 : m_cursor - 1;

    m_currentPath = blocks[m_cursor].blockId;
    emit navigated(m_currentPath);
    return m_currentPath;
}

QString NavigationIndex::nextChange(const QVector<DiffType>& types) {
    return step(types, true);
}

QString NavigationIndex::prevChange(const QVector<DiffType>& types) {
    return step(types, false);
}

bool NavigationIndex::goToPath(const QString& path) {
    if (!m_index.entry(path)) {
        qDebug() << "Navigation: no block at" << path;
        return false;
    }
    m_cursor = -1;
    for (int i = 0; i < m_index.changedBlocks.size(); i++) {
        if (m_index.changedBlocks[i].blockId == path) {
            m_cursor = i;
            break;
        }
    }
    m_currentPath = path;
    emit navigated(path);
    return true;
}

ChangeSummary NavigationIndex::changeSummary() const {
    ChangeSummary s;
    QVector<SummaryItem> stack;
    stack.append({&m_root, false});
    while (!stack.isEmpty()) {
        SummaryItem it = stack.takeLast();
        const ChangeNode& n = *it.node;

        if (n.hasDiff() && !it.parentSubsumes) {
            s.total++;
            switch (n.diff.type) {
            case DiffType::Breaking:     s.breaking++; break;
            case DiffType::NonBreaking:  s.nonBreaking++; break;
            case DiffType::Annotation:   s.annotation++; break;
            case DiffType::Unclassified: s.unclassified++; break;
            }
            if (!n.id.isEmpty()) {
                auto& list = s.byPath[n.id];
                auto pc = std::find_if(list.begin(), list.end(),
                                       [&](const PathCount& c) { return c.type == n.diff.type; });
                if (pc != list.end()) pc->count++;
                else list.append({n.diff.type, 1});
            }
        }

        const bool subsumes = it.parentSubsumes || (n.hasDiff() && n.subsumesChildren());
        for (auto c = n.children.rbegin(); c != n.children.rend(); ++c)
            stack.append({&*c, subsumes});
    }
    return s;
}

QVector<PathSearchResult> NavigationIndex::findPaths(const QString& text,
                                                     const FindPathsOptions& opts) const {
    if (text.isEmpty() || m_merged.isNull() || m_merged.isUndefined()) return {};
    PathSearch search{text, opts, {}};
    QStringList segments;
    search.walk(m_merged, segments);
    return search.results;
}

QVector<ChildKeyInfo> NavigationIndex::childKeys(const QString& path) const {
    QVector<ChildKeyInfo> out;
    const QStringList segments = parsePath(path);
    const QJsonValue node = valueAt(m_merged, segments);

    if (node.isArray()) {
        const QJsonArray arr = node.toArray();
        for (int i = 0; i < arr.size(); i++) {
            ChildKeyInfo info;
            info.key  = QString::number(i);
            info.path = formatPath(segments + QStringList{info.key});
            info.hasChildren  = hasContent(arr.at(i));
            info.changeCounts = typeCounts(m_index.entry(info.path));
            out.append(info);
        }
        return out;
    }
    if (!node.isObject()) return out;

    const QJsonObject obj = node.toObject();
    const QJsonObject diffMeta = obj.value(kMetaKey).toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (it.key() == kMetaKey) continue;
        ChildKeyInfo info;
        info.key  = it.key();
        info.path = formatPath(segments + QStringList{info.key});
        auto meta = diffMeta.constFind(info.key);
        if (meta != diffMeta.constEnd() && meta.value().isObject()) {
            const QJsonObject m = meta.value().toObject();
            info.hasDirectChange = true;
            info.diffType = diffTypeFromString(m.value(QStringLiteral("type")).toString());
            info.action   = diffActionFromString(m.value(QStringLiteral("action")).toString());
        }
        info.hasChildren  = hasContent(it.value());
        info.changeCounts = typeCounts(m_index.entry(info.path));
        out.append(info);
    }
    return out;
}

QString NavigationIndex::blockIdForPath(const QStringList& segments) const {
    QString id = formatPath(segments);
    return m_index.entry(id) ? id : QString();
}

QStringList NavigationIndex::pathForBlockId(const QString& blockId) const {
    if (!m_index.entry(blockId)) return {};
    return parsePath(blockId);
}

QStringList NavigationIndex::ancestorIds(const QString& blockId) const {
    if (const BlockEntry* e = m_index.entry(blockId))
        return e->ancestorIds;
    return ancestorBlockIds(m_root, blockId);
}

} // namespace jdv
