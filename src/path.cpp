#include "path.h"

namespace jdv {

QString encodeSegment(const QString& key) {
    QString s = key;
    s.replace(QLatin1String("~"), QLatin1String("~0"));
    s.replace(QLatin1String("/"), QLatin1String("~1"));
    return s;
}

QString decodeSegment(const QString& segment) {
    QString s = segment;
    s.replace(QLatin1String("~1"), QLatin1String("/"));
    s.replace(QLatin1String("~0"), QLatin1String("~"));
    return s;
}

QStringList parsePath(const QString& path) {
    QStringList out;
    if (path.isEmpty()) return out;
    const QStringList raw = path.split(QLatin1Char('/'));
    out.reserve(raw.size());
    for (const auto& seg : raw)
        out.append(decodeSegment(seg));
    return out;
}

QString formatPath(const QStringList& segments) {
    QStringList enc;
    enc.reserve(segments.size());
    for (const auto& seg : segments)
        enc.append(encodeSegment(seg));
    return enc.join(QLatin1Char('/'));
}

QStringList ancestorBlockIds(const ChangeNode& root, const QString& path) {
    const QStringList segments = parsePath(path);
    QStringList ancestors;
    for (int i = 1; i < segments.size(); i++) {
        QString prefix = formatPath(segments.mid(0, i));
        if (findNode(root, prefix))
            ancestors.append(prefix);
    }
    return ancestors;
}

} // namespace jdv
