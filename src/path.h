#pragma once
#include "core.h"

namespace jdv {

// JSON Pointer escaping of a single segment: "~" -> "~0", "/" -> "~1".
QString encodeSegment(const QString& key);
QString decodeSegment(const QString& segment);

// "" -> [], otherwise split on '/' and decode each segment.
QStringList parsePath(const QString& path);
QString formatPath(const QStringList& segments);

// Ids of the proper prefixes of path that exist as blocks, root first.
QStringList ancestorBlockIds(const ChangeNode& root, const QString& path);

} // namespace jdv
