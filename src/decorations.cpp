#include "decorations.h"

namespace jdv {

bool isSpacerRow(const LineMapping& lm, PaneSide side) {
    switch (side) {
    case PaneSide::Before:  return !lm.hasBefore();
    case PaneSide::After:   return !lm.hasAfter();
    case PaneSide::Unified: return false;
    }
    return false;
}

QVector<int> displayLineNumbers(const QVector<LineMapping>& lineMap, PaneSide side) {
    QVector<int> out(lineMap.size(), 0);
    int next = 1;
    for (int i = 0; i < lineMap.size(); i++) {
        if (!isSpacerRow(lineMap[i], side))
            out[i] = next++;
    }
    return out;
}

bool showsClassMarker(const LineMapping& lm, PaneSide side) {
    if (!lm.hasDiffType || isSpacerRow(lm, side)) return false;
    switch (side) {
    case PaneSide::Before:
        return lm.type == LineType::Removed || lm.type == LineType::Modified;
    case PaneSide::After:
        return lm.type == LineType::Added || lm.type == LineType::Modified;
    case PaneSide::Unified:
        return true;
    }
    return false;
}

FoldPlaceholder foldPlaceholderCounts(const QVector<LineMapping>& lineMap,
                                      int fromLine, int toLine, PaneSide side) {
    FoldPlaceholder p;
    if (fromLine < 1 || fromLine > lineMap.size()) return p;
    if (isSpacerRow(lineMap[fromLine - 1], side)) {
        p.isSpacer = true;
        return p;
    }
    const int last = qMin(toLine, (int)lineMap.size());
    for (int line = fromLine; line <= last; line++) {
        const LineMapping& lm = lineMap[line - 1];
        if (!lm.hasDiffType || !lm.isChangeRoot) continue;
        p.counts[0]++;
        p.counts[1 + diffTypeIndex(lm.diffType)]++;
    }
    return p;
}

QString countsText(const ChangeCounts& counts) {
    QStringList parts;
    for (const auto& m : kDiffTypeMeta) {
        const int n = countOf(counts, m.type);
        if (n > 0)
            parts << QStringLiteral("%1 %2").arg(n).arg(QLatin1String(m.name));
    }
    return parts.join(QStringLiteral(", "));
}

QString foldPlaceholderText(const FoldPlaceholder& p) {
    if (p.isSpacer) return {};
    QString text = QStringLiteral("\u2026");
    const QString counts = countsText(p.counts);
    if (!counts.isEmpty())
        text += QLatin1Char(' ') + counts;
    return text;
}

QVector<ChangeBadge> changeBadges(const BlockTreeIndex& index,
                                  const QHash<QString, LineRange>& blockLineRanges) {
    QVector<ChangeBadge> out;
    for (const auto& id : index.containerIds) {
        const BlockEntry* e = index.entry(id);
        if (!e || !e->node) continue;
        const ChangeCounts& c = e->node->counts;
        if (c[1] + c[2] + c[3] + c[4] <= 0) continue;
        auto it = blockLineRanges.constFind(id);
        if (it == blockLineRanges.constEnd() || it->start < 1) continue;
        out.append({id, it->start, c});
    }
    return out;
}

} // namespace jdv
