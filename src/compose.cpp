#include "core.h"
#include <QDebug>
#include <QRegularExpression>

namespace jdv {

namespace {

int computeFoldLevel(int depth, bool isHead) {
    int level = kFoldLevelBase + depth;
    if (isHead) level |= kFoldLevelHeaderFlag;
    return level;
}

struct FlattenState {
    QVector<DiffLine> lines;

    void collect(const ChangeNode& n, int depth, bool parentHasDiff) {
        int childDepth = depth;
        if (n.hasTokens()) {
            lines.append({&n, depth, n.hasDiff() && !parentHasDiff});
            childDepth = depth + 1;
        }
        // only add/remove fold their descendants into one change
        bool insideChange = parentHasDiff || (n.hasDiff() && n.subsumesChildren());
        for (const auto& child : n.children)
            collect(child, childDepth, insideChange);
    }
};

// Row-by-row builder shared by the aligned and unified generators.
struct RowState {
    QVector<LineMapping>      lineMap;
    QHash<QString, LineRange> blockLineRanges;
    QVector<int>              depths;   // per row, fold levels derived at the end

    int row() const { return lineMap.size(); }

    void trackBlock(const QString& blockId, int row0) {
        if (blockId.isEmpty()) return;
        const int lineNum = row0 + 1;
        auto it = blockLineRanges.find(blockId);
        if (it == blockLineRanges.end())
            blockLineRanges.insert(blockId, {lineNum, lineNum});
        else
            it->end = lineNum;

        QString parentId = blockId;
        for (;;) {
            int slash = parentId.lastIndexOf(QLatin1Char('/'));
            if (slash <= 0) break;
            parentId.truncate(slash);
            auto pit = blockLineRanges.find(parentId);
            if (pit == blockLineRanges.end()) {
                blockLineRanges.insert(parentId, {lineNum, lineNum});
            } else {
                if (lineNum > pit->end)   pit->end = lineNum;
                if (lineNum < pit->start) pit->start = lineNum;
            }
        }
    }

    LineMapping& push(const DiffLine* dl, LineType type, bool before, bool after, int depth) {
        const int r = row();
        LineMapping lm;
        lm.beforeLine = before ? r + 1 : 0;
        lm.afterLine  = after  ? r + 1 : 0;
        lm.type = type;
        if (dl) {
            lm.blockId      = dl->node->id;
            lm.hasDiffType  = dl->node->hasDiff();
            lm.diffType     = dl->node->diff.type;
            lm.isChangeRoot = dl->isChangeRoot;
            trackBlock(lm.blockId, r);
        }
        lineMap.append(lm);
        depths.append(depth);
        return lineMap.last();
    }

    QVector<int> foldLevels() const {
        QVector<int> levels(depths.size());
        for (int i = 0; i < depths.size(); i++) {
            bool head = i + 1 < depths.size() && depths[i + 1] > depths[i];
            levels[i] = computeFoldLevel(depths[i], head);
        }
        return levels;
    }
};

QString spacerText(const QString& mirrored) {
    return mirrored.isEmpty() ? kSpacerLine : mirrored;
}

} // namespace

QVector<DiffLine> flattenTree(const ChangeNode& root) {
    FlattenState st;
    st.collect(root, 0, false);
    return st.lines;
}

QString renderSide(const ChangeNode& line, Side side, int extraIndent) {
    static const QRegularExpression kLineBreaks(QStringLiteral("[\\r\\n]+"));
    QString out(qMax(0, line.indent) + extraIndent, QLatin1Char(' '));
    for (const auto& t : line.tokens) {
        if (!tokenVisibleOn(t, side)) continue;
        if (t.text.contains(QLatin1Char('\n')) || t.text.contains(QLatin1Char('\r'))) {
            QString s = t.text;
            s.replace(kLineBreaks, QStringLiteral(" "));
            out += s;
        } else {
            out += t.text;
        }
    }
    return out;
}

AlignmentResult composeAligned(const ChangeNode& root, OutputFormat format,
                               const AlignOptions& opts) {
    const QVector<DiffLine> diffLines = flattenTree(root);
    const bool json = format == OutputFormat::Json;
    const int extraIndent = json ? 2 : 0;
    const int depthShift  = json ? 1 : 0;

    AlignmentResult r;
    RowState rows;

    if (json) {
        r.beforeLines << QStringLiteral("{");
        r.afterLines  << QStringLiteral("{");
        rows.push(nullptr, LineType::Unchanged, true, true, 0);
    }

    for (const DiffLine& dl : diffLines) {
        const ChangeNode& n = *dl.node;
        const DiffAction action = n.diff.action;
        const int depth = dl.depth + depthShift;
        const QString beforeText = renderSide(n, Side::Before, extraIndent);
        const QString afterText  = renderSide(n, Side::After, extraIndent);

        // Without word diff a modification is shown as a removed/added pair so
        // both rows carry identical text on each side.
        if (opts.wordDiffMode == WordDiffMode::None
            && (action == DiffAction::Replace || action == DiffAction::Rename)) {
            const QString pairId = n.id.isEmpty()
                ? QStringLiteral("pair-%1").arg(rows.row()) : n.id;

            r.afterSpacerRows.insert(rows.row());
            r.beforeLines << beforeText;
            r.afterLines  << spacerText(beforeText);
            rows.push(&dl, LineType::Removed, true, false, depth).pairId = pairId;

            r.beforeSpacerRows.insert(rows.row());
            r.beforeLines << spacerText(afterText);
            r.afterLines  << afterText;
            rows.push(&dl, LineType::Added, false, true, depth).pairId = pairId;
            continue;
        }

        const bool onBefore = action != DiffAction::Add;
        const bool onAfter  = action != DiffAction::Remove;

        if (!onBefore) r.beforeSpacerRows.insert(rows.row());
        if (!onAfter)  r.afterSpacerRows.insert(rows.row());
        r.beforeLines << (onBefore ? beforeText : spacerText(afterText));
        r.afterLines  << (onAfter  ? afterText  : spacerText(beforeText));
        rows.push(&dl, lineTypeForAction(action), onBefore, onAfter, depth);
    }

    if (json) {
        r.beforeLines << QStringLiteral("}");
        r.afterLines  << QStringLiteral("}");
        rows.push(nullptr, LineType::Unchanged, true, true, 0);
    }

    r.lineMap         = rows.lineMap;
    r.blockLineRanges = rows.blockLineRanges;
    r.foldLevels      = rows.foldLevels();
    checkAlignment(r);
    return r;
}

UnifiedResult composeUnified(const ChangeNode& root, OutputFormat format,
                             const UnifiedOptions& opts) {
    const QVector<DiffLine> diffLines = flattenTree(root);
    const bool json = format == OutputFormat::Json;
    const int extraIndent = json ? 2 : 0;
    const int depthShift  = json ? 1 : 0;

    UnifiedResult r;
    RowState rows;

    if (json) {
        r.lines << QStringLiteral("{");
        rows.push(nullptr, LineType::Unchanged, true, true, 0);
    }

    for (const DiffLine& dl : diffLines) {
        const ChangeNode& n = *dl.node;
        const int depth = dl.depth + depthShift;
        const QString beforeText = renderSide(n, Side::Before, extraIndent);
        const QString afterText  = renderSide(n, Side::After, extraIndent);

        switch (n.diff.action) {
        case DiffAction::Remove:
            r.lines << beforeText;
            rows.push(&dl, LineType::Removed, true, false, depth);
            break;
        case DiffAction::Add:
            r.lines << afterText;
            rows.push(&dl, LineType::Added, false, true, depth);
            break;
        case DiffAction::Replace:
        case DiffAction::Rename:
            if (opts.inlineWordDiff) {
                r.beforeContentMap.insert(rows.row(), beforeText);
                r.lines << afterText;
                rows.push(&dl, LineType::Modified, true, true, depth);
            } else {
                r.lines << beforeText;
                rows.push(&dl, LineType::Removed, true, false, depth);
                r.lines << afterText;
                rows.push(&dl, LineType::Added, false, true, depth);
            }
            break;
        case DiffAction::None:
            r.lines << afterText;
            rows.push(&dl, LineType::Unchanged, true, true, depth);
            break;
        }
    }

    if (json) {
        r.lines << QStringLiteral("}");
        rows.push(nullptr, LineType::Unchanged, true, true, 0);
    }

    r.lineMap         = rows.lineMap;
    r.blockLineRanges = rows.blockLineRanges;
    r.foldLevels      = rows.foldLevels();
    return r;
}

bool checkAlignment(const AlignmentResult& r) {
    bool ok = true;
    if (r.beforeLines.size() != r.afterLines.size()
        || r.beforeLines.size() != r.lineMap.size()) {
        qWarning() << "Alignment: length mismatch before" << r.beforeLines.size()
                   << "after" << r.afterLines.size() << "lineMap" << r.lineMap.size();
        ok = false;
    }

    int orphanRows = 0;
    for (const auto& lm : r.lineMap)
        if (!lm.hasBefore() && !lm.hasAfter()) orphanRows++;
    if (orphanRows > 0) {
        qWarning() << "Alignment:" << orphanRows << "rows have neither side";
        ok = false;
    }

    auto countNewlines = [](const QStringList& lines) {
        int c = 0;
        for (const auto& l : lines)
            if (l.contains(QLatin1Char('\n'))) c++;
        return c;
    };
    const int beforeNl = countNewlines(r.beforeLines);
    const int afterNl  = countNewlines(r.afterLines);
    if (beforeNl > 0 || afterNl > 0) {
        qWarning() << "Alignment: embedded newlines before" << beforeNl << "after" << afterNl;
        ok = false;
    }
    return ok;
}

} // namespace jdv
