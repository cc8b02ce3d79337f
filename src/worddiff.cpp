#include "worddiff.h"
#include "diff.h"

namespace jdv {

namespace {

enum class CharClass { Word, Space, Punct };

CharClass classify(QChar c) {
    if (c.isLetterOrNumber() || c == QLatin1Char('_')) return CharClass::Word;
    if (c.isSpace()) return CharClass::Space;
    return CharClass::Punct;
}

int commonIndentLength(const QString& a, const QString& b) {
    const int len = qMin(a.size(), b.size());
    int i = 0;
    while (i < len && a[i] == QLatin1Char(' ') && b[i] == QLatin1Char(' '))
        i++;
    return i;
}

// One token per code point, a surrogate pair stays together.
QStringList tokenizeChars(const QString& s) {
    QStringList out;
    out.reserve(s.size());
    int i = 0;
    while (i < s.size()) {
        const int len = s[i].isHighSurrogate() && i + 1 < s.size()
                        && s[i + 1].isLowSurrogate() ? 2 : 1;
        out.append(s.mid(i, len));
        i += len;
    }
    return out;
}

QString lineAt(const QStringList& lines, int i) {
    return i >= 0 && i < lines.size() ? lines[i] : QString();
}

struct PairRows {
    int removedIdx = -1;
    int addedIdx   = -1;
};

} // namespace

QStringList tokenizeWords(const QString& s) {
    QStringList out;
    int i = 0;
    while (i < s.size()) {
        CharClass cls = classify(s[i]);
        int j = i + 1;
        if (cls != CharClass::Punct)
            while (j < s.size() && classify(s[j]) == cls) j++;
        out.append(s.mid(i, j - i));
        i = j;
    }
    return out;
}

WordDiffResult computeWordDiff(const QString& before, const QString& after,
                               WordDiffMode mode) {
    WordDiffResult r;
    if (before == after) return r;

    const bool charMode = mode == WordDiffMode::Char;
    const int skip = charMode ? 0 : commonIndentLength(before, after);
    const QString b = before.mid(skip);
    const QString a = after.mid(skip);

    const QStringList bt = charMode ? tokenizeChars(b) : tokenizeWords(b);
    const QStringList at = charMode ? tokenizeChars(a) : tokenizeWords(a);

    int bi = 0, ai = 0;                // token cursors
    int bOff = skip, aOff = skip;      // character offsets
    forEachDiff(bt.constData(), bt.size(), at.constData(), at.size(),
                [&](DiffOp op, int len) {
        int chars = 0;
        switch (op) {
        case DiffOp::Keep:
            for (int k = 0; k < len; k++) bOff += bt[bi + k].size();
            for (int k = 0; k < len; k++) aOff += at[ai + k].size();
            bi += len;
            ai += len;
            break;
        case DiffOp::Remove:
            for (int k = 0; k < len; k++) chars += bt[bi + k].size();
            r.beforeRanges.append({bOff, bOff + chars, RangeKind::Removed});
            bOff += chars;
            bi += len;
            break;
        case DiffOp::Add:
            for (int k = 0; k < len; k++) chars += at[ai + k].size();
            r.afterRanges.append({aOff, aOff + chars, RangeKind::Added});
            aOff += chars;
            ai += len;
            break;
        }
    });
    return r;
}

QVector<LineWordDiff> buildWordDiffData(const QVector<LineMapping>& lineMap,
                                        const QStringList& beforeLines,
                                        const QStringList& afterLines,
                                        Side side, WordDiffMode mode,
                                        int fromRow, int toRow) {
    QVector<LineWordDiff> result;

    QHash<QString, PairRows> pairs;
    for (int i = 0; i < lineMap.size(); i++) {
        const LineMapping& m = lineMap[i];
        if (m.pairId.isEmpty()) continue;
        PairRows& p = pairs[m.pairId];
        if (m.type == LineType::Removed)    p.removedIdx = i;
        else if (m.type == LineType::Added) p.addedIdx = i;
    }

    const int start = fromRow > 0 ? fromRow - 1 : 0;
    const int end   = toRow > 0 ? qMin(lineMap.size(), toRow) : lineMap.size();

    for (int i = start; i < end; i++) {
        const LineMapping& m = lineMap[i];
        QString before, after;

        if (m.type == LineType::Modified) {
            before = lineAt(beforeLines, i);
            after  = lineAt(afterLines, i);
        } else if (!m.pairId.isEmpty()) {
            // removed rows carry the before side, added rows the after side
            const bool wanted = side == Side::Before ? m.type == LineType::Removed
                                                     : m.type == LineType::Added;
            if (!wanted) continue;
            const PairRows p = pairs.value(m.pairId);
            if (p.removedIdx < 0 || p.addedIdx < 0) continue;
            before = lineAt(beforeLines, p.removedIdx);
            after  = lineAt(afterLines, p.addedIdx);
        } else {
            continue;
        }

        if (before.isEmpty() || after.isEmpty() || before == after) continue;

        WordDiffResult wd = computeWordDiff(before, after, mode);
        const auto& ranges = side == Side::Before ? wd.beforeRanges : wd.afterRanges;
        if (!ranges.isEmpty())
            result.append({i + 1, ranges});
    }
    return result;
}

QVector<LineWordDiff> buildInlineWordDiffData(const QStringList& lines,
                                              const QVector<LineMapping>& lineMap,
                                              const QHash<int, QString>& beforeContentMap,
                                              WordDiffMode mode) {
    QVector<LineWordDiff> result;
    for (int i = 0; i < lineMap.size(); i++) {
        if (lineMap[i].type != LineType::Modified) continue;
        auto it = beforeContentMap.constFind(i);
        if (it == beforeContentMap.constEnd()) continue;

        const QString after = lineAt(lines, i);
        if (*it == after) continue;

        WordDiffResult wd = computeWordDiff(*it, after, mode);
        if (!wd.afterRanges.isEmpty())
            result.append({i + 1, wd.afterRanges});
    }
    return result;
}

} // namespace jdv
