#pragma once
#include "core.h"

namespace jdv {

struct WordDiffResult {
    QVector<WordDiffRange> beforeRanges;   // type Removed
    QVector<WordDiffRange> afterRanges;    // type Added
};

// Ranges for one editor row. row is 1-based.
struct LineWordDiff {
    int                    row = 0;
    QVector<WordDiffRange> ranges;
};

// Split into words (letters, digits, '_'), whitespace runs and single
// punctuation characters. Concatenating the tokens yields s.
QStringList tokenizeWords(const QString& s);

// Intra-line diff. In Word mode the common leading run of spaces is excluded
// so an indent never belongs to a changed token. Mode None behaves as Word.
WordDiffResult computeWordDiff(const QString& before, const QString& after,
                               WordDiffMode mode = WordDiffMode::Word);

// Per-row ranges of one side for modified rows and removed/added pairs that
// share a pairId. fromRow/toRow are 1-based and inclusive; 0 means unbounded.
QVector<LineWordDiff> buildWordDiffData(const QVector<LineMapping>& lineMap,
                                        const QStringList& beforeLines,
                                        const QStringList& afterLines,
                                        Side side,
                                        WordDiffMode mode = WordDiffMode::Word,
                                        int fromRow = 0, int toRow = 0);

// Unified view: added ranges of each modified row against its stored before text.
QVector<LineWordDiff> buildInlineWordDiffData(const QStringList& lines,
                                              const QVector<LineMapping>& lineMap,
                                              const QHash<int, QString>& beforeContentMap,
                                              WordDiffMode mode = WordDiffMode::Word);

} // namespace jdv
