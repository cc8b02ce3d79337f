#pragma once
#include "blockindex.h"

namespace jdv {

// Editor a decoration is computed for. Unified panes have no spacer rows.
enum class PaneSide : uint8_t { Before, After, Unified };

inline PaneSide paneSideOf(Side s) {
    return s == Side::Before ? PaneSide::Before : PaneSide::After;
}

// Row has no content on this side.
bool isSpacerRow(const LineMapping& lm, PaneSide side);

// ── Line numbers ──

// Margin numbers per row: rows with content on this side count up from 1,
// spacer rows get 0.
QVector<int> displayLineNumbers(const QVector<LineMapping>& lineMap, PaneSide side);

// ── Classification markers ──

// Whether row carries a classification marker on this side. The before pane
// marks removed and modified rows, the after pane added and modified rows.
bool showsClassMarker(const LineMapping& lm, PaneSide side);

// ── Fold placeholders ──

struct FoldPlaceholder {
    ChangeCounts counts{};          // change roots inside the range, by type
    bool         isSpacer = false;  // header row is a spacer, draw nothing
};

// Counts change roots in rows fromLine..toLine (1-based, inclusive). Rows of
// both sides count, so the two panes show the same numbers for one block.
FoldPlaceholder foldPlaceholderCounts(const QVector<LineMapping>& lineMap,
                                      int fromLine, int toLine, PaneSide side);

// "2 breaking, 1 annotation"; empty when nothing changed.
QString countsText(const ChangeCounts& counts);

// "…" followed by the counts. Empty for a spacer header.
QString foldPlaceholderText(const FoldPlaceholder& p);

// ── Change badges ──

struct ChangeBadge {
    QString      blockId;
    int          line = 0;   // 1-based header row
    ChangeCounts counts{};
};

// One badge per container with changes below it, document order.
QVector<ChangeBadge> changeBadges(const BlockTreeIndex& index,
                                  const QHash<QString, LineRange>& blockLineRanges);

} // namespace jdv
