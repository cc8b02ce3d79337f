#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QSet>
#include <QJsonObject>
#include <QJsonArray>
#include <array>
#include <cstdint>
#include <vector>

namespace jdv {

// ── Change action / classification ──

enum class DiffAction : uint8_t {
    None, Add, Remove, Replace, Rename
};

enum class DiffType : uint8_t {
    Breaking, NonBreaking, Annotation, Unclassified
};

inline constexpr int kDiffTypeCount = 4;

struct DiffTypeMeta {
    DiffType    type;
    const char* name;    // wire name: "non-breaking"
    const char* label;   // display label: "Non-breaking"
};

inline constexpr DiffTypeMeta kDiffTypeMeta[] = {
    {DiffType::Breaking,     "breaking",     "Breaking"},
    {DiffType::NonBreaking,  "non-breaking", "Non-breaking"},
    {DiffType::Annotation,   "annotation",   "Annotation"},
    {DiffType::Unclassified, "unclassified", "Unclassified"},
};

struct DiffActionMeta {
    DiffAction  action;
    const char* name;
};

inline constexpr DiffActionMeta kDiffActionMeta[] = {
    {DiffAction::Add,     "add"},
    {DiffAction::Remove,  "remove"},
    {DiffAction::Replace, "replace"},
    {DiffAction::Rename,  "rename"},
};

inline const char* diffTypeToString(DiffType t) {
    for (const auto& m : kDiffTypeMeta)
        if (m.type == t) return m.name;
    return "unclassified";
}

// Unknown names fall back to Unclassified (ok = false).
inline DiffType diffTypeFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kDiffTypeMeta) {
        if (s == QLatin1String(m.name)) {
            if (ok) *ok = true;
            return m.type;
        }
    }
    if (ok) *ok = false;
    return DiffType::Unclassified;
}

inline const char* diffActionToString(DiffAction a) {
    for (const auto& m : kDiffActionMeta)
        if (m.action == a) return m.name;
    return "";
}

// Unknown names fall back to None, i.e. the line renders as unchanged.
inline DiffAction diffActionFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kDiffActionMeta) {
        if (s == QLatin1String(m.name)) {
            if (ok) *ok = true;
            return m.action;
        }
    }
    if (ok) *ok = false;
    return DiffAction::None;
}

inline constexpr int diffTypeIndex(DiffType t) { return static_cast<int>(t); }

// ── Aggregate counts: [total, breaking, nonBreaking, annotation, unclassified] ──

using ChangeCounts = std::array<int, 1 + kDiffTypeCount>;

inline int countOf(const ChangeCounts& c, DiffType t) { return c[1 + diffTypeIndex(t)]; }

inline bool countsBalanced(const ChangeCounts& c) {
    return c[0] == c[1] + c[2] + c[3] + c[4];
}

// ── Tokens ──

enum class Side : uint8_t { Before, After };

// Closed set of display conditions attached to a token.
// Before/After restrict the token to one pane, Collapsed tokens only belong
// to fold placeholders, Always/Expanded render everywhere.
enum class DisplayCondition : uint8_t {
    Always, Before, After, Collapsed, Expanded
};

enum class TokenRole : uint8_t {
    Key, Index, Value, Syntax, ChangeCount
};

struct Token {
    QString          text;
    DisplayCondition cond = DisplayCondition::Always;
    TokenRole        role = TokenRole::Syntax;
};

inline bool tokenVisibleOn(const Token& t, Side side) {
    switch (t.cond) {
    case DisplayCondition::Collapsed: return false;
    case DisplayCondition::Before:    return side == Side::Before;
    case DisplayCondition::After:     return side == Side::After;
    case DisplayCondition::Always:
    case DisplayCondition::Expanded:  return true;
    }
    return true;
}

// ── ChangeNode ──

struct DiffMeta {
    DiffAction action = DiffAction::None;
    DiffType   type   = DiffType::Unclassified;
    QString    replacedValue;   // null when the engine reported none
};

struct ChangeNode {
    QString               id;            // encoded path, empty for non-addressable rows
    int                   lineIndex = 0; // 1-based, 0 = no own line
    int                   indent    = 0; // in spaces
    QVector<Token>        tokens;
    std::vector<ChangeNode> children;
    DiffMeta              diff;
    ChangeCounts          counts{};

    bool hasDiff()   const { return diff.action != DiffAction::None; }
    bool hasTokens() const { return !tokens.isEmpty(); }
    bool isContainer() const { return !children.empty(); }

    // add/remove make the whole subtree one logical change
    bool subsumesChildren() const {
        return diff.action == DiffAction::Add || diff.action == DiffAction::Remove;
    }

    QJsonObject toJson() const;
    static ChangeNode fromJson(const QJsonObject& o);
};

// Recompute counts bottom-up so every node satisfies the aggregation rule.
void recomputeCounts(ChangeNode& node);

// Check the aggregation rule over the whole subtree; violations are logged.
bool verifyCounts(const ChangeNode& node);

// Number token-bearing nodes 1..N in preorder. Returns N.
int assignLineIndices(ChangeNode& root);

// Depth-first search by block id. Returns nullptr when absent.
const ChangeNode* findNode(const ChangeNode& root, const QString& id);

// ── Line mapping ──

enum class LineType : uint8_t {
    Unchanged, Added, Removed, Modified
};

inline const char* lineTypeToString(LineType t) {
    switch (t) {
    case LineType::Unchanged: return "unchanged";
    case LineType::Added:     return "added";
    case LineType::Removed:   return "removed";
    case LineType::Modified:  return "modified";
    }
    return "unchanged";
}

inline LineType lineTypeForAction(DiffAction a) {
    switch (a) {
    case DiffAction::Add:     return LineType::Added;
    case DiffAction::Remove:  return LineType::Removed;
    case DiffAction::Replace:
    case DiffAction::Rename:  return LineType::Modified;
    case DiffAction::None:    break;
    }
    return LineType::Unchanged;
}

struct LineMapping {
    int      beforeLine   = 0;   // 1-based, 0 = spacer on the before side
    int      afterLine    = 0;   // 1-based, 0 = spacer on the after side
    LineType type         = LineType::Unchanged;
    QString  blockId;
    bool     hasDiffType  = false;
    DiffType diffType     = DiffType::Unclassified;
    bool     isChangeRoot = false;
    QString  pairId;             // links split removed/added rows

    bool hasBefore() const { return beforeLine > 0; }
    bool hasAfter()  const { return afterLine > 0; }

    QJsonObject toJson() const;
};

struct LineRange {
    int start = 0;   // 1-based, inclusive
    int end   = 0;   // 1-based, inclusive
};

// ── Word diff ──

enum class RangeKind : uint8_t { Added, Removed };

struct WordDiffRange {
    int       from = 0;   // offset from line start
    int       to   = 0;   // exclusive
    RangeKind type = RangeKind::Added;
};

inline bool operator==(const WordDiffRange& a, const WordDiffRange& b) {
    return a.from == b.from && a.to == b.to && a.type == b.type;
}

enum class WordDiffMode : uint8_t { Word, Char, None };

// ── Composition ──

enum class OutputFormat : uint8_t { Json, Yaml };

// Placeholder for spacer rows with nothing to mirror (four no-break spaces).
inline const QString kSpacerLine = QStringLiteral("\u00A0\u00A0\u00A0\u00A0");

struct DiffLine {
    const ChangeNode* node = nullptr;
    int               depth = 0;          // number of token-bearing ancestors
    bool              isChangeRoot = false;
};

struct AlignOptions {
    WordDiffMode wordDiffMode = WordDiffMode::Word;
};

struct AlignmentResult {
    QStringList             beforeLines;
    QStringList             afterLines;
    QVector<LineMapping>    lineMap;
    QSet<int>               beforeSpacerRows;   // 0-based
    QSet<int>               afterSpacerRows;    // 0-based
    QHash<QString, LineRange> blockLineRanges;
    QVector<int>            foldLevels;         // Scintilla encoded, one per row
};

struct UnifiedOptions {
    bool inlineWordDiff = false;
};

struct UnifiedResult {
    QStringList             lines;
    QVector<LineMapping>    lineMap;
    QHash<int, QString>     beforeContentMap;   // 0-based row -> before text
    QHash<QString, LineRange> blockLineRanges;
    QVector<int>            foldLevels;
};

QVector<DiffLine> flattenTree(const ChangeNode& root);
QString renderSide(const ChangeNode& line, Side side, int extraIndent = 0);
AlignmentResult composeAligned(const ChangeNode& root, OutputFormat format,
                               const AlignOptions& opts = {});
UnifiedResult composeUnified(const ChangeNode& root, OutputFormat format,
                             const UnifiedOptions& opts = {});

// Reports length / spacer / newline violations. Returns false on any.
bool checkAlignment(const AlignmentResult& r);

// Fold level helpers shared with the pane (avoids Scintilla headers in core)
inline constexpr int kFoldLevelBase       = 0x400;
inline constexpr int kFoldLevelHeaderFlag = 0x2000;
inline constexpr int kFoldLevelNumberMask = 0x0FFF;

inline constexpr int foldDepth(int level) {
    return (level & kFoldLevelNumberMask) - kFoldLevelBase;
}
inline constexpr bool isFoldHeader(int level) {
    return (level & kFoldLevelHeaderFlag) != 0;
}

// ── Navigation results ──

struct PathCount {
    DiffType type  = DiffType::Unclassified;
    int      count = 0;
};

struct ChangeSummary {
    int total        = 0;
    int breaking     = 0;
    int nonBreaking  = 0;
    int annotation   = 0;
    int unclassified = 0;
    QHash<QString, QVector<PathCount>> byPath;
};

enum class MatchLocation : uint8_t { Key, Value };
enum class SearchIn : uint8_t { Keys, Values, Both };

struct FindPathsOptions {
    bool     caseSensitive = false;
    SearchIn searchIn      = SearchIn::Both;
    int      limit         = -1;   // -1 = unlimited
};

struct PathSearchResult {
    QString       path;
    QString       matchedText;
    MatchLocation matchLocation = MatchLocation::Key;
    bool          hasDiffType   = false;
    DiffType      diffType      = DiffType::Unclassified;
};

struct ChildKeyInfo {
    QString    key;            // decoded
    QString    path;           // encoded
    bool       hasDirectChange = false;
    DiffType   diffType = DiffType::Unclassified;
    DiffAction action   = DiffAction::None;
    bool       hasChildren = false;
    std::array<int, kDiffTypeCount> changeCounts{};
};

// ── Filter folding ──

struct FoldDelta {
    QStringList toFold;
    QStringList toUnfold;

    bool isEmpty() const { return toFold.isEmpty() && toUnfold.isEmpty(); }
};

// Key under which the merge engine stores per-member change metadata.
inline const QString kMetaKey = QStringLiteral("$diff");

} // namespace jdv
