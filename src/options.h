#pragma once
#include "core.h"

class QSettings;

namespace jdv {

enum class DisplayMode : uint8_t { SideBySide, Inline };

const char* outputFormatToString(OutputFormat f);
OutputFormat outputFormatFromString(const QString& s, bool* ok = nullptr);
const char* displayModeToString(DisplayMode m);
DisplayMode displayModeFromString(const QString& s, bool* ok = nullptr);
const char* wordDiffModeToString(WordDiffMode m);
WordDiffMode wordDiffModeFromString(const QString& s, bool* ok = nullptr);

struct DiffOptions {
    OutputFormat      format         = OutputFormat::Json;
    DisplayMode       displayMode    = DisplayMode::SideBySide;
    WordDiffMode      wordDiffMode   = WordDiffMode::Word;
    bool              inlineWordDiff = false;
    QVector<DiffType> filters;                 // empty = show everything
    bool              enableFolding  = true;
    bool              syncFolds      = true;

    AlignOptions   alignOptions() const   { return {wordDiffMode}; }
    UnifiedOptions unifiedOptions() const { return {inlineWordDiff}; }

    // Missing or unreadable keys keep their current value.
    void load(QSettings& s);
    void save(QSettings& s) const;

    // QSettings("JsonDiffView", "JsonDiffView")
    static DiffOptions loadDefault();
    void saveDefault() const;
};

bool operator==(const DiffOptions& a, const DiffOptions& b);
inline bool operator!=(const DiffOptions& a, const DiffOptions& b) { return !(a == b); }

} // namespace jdv
