#include "options.h"
#include <QSettings>
#include <QDebug>

namespace jdv {

namespace {

template<typename E>
struct EnumName { E value; const char* name; };

constexpr EnumName<OutputFormat> kFormatNames[] = {
    {OutputFormat::Json, "json"},
    {OutputFormat::Yaml, "yaml"},
};

constexpr EnumName<DisplayMode> kDisplayNames[] = {
    {DisplayMode::SideBySide, "side-by-side"},
    {DisplayMode::Inline,     "inline"},
};

constexpr EnumName<WordDiffMode> kWordModeNames[] = {
    {WordDiffMode::Word, "word"},
    {WordDiffMode::Char, "char"},
    {WordDiffMode::None, "none"},
};

template<typename E, size_t N>
const char* nameOf(const EnumName<E> (&table)[N], E v) {
    for (const auto& e : table)
        if (e.value == v) return e.name;
    return table[0].name;
}

template<typename E, size_t N>
E valueOf(const EnumName<E> (&table)[N], const QString& s, bool* ok) {
    for (const auto& e : table) {
        if (s == QLatin1String(e.name)) {
            if (ok) *ok = true;
            return e.value;
        }
    }
    if (ok) *ok = false;
    return table[0].value;
}

const char* const kOrg = "JsonDiffView";
const char* const kApp = "JsonDiffView";

} // namespace

const char* outputFormatToString(OutputFormat f) { return nameOf(kFormatNames, f); }
OutputFormat outputFormatFromString(const QString& s, bool* ok) { return valueOf(kFormatNames, s, ok); }
const char* displayModeToString(DisplayMode m) { return nameOf(kDisplayNames, m); }
DisplayMode displayModeFromString(const QString& s, bool* ok) { return valueOf(kDisplayNames, s, ok); }
const char* wordDiffModeToString(WordDiffMode m) { return nameOf(kWordModeNames, m); }
WordDiffMode wordDiffModeFromString(const QString& s, bool* ok) { return valueOf(kWordModeNames, s, ok); }

void DiffOptions::load(QSettings& s) {
    bool ok = false;
    if (s.contains("format")) {
        OutputFormat f = outputFormatFromString(s.value("format").toString(), &ok);
        if (ok) format = f;
        else qWarning() << "Options: unknown format" << s.value("format").toString();
    }
    if (s.contains("displayMode")) {
        DisplayMode m = displayModeFromString(s.value("displayMode").toString(), &ok);
        if (ok) displayMode = m;
        else qWarning() << "Options: unknown display mode" << s.value("displayMode").toString();
    }
    if (s.contains("wordDiffMode")) {
        WordDiffMode m = wordDiffModeFromString(s.value("wordDiffMode").toString(), &ok);
        if (ok) wordDiffMode = m;
        else qWarning() << "Options: unknown word diff mode" << s.value("wordDiffMode").toString();
    }
    inlineWordDiff = s.value("inlineWordDiff", inlineWordDiff).toBool();
    enableFolding  = s.value("enableFolding", enableFolding).toBool();
    syncFolds      = s.value("syncFolds", syncFolds).toBool();

    if (s.contains("filters")) {
        filters.clear();
        for (const QString& name : s.value("filters").toStringList()) {
            if (name.isEmpty()) continue;
            DiffType t = diffTypeFromString(name, &ok);
            if (!ok) {
                qWarning() << "Options: ignoring unknown filter" << name;
                continue;
            }
            if (!filters.contains(t)) filters.append(t);
        }
    }
}

void DiffOptions::save(QSettings& s) const {
    s.setValue("format", outputFormatToString(format));
    s.setValue("displayMode", displayModeToString(displayMode));
    s.setValue("wordDiffMode", wordDiffModeToString(wordDiffMode));
    s.setValue("inlineWordDiff", inlineWordDiff);
    s.setValue("enableFolding", enableFolding);
    s.setValue("syncFolds", syncFolds);
    QStringList names;
    for (DiffType t : filters) names << diffTypeToString(t);
    s.setValue("filters", names);
}

DiffOptions DiffOptions::loadDefault() {
    DiffOptions o;
    QSettings s(kOrg, kApp);
    o.load(s);
    return o;
}

void DiffOptions::saveDefault() const {
    QSettings s(kOrg, kApp);
    save(s);
}

bool operator==(const DiffOptions& a, const DiffOptions& b) {
    return a.format == b.format && a.displayMode == b.displayMode
        && a.wordDiffMode == b.wordDiffMode && a.inlineWordDiff == b.inlineWordDiff
        && a.filters == b.filters && a.enableFolding == b.enableFolding
        && a.syncFolds == b.syncFolds;
}

} // namespace jdv
