#include "diffpane.h"
#include <QDebug>
#include <Qsci/qsciscintilla.h>
#include <Qsci/qsciscintillabase.h>
#include <Qsci/qscilexerjson.h>
#include <Qsci/qscilexeryaml.h>
#include <QVBoxLayout>
#include <QFont>
#include <QColor>

namespace jdv {

// ── Theme constants ──
static const QColor kBgText("#1e1e1e");
static const QColor kBgMargin("#252526");
static const QColor kFgMargin("#858585");

static constexpr int kNumberMargin = 0;
static constexpr int kClassMargin  = 1;
static constexpr int kFoldMargin   = 2;

// Extended styles for margin and annotation text
static constexpr int MSTYLE_NUMBER = 0;
static constexpr int MSTYLE_TYPE   = 1;   // + diffTypeIndex(type)
static constexpr int kStyleCount   = MSTYLE_TYPE + kDiffTypeCount;

static const QColor kTypeColors[kDiffTypeCount] = {
    QColor("#f85149"),   // breaking
    QColor("#3fb950"),   // non-breaking
    QColor("#d29922"),   // annotation
    QColor("#8b949e"),   // unclassified
};

static QFont editorFont() {
    QFont f("JetBrains Mono", 11);
    f.setFixedPitch(true);
    return f;
}

// ── SciFoldPane ──

SciFoldPane::SciFoldPane(QsciScintilla* sci, QObject* parent)
    : FoldPane(parent), m_sci(sci) {}

int SciFoldPane::lineCount() const {
    return (int)m_sci->SendScintilla(QsciScintillaBase::SCI_GETLINECOUNT);
}

QVector<FoldRange> SciFoldPane::foldedRanges() const {
    QVector<FoldRange> out;
    const int n = lineCount();
    for (int line = 1; line <= n; line++) {
        if (!isFolded(line)) continue;
        long last = m_sci->SendScintilla(QsciScintillaBase::SCI_GETLASTCHILD,
                                         (unsigned long)(line - 1), (long)-1);
        long from = m_sci->SendScintilla(QsciScintillaBase::SCI_GETLINEENDPOSITION,
                                         (unsigned long)(line - 1));
        long to   = m_sci->SendScintilla(QsciScintillaBase::SCI_GETLINEENDPOSITION,
                                         (unsigned long)last);
        out.append({(int)from, (int)to});
    }
    return out;
}

int SciFoldPane::lineAt(int pos) const {
    return (int)m_sci->SendScintilla(QsciScintillaBase::SCI_LINEFROMPOSITION,
                                     (unsigned long)pos) + 1;
}

bool SciFoldPane::isFoldable(int line) const {
    if (line < 1 || line > lineCount()) return false;
    long level = m_sci->SendScintilla(QsciScintillaBase::SCI_GETFOLDLEVEL,
                                      (unsigned long)(line - 1));
    return isFoldHeader((int)level);
}

bool SciFoldPane::isFolded(int line) const {
    if (!isFoldable(line)) return false;
    return !m_sci->SendScintilla(QsciScintillaBase::SCI_GETFOLDEXPANDED,
                                 (unsigned long)(line - 1));
}

bool SciFoldPane::foldLine(int line) {
    if (!isFoldable(line) || isFolded(line)) return false;
    m_sci->SendScintilla(QsciScintillaBase::SCI_TOGGLEFOLD, (unsigned long)(line - 1));
    emit foldsChanged();
    return true;
}

bool SciFoldPane::unfoldLine(int line) {
    if (!isFolded(line)) return false;
    m_sci->SendScintilla(QsciScintillaBase::SCI_TOGGLEFOLD, (unsigned long)(line - 1));
    emit foldsChanged();
    return true;
}

// ── DiffPane ──

DiffPane::DiffPane(QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_sci = new QsciScintilla(this);
    layout->addWidget(m_sci);

    setupScintilla();
    setFormat(OutputFormat::Json);
    setupFolding();
    setupMarkers();
    setupIndicators();
    allocateStyles();

    m_foldPane = new SciFoldPane(m_sci, this);

    // QsciScintilla toggles the fold in its own margin handler, which runs first
    connect(m_sci, &QsciScintillaBase::SCN_MARGINCLICK,
            this, [this](int /*pos*/, int /*mods*/, int margin) {
        if (margin == kFoldMargin)
            m_foldPane->notifyFoldsChanged();
    });

    connect(m_sci, &QsciScintilla::cursorPositionChanged,
            this, [this](int line, int /*col*/) {
        const LineMapping* lm = mappingForLine(line + 1);
        if (lm && !lm->blockId.isEmpty())
            emit blockClicked(lm->blockId, line + 1);
    });
}

DiffPane::~DiffPane() {
}

void DiffPane::setupScintilla() {
    m_sci->setFont(editorFont());
    m_sci->setReadOnly(true);
    m_sci->setWrapMode(QsciScintilla::WrapNone);
    m_sci->setCaretLineVisible(false);
    m_sci->setUtf8(true);

    // Margin 0: per-side line numbers, blank on spacer rows
    m_sci->setMarginType(kNumberMargin, QsciScintilla::TextMarginRightJustified);
    m_sci->setMarginWidth(kNumberMargin, " 00000");
    m_sci->setMarginMarkerMask(kNumberMargin, 0);
    m_sci->setMarginsBackgroundColor(kBgMargin);
    m_sci->setMarginsForegroundColor(kFgMargin);
    m_sci->setMarginsFont(editorFont());

    // Margin 1: classification symbols. Row backgrounds stay out of every
    // margin mask so Scintilla paints them in the text area.
    m_sci->setMarginType(kClassMargin, QsciScintilla::SymbolMargin);
    m_sci->setMarginWidth(kClassMargin, 14);
    m_sci->setMarginMarkerMask(kClassMargin,
        (1 << M_BREAKING) | (1 << M_NON_BREAKING) | (1 << M_ANNOTATION) | (1 << M_UNCLASSIFIED));

    m_sci->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONSETVISIBLE,
                         (unsigned long)1 /*ANNOTATION_STANDARD*/);
}

void DiffPane::allocateStyles() {
    long base = m_sci->SendScintilla(QsciScintillaBase::SCI_ALLOCATEEXTENDEDSTYLES,
                                     (long)kStyleCount);
    m_styleBase = (int)base;
    m_sci->SendScintilla(QsciScintillaBase::SCI_MARGINSETSTYLEOFFSET, base);
    m_sci->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONSETSTYLEOFFSET, base);

    QByteArray fontName = editorFont().family().toUtf8();
    int fontSize = editorFont().pointSize();
    for (int s = 0; s < kStyleCount; s++) {
        unsigned long abs = (unsigned long)(base + s);
        QColor fore = s == MSTYLE_NUMBER ? kFgMargin : kTypeColors[s - MSTYLE_TYPE];
        m_sci->SendScintilla(QsciScintillaBase::SCI_STYLESETFORE, abs, fore);
        m_sci->SendScintilla(QsciScintillaBase::SCI_STYLESETBACK, abs,
                             s == MSTYLE_NUMBER ? kBgMargin : kBgText);
        m_sci->SendScintilla(QsciScintillaBase::SCI_STYLESETFONT,
                             (uintptr_t)abs, fontName.constData());
        m_sci->SendScintilla(QsciScintillaBase::SCI_STYLESETSIZE, abs, (long)fontSize);
    }
}

void DiffPane::setFormat(OutputFormat format) {
    m_format = format;
    QsciLexer* lexer = nullptr;
    if (format == OutputFormat::Json)
        lexer = new QsciLexerJSON(m_sci);
    else
        lexer = new QsciLexerYAML(m_sci);

    QFont font = editorFont();
    for (int i = 0; i <= 127; i++) {
        lexer->setPaper(kBgText, i);
        lexer->setFont(font, i);
    }
    lexer->setDefaultColor(QColor("#d4d4d4"));

    m_sci->setLexer(lexer);
    delete m_lexer;
    m_lexer = lexer;

    // Fold levels come from the composer, the lexer must not recompute them
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETPROPERTY,
                         (const char*)"fold", (const char*)"0");
}

void DiffPane::setupFolding() {
    m_sci->setFolding(QsciScintilla::BoxedTreeFoldStyle, kFoldMargin);
    m_sci->setFoldMarginColors(kBgMargin, kBgMargin);
    m_sci->SendScintilla(QsciScintillaBase::SCI_FOLDDISPLAYTEXTSETSTYLE,
                         (unsigned long)2 /*SC_FOLDDISPLAYTEXT_BOXED*/);

    // Disable lexer-driven folding, levels are set per row in setContent
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETPROPERTY,
                         (const char*)"fold", (const char*)"0");
}

void DiffPane::setFoldingEnabled(bool on) {
    if (on) {
        setupFolding();
        return;
    }
    m_sci->setFolding(QsciScintilla::NoFoldStyle, kFoldMargin);
    // expand everything, a hidden margin leaves no way to unfold
    const int n = m_foldPane->lineCount();
    for (int line = 1; line <= n; line++)
        m_foldPane->unfoldLine(line);
}

void DiffPane::setupMarkers() {
    m_sci->markerDefine(QsciScintilla::Background, M_ADDED);
    m_sci->setMarkerBackgroundColor(QColor("#1e3a29"), M_ADDED);

    m_sci->markerDefine(QsciScintilla::Background, M_REMOVED);
    m_sci->setMarkerBackgroundColor(QColor("#4b1f22"), M_REMOVED);

    m_sci->markerDefine(QsciScintilla::Background, M_MODIFIED);
    m_sci->setMarkerBackgroundColor(QColor("#3a3520"), M_MODIFIED);

    m_sci->markerDefine(QsciScintilla::Background, M_SPACER);
    m_sci->setMarkerBackgroundColor(QColor("#252526"), M_SPACER);

    for (int t = 0; t < kDiffTypeCount; t++) {
        m_sci->markerDefine(QsciScintilla::Circle, M_BREAKING + t);
        m_sci->setMarkerForegroundColor(kTypeColors[t], M_BREAKING + t);
        m_sci->setMarkerBackgroundColor(kTypeColors[t], M_BREAKING + t);
    }
}

void DiffPane::setupIndicators() {
    // Spacer text keeps the row height but is painted in the row color
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETSTYLE,
                         IND_SPACER, 17 /*INDIC_TEXTFORE*/);
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETFORE,
                         IND_SPACER, QColor("#252526"));

    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETSTYLE,
                         IND_WORD_ADDED, 16 /*INDIC_FULLBOX*/);
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETFORE,
                         IND_WORD_ADDED, QColor("#2ea043"));
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETALPHA,
                         IND_WORD_ADDED, (long)100);
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETUNDER,
                         IND_WORD_ADDED, (long)1);

    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETSTYLE,
                         IND_WORD_REMOVED, 16 /*INDIC_FULLBOX*/);
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETFORE,
                         IND_WORD_REMOVED, QColor("#f85149"));
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETALPHA,
                         IND_WORD_REMOVED, (long)100);
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICSETUNDER,
                         IND_WORD_REMOVED, (long)1);
}

void DiffPane::setContent(const QStringList& lines, const QVector<LineMapping>& lineMap,
                          const QVector<int>& foldLevels, const QSet<int>& spacerRows) {
    if (lines.size() != lineMap.size())
        qWarning() << "DiffPane: lines" << lines.size() << "vs lineMap" << lineMap.size();

    m_lines = lines;
    m_lineMap = lineMap;

    m_sci->setReadOnly(false);
    m_sci->setText(lines.join(QLatin1Char('\n')));
    m_sci->setReadOnly(true);

    applyMarkers(spacerRows);
    applyClassMarkers();
    applyLineNumbers();
    applyFoldLevels(foldLevels);
    applyFoldTexts();
    applySpacers(spacerRows);
    m_sci->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONCLEARALL);
    m_badgeTexts.clear();
    clearIndicator(IND_WORD_ADDED);
    clearIndicator(IND_WORD_REMOVED);
}

void DiffPane::clearContent() {
    setContent({}, {}, {});
}

void DiffPane::applyMarkers(const QSet<int>& spacerRows) {
    for (int m = M_ADDED; m <= M_SPACER; m++)
        m_sci->markerDeleteAll(m);

    for (int i = 0; i < m_lineMap.size(); i++) {
        if (spacerRows.contains(i)) {
            m_sci->markerAdd(i, M_SPACER);
            continue;
        }
        switch (m_lineMap[i].type) {
        case LineType::Added:    m_sci->markerAdd(i, M_ADDED); break;
        case LineType::Removed:  m_sci->markerAdd(i, M_REMOVED); break;
        case LineType::Modified: m_sci->markerAdd(i, M_MODIFIED); break;
        case LineType::Unchanged: break;
        }
    }
}

void DiffPane::applyClassMarkers() {
    for (int m = M_BREAKING; m <= M_UNCLASSIFIED; m++)
        m_sci->markerDeleteAll(m);

    for (int i = 0; i < m_lineMap.size(); i++) {
        if (showsClassMarker(m_lineMap[i], m_side))
            m_sci->markerAdd(i, M_BREAKING + diffTypeIndex(m_lineMap[i].diffType));
    }
}

void DiffPane::applyLineNumbers() {
    m_sci->clearMarginText(-1);
    m_numberTexts.clear();

    const QVector<int> numbers = displayLineNumbers(m_lineMap, m_side);
    for (int i = 0; i < numbers.size(); i++) {
        if (numbers[i] == 0) {
            m_numberTexts << QString();
            continue;
        }
        const QString text = QString::number(numbers[i]);
        m_numberTexts << text;
        QByteArray utf8 = text.toUtf8();
        m_sci->SendScintilla(QsciScintillaBase::SCI_MARGINSETTEXT,
                             (uintptr_t)i, utf8.constData());
        m_sci->SendScintilla(QsciScintillaBase::SCI_MARGINSETSTYLE,
                             (unsigned long)i, (long)MSTYLE_NUMBER);
    }
}

void DiffPane::applyFoldLevels(const QVector<int>& foldLevels) {
    for (int i = 0; i < foldLevels.size(); i++) {
        m_sci->SendScintilla(QsciScintillaBase::SCI_SETFOLDLEVEL,
                             (unsigned long)i, (long)foldLevels[i]);
    }
}

// Scintilla only takes fold text together with a toggle, so each header is
// folded with its text and expanded again. The text stays with the line.
void DiffPane::applyFoldTexts() {
    m_foldTexts.clear();
    const int n = m_lineMap.size();
    for (int i = 0; i < n; i++) {
        long level = m_sci->SendScintilla(QsciScintillaBase::SCI_GETFOLDLEVEL, (unsigned long)i);
        if (!isFoldHeader((int)level)) continue;
        long last = m_sci->SendScintilla(QsciScintillaBase::SCI_GETLASTCHILD,
                                         (unsigned long)i, (long)-1);
        const QString text = foldPlaceholderText(
            foldPlaceholderCounts(m_lineMap, i + 1, (int)last + 1, m_side));
        if (text.isEmpty()) continue;

        QByteArray utf8 = text.toUtf8();
        m_sci->SendScintilla(QsciScintillaBase::SCI_TOGGLEFOLDSHOWTEXT,
                             (uintptr_t)i, utf8.constData());
        m_sci->SendScintilla(QsciScintillaBase::SCI_TOGGLEFOLD, (unsigned long)i);
        m_foldTexts.insert(i + 1, text);
    }
}

void DiffPane::setChangeBadges(const QVector<ChangeBadge>& badges) {
    m_sci->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONCLEARALL);
    m_badgeTexts.clear();

    for (const auto& b : badges) {
        const int row = b.line - 1;
        if (row < 0 || row >= m_lineMap.size()) continue;

        // "  2 breaking, 1 annotation", each count in its type color
        QByteArray text("  ");
        QByteArray styles(2, char(MSTYLE_NUMBER));
        for (const auto& m : kDiffTypeMeta) {
            const int n = countOf(b.counts, m.type);
            if (n <= 0) continue;
            if (text.size() > 2) {
                text += ", ";
                styles += QByteArray(2, char(MSTYLE_NUMBER));
            }
            QByteArray part = QByteArray::number(n) + ' ' + m.name;
            text += part;
            styles += QByteArray(part.size(), char(MSTYLE_TYPE + diffTypeIndex(m.type)));
        }
        if (text.size() <= 2) continue;

        m_sci->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONSETTEXT,
                             (uintptr_t)row, text.constData());
        m_sci->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONSETSTYLES,
                             (uintptr_t)row, styles.constData());
        m_badgeTexts.insert(b.line, QString::fromUtf8(text.mid(2)));
    }
}

static inline void lineRangeNoEol(QsciScintilla* sci, int line, long& start, long& len) {
    start = sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE, (unsigned long)line);
    long end = sci->SendScintilla(QsciScintillaBase::SCI_GETLINEENDPOSITION, (unsigned long)line);
    len = (end > start) ? (end - start) : 0;
}

void DiffPane::applySpacers(const QSet<int>& spacerRows) {
    clearIndicator(IND_SPACER);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETINDICATORCURRENT, IND_SPACER);
    for (int row : spacerRows) {
        long pos, len;
        lineRangeNoEol(m_sci, row, pos, len);
        if (len > 0)
            m_sci->SendScintilla(QsciScintillaBase::SCI_INDICATORFILLRANGE, pos, len);
    }
}

void DiffPane::clearIndicator(int indic) {
    long docLen = m_sci->SendScintilla(QsciScintillaBase::SCI_GETLENGTH);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETINDICATORCURRENT, indic);
    m_sci->SendScintilla(QsciScintillaBase::SCI_INDICATORCLEARRANGE, (unsigned long)0, docLen);
}

// Ranges count UTF-16 code units, Scintilla positions are UTF-8 bytes
long DiffPane::positionOf(int row, int offset) const {
    long start = m_sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE,
                                      (unsigned long)row);
    if (row < 0 || row >= m_lines.size()) return start;
    return start + m_lines[row].left(offset).toUtf8().size();
}

void DiffPane::setWordDiff(const QVector<LineWordDiff>& rows) {
    clearIndicator(IND_WORD_ADDED);
    clearIndicator(IND_WORD_REMOVED);
    for (const auto& row : rows) {
        const int r = row.row - 1;
        if (r < 0 || r >= m_lines.size()) continue;
        for (const auto& range : row.ranges) {
            if (range.from >= range.to || range.to > m_lines[r].size()) continue;
            long a = positionOf(r, range.from);
            long b = positionOf(r, range.to);
            int indic = range.type == RangeKind::Added ? IND_WORD_ADDED : IND_WORD_REMOVED;
            m_sci->SendScintilla(QsciScintillaBase::SCI_SETINDICATORCURRENT, indic);
            m_sci->SendScintilla(QsciScintillaBase::SCI_INDICATORFILLRANGE, a, b - a);
        }
    }
}

void DiffPane::scrollToLine(int line) {
    if (line < 1 || line > m_lines.size()) return;
    m_sci->SendScintilla(QsciScintillaBase::SCI_ENSUREVISIBLE, (unsigned long)(line - 1));
    m_sci->SendScintilla(QsciScintillaBase::SCI_GOTOLINE, (unsigned long)(line - 1));
}

const LineMapping* DiffPane::mappingForLine(int line) const {
    if (line < 1 || line > m_lineMap.size()) return nullptr;
    return &m_lineMap[line - 1];
}

QString DiffPane::lineText(int line) const {
    if (line < 1 || line > m_lines.size()) return {};
    return m_lines[line - 1];
}

QString DiffPane::lineNumberText(int line) const {
    if (line < 1 || line > m_numberTexts.size()) return {};
    return m_numberTexts[line - 1];
}

QString DiffPane::foldText(int line) const {
    return m_foldTexts.value(line);
}

QString DiffPane::badgeText(int line) const {
    return m_badgeTexts.value(line);
}

} // namespace jdv
