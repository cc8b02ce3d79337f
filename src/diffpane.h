#pragma once
#include "core.h"
#include "decorations.h"
#include "foldpane.h"
#include "worddiff.h"
#include <QWidget>

class QsciScintilla;
class QsciLexer;

namespace jdv {

// Marker numbers (row backgrounds)
enum : int {
    M_ADDED    = 0,
    M_REMOVED  = 1,
    M_MODIFIED = 2,
    M_SPACER   = 3,
    // classification symbols in margin 1, M_BREAKING + diffTypeIndex(type)
    M_BREAKING     = 4,
    M_NON_BREAKING = 5,
    M_ANNOTATION   = 6,
    M_UNCLASSIFIED = 7,
};

// Indicator numbers
enum : int {
    IND_SPACER       = 8,
    IND_WORD_ADDED   = 9,
    IND_WORD_REMOVED = 10,
};

// FoldPane over a QsciScintilla whose fold levels are set by hand.
class SciFoldPane : public FoldPane {
    Q_OBJECT
public:
    explicit SciFoldPane(QsciScintilla* sci, QObject* parent = nullptr);

    int lineCount() const override;
    QVector<FoldRange> foldedRanges() const override;
    int lineAt(int pos) const override;
    bool isFoldable(int line) const override;
    bool isFolded(int line) const override;
    bool foldLine(int line) override;
    bool unfoldLine(int line) override;

    // Called after Scintilla toggled a fold on its own (margin click).
    void notifyFoldsChanged() { emit foldsChanged(); }

private:
    QsciScintilla* m_sci;
};

// One read-only editor pane of the diff view.
class DiffPane : public QWidget {
    Q_OBJECT
public:
    explicit DiffPane(QWidget* parent = nullptr);
    ~DiffPane() override;

    void setFormat(OutputFormat format);
    void setFoldingEnabled(bool on);

    // Which side the next setContent renders; drives numbering and markers.
    void setSide(PaneSide side) { m_side = side; }
    PaneSide side() const { return m_side; }

    // Rows in spacerRows (0-based) keep their text for height but are drawn
    // invisible.
    void setContent(const QStringList& lines, const QVector<LineMapping>& lineMap,
                    const QVector<int>& foldLevels, const QSet<int>& spacerRows = {});
    void clearContent();

    void setWordDiff(const QVector<LineWordDiff>& rows);
    void setChangeBadges(const QVector<ChangeBadge>& badges);
    void scrollToLine(int line);   // 1-based

    QsciScintilla* scintilla() const { return m_sci; }
    SciFoldPane* foldPane() const { return m_foldPane; }
    const LineMapping* mappingForLine(int line) const;   // 1-based
    QString lineText(int line) const;                     // 1-based
    QString lineNumberText(int line) const;               // margin text, empty on spacers
    QString foldText(int line) const;                     // shown while line is folded
    QString badgeText(int line) const;

signals:
    void blockClicked(const QString& blockId, int line);

private:
    void setupScintilla();
    void setupFolding();
    void setupMarkers();
    void setupIndicators();
    void allocateStyles();
    void applyLineNumbers();
    void applyClassMarkers();
    void applyFoldTexts();
    void applyMarkers(const QSet<int>& spacerRows);
    void applyFoldLevels(const QVector<int>& foldLevels);
    void applySpacers(const QSet<int>& spacerRows);
    void clearIndicator(int indic);
    long positionOf(int row, int offset) const;

    QsciScintilla*       m_sci = nullptr;
    QsciLexer*           m_lexer = nullptr;
    SciFoldPane*         m_foldPane = nullptr;
    OutputFormat         m_format = OutputFormat::Json;
    PaneSide             m_side = PaneSide::After;
    int                  m_styleBase = 0;
    QStringList          m_lines;
    QVector<LineMapping> m_lineMap;
    QStringList          m_numberTexts;
    QHash<int, QString>  m_foldTexts;    // 1-based header line
    QHash<int, QString>  m_badgeTexts;   // 1-based header line
};

} // namespace jdv
