#include <QtTest/QTest>
#include <QSignalSpy>
#include <Qsci/qsciscintilla.h>
#include "diffpane.h"
#include "foldsync.h"

using namespace jdv;

static ChangeNode keyed(const QString& id, int indent, const QString& text,
                        DiffAction action = DiffAction::None,
                        DiffType type = DiffType::Unclassified) {
    ChangeNode n;
    n.id = id;
    n.indent = indent;
    n.tokens.append({text, DisplayCondition::Always, TokenRole::Syntax});
    n.diff.action = action;
    n.diff.type = type;
    return n;
}

// 1 info:  2 title (modified)  3 paths:  4 /pets: (added)  5 get
static ChangeNode makeTree() {
    ChangeNode title = keyed("info/title", 2, "title: ", DiffAction::Replace, DiffType::Annotation);
    title.tokens.append({"Petstore", DisplayCondition::Before, TokenRole::Value});
    title.tokens.append({"Pets", DisplayCondition::After, TokenRole::Value});
    ChangeNode info = keyed("info", 0, "info:");
    info.children.push_back(title);

    ChangeNode pets = keyed("paths/~1pets", 2, "/pets:", DiffAction::Add, DiffType::NonBreaking);
    pets.children.push_back(keyed("paths/~1pets/get", 4, "get: list"));
    ChangeNode paths = keyed("paths", 0, "paths:");
    paths.children.push_back(pets);

    ChangeNode root;
    root.children.push_back(info);
    root.children.push_back(paths);
    recomputeCounts(root);
    return root;
}

static void fill(DiffPane& pane, const AlignmentResult& r, Side side) {
    pane.setFormat(OutputFormat::Yaml);
    pane.setSide(paneSideOf(side));
    if (side == Side::Before)
        pane.setContent(r.beforeLines, r.lineMap, r.foldLevels, r.beforeSpacerRows);
    else
        pane.setContent(r.afterLines, r.lineMap, r.foldLevels, r.afterSpacerRows);
}

static bool hasMarker(DiffPane& pane, int line, int marker) {
    long mask = pane.scintilla()->SendScintilla(QsciScintillaBase::SCI_MARKERGET,
                                                (unsigned long)(line - 1));
    return (mask & (1L << marker)) != 0;
}

class TestPane : public QObject {
    Q_OBJECT
private slots:
    void testContentAndMapping() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);

        QCOMPARE(pane.foldPane()->lineCount(), 5);
        QCOMPARE(pane.lineText(2), QString("  title: Pets"));
        QVERIFY(pane.lineText(9).isNull());
        QVERIFY(pane.mappingForLine(4));
        QCOMPARE(pane.mappingForLine(4)->blockId, QString("paths/~1pets"));
        QVERIFY(!pane.mappingForLine(0));

        QVERIFY(hasMarker(pane, 2, M_MODIFIED));
        QVERIFY(hasMarker(pane, 4, M_ADDED));
        QVERIFY(!hasMarker(pane, 1, M_ADDED));
    }

    void testSpacerRowsMarked() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::Before);

        // the added /pets block is a spacer on the before side
        QVERIFY(hasMarker(pane, 4, M_SPACER));
        QVERIFY(!hasMarker(pane, 4, M_ADDED));
        QCOMPARE(pane.lineText(4), QString("  /pets:"));
    }

    void testLineNumbersSkipSpacers() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane before, after;
        fill(before, r, Side::Before);
        fill(after, r, Side::After);

        QCOMPARE(before.lineNumberText(3), QString("3"));
        QVERIFY(before.lineNumberText(4).isEmpty());
        QVERIFY(before.lineNumberText(5).isEmpty());
        QCOMPARE(after.lineNumberText(5), QString("5"));

        QsciScintilla* sci = before.scintilla();
        QCOMPARE(sci->marginType(0), QsciScintilla::TextMarginRightJustified);
        auto marginLength = [sci](int row) {
            return sci->SendScintilla(QsciScintillaBase::SCI_MARGINGETTEXT,
                                      (unsigned long)row, (long)0);
        };
        QCOMPARE(marginLength(2), 1L);
        QCOMPARE(marginLength(3), 0L);
    }

    void testClassificationMarkers() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane before, after;
        fill(before, r, Side::Before);
        fill(after, r, Side::After);

        QVERIFY(hasMarker(after, 4, M_NON_BREAKING));
        QVERIFY(hasMarker(after, 2, M_ANNOTATION));
        QVERIFY(!hasMarker(after, 5, M_NON_BREAKING));
        QVERIFY(!hasMarker(before, 4, M_NON_BREAKING));   // spacer
        QVERIFY(hasMarker(before, 2, M_ANNOTATION));
    }

    void testFoldTextCountsChanges() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane before, after;
        fill(before, r, Side::Before);
        fill(after, r, Side::After);

        QCOMPARE(after.foldText(1), QString::fromUtf8("… 1 annotation"));
        QCOMPARE(after.foldText(3), QString::fromUtf8("… 1 non-breaking"));
        QCOMPARE(before.foldText(3), after.foldText(3));
        QVERIFY(before.foldText(4).isEmpty());
        QVERIFY(after.foldText(2).isEmpty());

        // setting the text leaves every header expanded
        QVERIFY(after.foldPane()->foldedRanges().isEmpty());
    }

    void testChangeBadges() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);

        const ChangeCounts counts = {3, 2, 0, 1, 0};
        pane.setChangeBadges({{"paths", 3, counts}, {"nowhere", 40, counts}});
        QCOMPARE(pane.badgeText(3), QString("2 breaking, 1 annotation"));
        QVERIFY(pane.badgeText(40).isEmpty());
        QCOMPARE(pane.scintilla()->SendScintilla(QsciScintillaBase::SCI_ANNOTATIONGETLINES,
                                                 (unsigned long)2), 1L);

        fill(pane, r, Side::After);
        QVERIFY(pane.badgeText(3).isEmpty());
    }

    void testFoldLevelsDriveFoldability() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);
        SciFoldPane* fp = pane.foldPane();

        QVERIFY(fp->isFoldable(1));
        QVERIFY(!fp->isFoldable(2));
        QVERIFY(fp->isFoldable(3));
        QVERIFY(fp->isFoldable(4));
        QVERIFY(!fp->isFoldable(5));
        QVERIFY(!fp->isFoldable(0));
        QVERIFY(!fp->isFoldable(6));
    }

    void testFoldAndUnfold() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);
        SciFoldPane* fp = pane.foldPane();
        QSignalSpy changed(fp, &FoldPane::foldsChanged);

        QVERIFY(fp->foldedRanges().isEmpty());
        QVERIFY(fp->foldLine(3));
        QVERIFY(fp->isFolded(3));
        QVERIFY(!fp->foldLine(3));
        QVERIFY(!fp->foldLine(2));
        QCOMPARE(changed.count(), 1);

        QVector<FoldRange> ranges = fp->foldedRanges();
        QCOMPARE(ranges.size(), 1);
        QCOMPARE(fp->lineAt(ranges[0].from), 3);
        QCOMPARE(fp->lineAt(ranges[0].to), 5);

        QVERIFY(fp->unfoldLine(3));
        QVERIFY(!fp->isFolded(3));
        QVERIFY(!fp->unfoldLine(3));
        QCOMPARE(changed.count(), 2);
    }

    void testPanesStaySynced() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane before, after;
        fill(before, r, Side::Before);
        fill(after, r, Side::After);

        FoldSyncCoordinator sync(before.foldPane(), after.foldPane());
        sync.setLineMap(r.lineMap);

        QVERIFY(before.foldPane()->foldLine(1));
        QVERIFY(after.foldPane()->isFolded(1));
        QTRY_VERIFY(sync.phase(Side::After) == SyncPhase::Synced);

        QVERIFY(after.foldPane()->unfoldLine(1));
        QVERIFY(!before.foldPane()->isFolded(1));
        QTRY_VERIFY(sync.phase(Side::Before) == SyncPhase::Synced);

        FoldDelta delta;
        delta.toFold = QStringList{"paths/~1pets"};
        sync.applyFilterDelta(delta, r.blockLineRanges);
        QVERIFY(before.foldPane()->isFolded(4));
        QVERIFY(after.foldPane()->isFolded(4));
        QCOMPARE(sync.foldedBlockIds(Side::Before), QSet<QString>({"paths/~1pets"}));
    }

    void testReloadClearsFolds() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);
        pane.foldPane()->foldLine(1);

        fill(pane, r, Side::After);
        QVERIFY(pane.foldPane()->foldedRanges().isEmpty());
        QVERIFY(pane.foldPane()->isFoldable(1));
    }

    void testWordDiffIndicators() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);

        QVector<LineWordDiff> rows =
            buildWordDiffData(r.lineMap, r.beforeLines, r.afterLines, Side::After);
        QCOMPARE(rows.size(), 1);
        pane.setWordDiff(rows);

        QsciScintilla* sci = pane.scintilla();
        long lineStart = sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE,
                                            (unsigned long)1);
        auto valueAt = [&](long pos) {
            return sci->SendScintilla(QsciScintillaBase::SCI_INDICATORVALUEAT,
                                      (unsigned long)IND_WORD_ADDED, pos);
        };
        QVERIFY(valueAt(lineStart + 9) != 0);    // "Pets"
        QVERIFY(valueAt(lineStart + 2) == 0);    // "title"

        pane.setWordDiff({});
        QVERIFY(valueAt(lineStart + 9) == 0);
    }

    void testClickEmitsBlock() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);
        QSignalSpy clicked(&pane, &DiffPane::blockClicked);

        pane.scintilla()->setCursorPosition(4, 0);
        QCOMPARE(clicked.count(), 1);
        QCOMPARE(clicked.at(0).at(0).toString(), QString("paths/~1pets/get"));
        QCOMPARE(clicked.at(0).at(1).toInt(), 5);
    }

    void testClearContent() {
        ChangeNode root = makeTree();
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        DiffPane pane;
        fill(pane, r, Side::After);
        pane.clearContent();
        QCOMPARE(pane.foldPane()->lineCount(), 1);   // an empty document has one line
        QVERIFY(!pane.mappingForLine(1));
    }
};

QTEST_MAIN(TestPane)
#include "test_pane.moc"
