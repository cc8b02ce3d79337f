#include <QtTest/QTest>
#include "core.h"
#include <QRegularExpression>

using namespace jdv;

static ChangeNode prop(const QString& id, int indent, const QString& key, const QString& value,
                       DiffAction action = DiffAction::None,
                       DiffType type = DiffType::Unclassified) {
    ChangeNode n;
    n.id = id;
    n.indent = indent;
    n.tokens.append({key + QStringLiteral(": "), DisplayCondition::Always, TokenRole::Key});
    n.tokens.append({value, DisplayCondition::Always, TokenRole::Value});
    n.diff.action = action;
    n.diff.type = type;
    return n;
}

// a: 1 (unchanged), b: 2 (added, non-breaking), c: 3 (removed, breaking)
static ChangeNode makeAbcTree() {
    ChangeNode root;
    root.children.push_back(prop("a", 0, "a", "1"));
    root.children.push_back(prop("b", 0, "b", "2", DiffAction::Add, DiffType::NonBreaking));
    root.children.push_back(prop("c", 0, "c", "3", DiffAction::Remove, DiffType::Breaking));
    recomputeCounts(root);
    return root;
}

// info:
//   title: Pets          (replace: old value "Petstore")
//   version: 1
// paths:
//   /pets:               (added)
//     get: list
static ChangeNode makeNestedTree() {
    ChangeNode title = prop("info/title", 2, "title", "Pets", DiffAction::Replace, DiffType::Annotation);
    title.tokens[1] = {"Petstore", DisplayCondition::Before, TokenRole::Value};
    title.tokens.append({"Pets", DisplayCondition::After, TokenRole::Value});

    ChangeNode info = prop("info", 0, "info", QString());
    info.children.push_back(title);
    info.children.push_back(prop("info/version", 2, "version", "1"));

    ChangeNode pets = prop("paths/~1pets", 2, "/pets", QString(), DiffAction::Add, DiffType::NonBreaking);
    pets.children.push_back(prop("paths/~1pets/get", 4, "get", "list"));

    ChangeNode paths = prop("paths", 0, "paths", QString());
    paths.children.push_back(pets);

    ChangeNode root;
    root.children.push_back(info);
    root.children.push_back(paths);
    recomputeCounts(root);
    return root;
}

class TestCompose : public QObject {
    Q_OBJECT
private slots:
    void testFlattenDepthsAndRoots() {
        ChangeNode root = makeNestedTree();
        QVector<DiffLine> lines = flattenTree(root);
        QCOMPARE(lines.size(), 6);
        QCOMPARE(lines[0].node->id, QString("info"));
        QCOMPARE(lines[0].depth, 0);
        QCOMPARE(lines[1].depth, 1);
        QVERIFY(lines[1].isChangeRoot);       // title
        QCOMPARE(lines[5].node->id, QString("paths/~1pets/get"));
        QCOMPARE(lines[5].depth, 2);
        QVERIFY(lines[4].isChangeRoot);       // /pets
        QVERIFY(!lines[5].isChangeRoot);      // inside the added block
    }

    void testRenderSideFiltersTokens() {
        ChangeNode n = prop("k", 2, "k", "v");
        n.tokens.append({" (old)", DisplayCondition::Before, TokenRole::Syntax});
        n.tokens.append({" (new)", DisplayCondition::After, TokenRole::Syntax});
        n.tokens.append({" ...", DisplayCondition::Collapsed, TokenRole::ChangeCount});

        QCOMPARE(renderSide(n, Side::Before), QString("  k: v (old)"));
        QCOMPARE(renderSide(n, Side::After), QString("  k: v (new)"));
        QCOMPARE(renderSide(n, Side::After, 2), QString("    k: v (new)"));
    }

    void testRenderSideReplacesLineBreaks() {
        ChangeNode n = prop("d", 0, "description", "line one\r\nline two\nthree");
        QCOMPARE(renderSide(n, Side::Before), QString("description: line one line two three"));
    }

    void testAlignedAbcYaml() {
        AlignmentResult r = composeAligned(makeAbcTree(), OutputFormat::Yaml);

        QCOMPARE(r.beforeLines.size(), 3);
        QCOMPARE(r.afterLines.size(), 3);
        QCOMPARE(r.lineMap.size(), 3);

        QCOMPARE(r.lineMap[0].type, LineType::Unchanged);
        QCOMPARE(r.lineMap[0].beforeLine, 1);
        QCOMPARE(r.lineMap[0].afterLine, 1);

        QCOMPARE(r.lineMap[1].type, LineType::Added);
        QVERIFY(!r.lineMap[1].hasBefore());
        QCOMPARE(r.lineMap[1].afterLine, 2);
        QCOMPARE(r.lineMap[1].diffType, DiffType::NonBreaking);
        QVERIFY(r.lineMap[1].isChangeRoot);

        QCOMPARE(r.lineMap[2].type, LineType::Removed);
        QCOMPARE(r.lineMap[2].beforeLine, 3);
        QVERIFY(!r.lineMap[2].hasAfter());
        QCOMPARE(r.lineMap[2].diffType, DiffType::Breaking);

        // spacer rows mirror the opposite side's text
        QCOMPARE(r.beforeLines[1], QString("b: 2"));
        QCOMPARE(r.afterLines[2], QString("c: 3"));
        QCOMPARE(r.beforeSpacerRows, QSet<int>{1});
        QCOMPARE(r.afterSpacerRows, QSet<int>{2});
        QVERIFY(checkAlignment(r));
    }

    void testAlignedAbcJson() {
        AlignmentResult r = composeAligned(makeAbcTree(), OutputFormat::Json);

        QCOMPARE(r.beforeLines.size(), 5);
        QCOMPARE(r.beforeLines.first(), QString("{"));
        QCOMPARE(r.afterLines.last(), QString("}"));
        QCOMPARE(r.beforeLines[1], QString("  a: 1"));
        QCOMPARE(r.lineMap[0].type, LineType::Unchanged);
        QVERIFY(r.lineMap[0].blockId.isEmpty());
        QCOMPARE(r.lineMap[2].type, LineType::Added);
        QCOMPARE(r.lineMap[3].type, LineType::Removed);
        QCOMPARE(r.lineMap[4].type, LineType::Unchanged);

        // braces enclose the body in one fold
        QVERIFY(isFoldHeader(r.foldLevels[0]));
        QCOMPARE(foldDepth(r.foldLevels[0]), 0);
        QCOMPARE(foldDepth(r.foldLevels[1]), 1);
        QCOMPARE(foldDepth(r.foldLevels[4]), 0);
    }

    void testSpacerFallsBackToPlaceholder() {
        ChangeNode root;
        ChangeNode hidden;
        hidden.id = "h";
        hidden.tokens.append({"summary", DisplayCondition::Collapsed, TokenRole::ChangeCount});
        hidden.diff.action = DiffAction::Add;
        root.children.push_back(hidden);
        recomputeCounts(root);

        AlignmentResult r = composeAligned(root, OutputFormat::Yaml);
        QCOMPARE(r.afterLines[0], QString());
        QCOMPARE(r.beforeLines[0], kSpacerLine);
        QCOMPARE(kSpacerLine.size(), 4);
        QCOMPARE(kSpacerLine.at(0), QChar(0x00A0));
    }

    void testAlignedSpacerInvariant() {
        ChangeNode root = makeNestedTree();
        root.children.push_back(prop("z", 0, "z", "gone", DiffAction::Remove, DiffType::Breaking));
        recomputeCounts(root);

        for (OutputFormat f : {OutputFormat::Json, OutputFormat::Yaml}) {
            AlignmentResult r = composeAligned(root, f);
            QCOMPARE(r.beforeLines.size(), r.lineMap.size());
            QCOMPARE(r.afterLines.size(), r.lineMap.size());
            for (int i = 0; i < r.lineMap.size(); i++) {
                const LineMapping& lm = r.lineMap[i];
                QVERIFY(lm.hasBefore() || lm.hasAfter());
                QCOMPARE(r.beforeSpacerRows.contains(i), !lm.hasBefore());
                QCOMPARE(r.afterSpacerRows.contains(i), !lm.hasAfter());
                if (lm.hasBefore()) QCOMPARE(lm.beforeLine, i + 1);
                if (lm.hasAfter())  QCOMPARE(lm.afterLine, i + 1);
                QVERIFY(!r.beforeLines[i].contains('\n'));
                QVERIFY(!r.afterLines[i].contains('\n'));
            }
            QVERIFY(checkAlignment(r));
        }
    }

    void testModifiedRowKeepsBothSides() {
        AlignmentResult r = composeAligned(makeNestedTree(), OutputFormat::Yaml);
        QCOMPARE(r.lineMap[1].type, LineType::Modified);
        QCOMPARE(r.lineMap[1].beforeLine, 2);
        QCOMPARE(r.lineMap[1].afterLine, 2);
        QCOMPARE(r.beforeLines[1], QString("  title: Petstore"));
        QCOMPARE(r.afterLines[1], QString("  title: Pets"));
        QVERIFY(r.lineMap[1].pairId.isEmpty());
    }

    void testNoWordDiffSplitsModifiedRow() {
        AlignOptions opts;
        opts.wordDiffMode = WordDiffMode::None;
        AlignmentResult r = composeAligned(makeNestedTree(), OutputFormat::Yaml, opts);

        QCOMPARE(r.lineMap.size(), 7);
        const LineMapping& removed = r.lineMap[1];
        const LineMapping& added   = r.lineMap[2];
        QCOMPARE(removed.type, LineType::Removed);
        QCOMPARE(added.type, LineType::Added);
        QCOMPARE(removed.pairId, QString("info/title"));
        QCOMPARE(added.pairId, removed.pairId);
        QVERIFY(removed.hasBefore() && !removed.hasAfter());
        QVERIFY(!added.hasBefore() && added.hasAfter());

        // each pane shows the same text on both rows of the pair
        QCOMPARE(r.beforeLines[1], QString("  title: Petstore"));
        QCOMPARE(r.afterLines[1], QString("  title: Petstore"));
        QCOMPARE(r.beforeLines[2], QString("  title: Pets"));
        QCOMPARE(r.afterLines[2], QString("  title: Pets"));
        QVERIFY(checkAlignment(r));
    }

    void testPairIdForUnaddressableRow() {
        ChangeNode root;
        ChangeNode item = prop(QString(), 0, "- name", "x", DiffAction::Replace, DiffType::Breaking);
        root.children.push_back(item);
        recomputeCounts(root);

        AlignOptions opts;
        opts.wordDiffMode = WordDiffMode::None;
        AlignmentResult r = composeAligned(root, OutputFormat::Yaml, opts);
        QCOMPARE(r.lineMap[0].pairId, QString("pair-0"));
        QCOMPARE(r.lineMap[1].pairId, QString("pair-0"));
    }

    void testBlockLineRangesPropagate() {
        AlignmentResult r = composeAligned(makeNestedTree(), OutputFormat::Yaml);
        QCOMPARE(r.blockLineRanges.value("info").start, 1);
        QCOMPARE(r.blockLineRanges.value("info").end, 3);
        QCOMPARE(r.blockLineRanges.value("paths").start, 4);
        QCOMPARE(r.blockLineRanges.value("paths").end, 6);
        QCOMPARE(r.blockLineRanges.value("paths/~1pets").start, 5);
        QCOMPARE(r.blockLineRanges.value("paths/~1pets").end, 6);
        QCOMPARE(r.blockLineRanges.value("paths/~1pets/get").start, 6);
    }

    void testFoldLevelsYaml() {
        AlignmentResult r = composeAligned(makeNestedTree(), OutputFormat::Yaml);
        QCOMPARE(r.foldLevels.size(), 6);
        QVERIFY(isFoldHeader(r.foldLevels[0]));    // info:
        QVERIFY(!isFoldHeader(r.foldLevels[1]));   // title
        QVERIFY(!isFoldHeader(r.foldLevels[2]));   // version
        QVERIFY(isFoldHeader(r.foldLevels[3]));    // paths:
        QVERIFY(isFoldHeader(r.foldLevels[4]));    // /pets:
        QCOMPARE(foldDepth(r.foldLevels[5]), 2);
    }

    void testUnifiedSplitsModification() {
        UnifiedResult u = composeUnified(makeNestedTree(), OutputFormat::Yaml);
        QCOMPARE(u.lines.size(), 7);
        QCOMPARE(u.lines[1], QString("  title: Petstore"));
        QCOMPARE(u.lines[2], QString("  title: Pets"));
        QCOMPARE(u.lineMap[1].type, LineType::Removed);
        QCOMPARE(u.lineMap[2].type, LineType::Added);
        QVERIFY(u.beforeContentMap.isEmpty());
        QCOMPARE(u.lines.size(), u.lineMap.size());
        QCOMPARE(u.foldLevels.size(), u.lines.size());
    }

    void testUnifiedInlineKeepsOneRow() {
        UnifiedOptions opts;
        opts.inlineWordDiff = true;
        UnifiedResult u = composeUnified(makeNestedTree(), OutputFormat::Json, opts);
        QCOMPARE(u.lines.size(), 8);   // braces + 6 rows
        QCOMPARE(u.lines[2], QString("    title: Pets"));
        QCOMPARE(u.lineMap[2].type, LineType::Modified);
        QCOMPARE(u.beforeContentMap.value(2), QString("    title: Petstore"));
        QCOMPARE(u.beforeContentMap.size(), 1);
    }

    void testUnifiedAbc() {
        UnifiedResult u = composeUnified(makeAbcTree(), OutputFormat::Yaml);
        QCOMPARE(u.lines, QStringList({"a: 1", "b: 2", "c: 3"}));
        QCOMPARE(u.lineMap[1].type, LineType::Added);
        QCOMPARE(u.lineMap[2].type, LineType::Removed);
        QCOMPARE(u.blockLineRanges.value("c").start, 3);
    }

    void testCheckAlignmentReportsMismatch() {
        AlignmentResult r = composeAligned(makeAbcTree(), OutputFormat::Yaml);
        r.afterLines.removeLast();
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Alignment: length mismatch.*"));
        QVERIFY(!checkAlignment(r));
    }

    void testEmptyTree() {
        ChangeNode root;
        AlignmentResult y = composeAligned(root, OutputFormat::Yaml);
        QVERIFY(y.lineMap.isEmpty());
        AlignmentResult j = composeAligned(root, OutputFormat::Json);
        QCOMPARE(j.beforeLines, QStringList({"{", "}"}));
        QVERIFY(!isFoldHeader(j.foldLevels[0]));
    }
};

QTEST_MAIN(TestCompose)
#include "test_compose.moc"
