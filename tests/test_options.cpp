#include <QtTest/QTest>
#include "options.h"
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>

using namespace jdv;

class TestOptions : public QObject {
    Q_OBJECT
private slots:
    void testDefaults() {
        DiffOptions o;
        QCOMPARE(o.format, OutputFormat::Json);
        QCOMPARE(o.displayMode, DisplayMode::SideBySide);
        QCOMPARE(o.wordDiffMode, WordDiffMode::Word);
        QVERIFY(!o.inlineWordDiff);
        QVERIFY(o.filters.isEmpty());
        QVERIFY(o.enableFolding);
        QVERIFY(o.syncFolds);
        QCOMPARE(o.alignOptions().wordDiffMode, WordDiffMode::Word);
        QVERIFY(!o.unifiedOptions().inlineWordDiff);
    }

    void testEnumNames() {
        QCOMPARE(QString(displayModeToString(DisplayMode::SideBySide)), QString("side-by-side"));
        QCOMPARE(wordDiffModeFromString("char"), WordDiffMode::Char);
        bool ok = true;
        QCOMPARE(outputFormatFromString("toml", &ok), OutputFormat::Json);
        QVERIFY(!ok);
    }

    void testSettingsRoundTrip() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("options.ini");

        DiffOptions o;
        o.format = OutputFormat::Yaml;
        o.displayMode = DisplayMode::Inline;
        o.wordDiffMode = WordDiffMode::None;
        o.inlineWordDiff = true;
        o.filters = {DiffType::Breaking, DiffType::Annotation};
        o.syncFolds = false;
        {
            QSettings s(path, QSettings::IniFormat);
            o.save(s);
        }

        DiffOptions back;
        QSettings s(path, QSettings::IniFormat);
        back.load(s);
        QVERIFY(back == o);
        QCOMPARE(s.value("format").toString(), QString("yaml"));
        QCOMPARE(s.value("filters").toStringList(), QStringList({"breaking", "annotation"}));
    }

    void testMissingKeysKeepValues() {
        QTemporaryDir dir;
        QSettings s(dir.filePath("empty.ini"), QSettings::IniFormat);
        DiffOptions o;
        o.format = OutputFormat::Yaml;
        o.filters = {DiffType::NonBreaking};
        o.load(s);
        QCOMPARE(o.format, OutputFormat::Yaml);
        QCOMPARE(o.filters.size(), 1);
    }

    void testBadValuesAreReported() {
        QTemporaryDir dir;
        QSettings s(dir.filePath("bad.ini"), QSettings::IniFormat);
        s.setValue("displayMode", "diagonal");
        s.setValue("filters", QStringList({"breaking", "fatal", "breaking"}));

        DiffOptions o;
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Options: unknown display mode.*"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Options: ignoring unknown filter.*"));
        o.load(s);
        QCOMPARE(o.displayMode, DisplayMode::SideBySide);
        QVERIFY(o.filters == QVector<DiffType>({DiffType::Breaking}));
    }

    void testInequality() {
        DiffOptions a, b;
        QVERIFY(a == b);
        b.enableFolding = false;
        QVERIFY(a != b);
    }
};

QTEST_MAIN(TestOptions)
#include "test_options.moc"
