#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "../src/utils.h"
#include "../src/file_utils.h"

class TestUtils : public QObject {
    Q_OBJECT
private slots:
    void testFormatTime();
    void testFormatBytes();
    void testParseTimeToSeconds();
    void testParseFfmpegTime();
    void testAtempoChain();
    void testEstimateEta();
    void testSafeOutputName();
    void testCollectFilesRecursive();
};

void TestUtils::testFormatTime()
{
    QCOMPARE(Utils::formatTime(0), QString("00:00"));
    QCOMPARE(Utils::formatTime(83), QString("01:23"));
    QCOMPARE(Utils::formatTime(3723), QString("01:02:03"));
    // Unknown
    QCOMPARE(Utils::formatTime(-1), QString("--:--"));
}

void TestUtils::testFormatBytes()
{
    QCOMPARE(Utils::formatBytes(512), QString("512.0 B"));
    QCOMPARE(Utils::formatBytes(1536), QString("1.5 KB"));
    QCOMPARE(Utils::formatBytes(5LL * 1024 * 1024), QString("5.0 MB"));
    QCOMPARE(Utils::formatBytes(-1), QString("--"));
}

void TestUtils::testParseTimeToSeconds()
{
    bool ok = false;
    QCOMPARE(Utils::parseTimeToSeconds("5", &ok), 5.0);
    QVERIFY(ok);
    QCOMPARE(Utils::parseTimeToSeconds("1:30", &ok), 90.0);
    QVERIFY(ok);
    QCOMPARE(Utils::parseTimeToSeconds(" 01:02:03.5 ", &ok), 3723.5);
    QVERIFY(ok);

    Utils::parseTimeToSeconds("abc", &ok);
    QVERIFY(!ok);
    Utils::parseTimeToSeconds("1:2:3:4", &ok);
    QVERIFY(!ok);
    Utils::parseTimeToSeconds("", &ok);
    QVERIFY(!ok);
}

void TestUtils::testParseFfmpegTime()
{
    bool ok = false;
    QCOMPARE(Utils::parseFfmpegTime("00:00:12.500000", &ok), 12.5);
    QVERIFY(ok);
    QCOMPARE(Utils::parseFfmpegTime("42.25", &ok), 42.25);
    QVERIFY(ok);
    // ffmpeg writes N/A before the first frame
    Utils::parseFfmpegTime("N/A", &ok);
    QVERIFY(!ok);
}

void TestUtils::testAtempoChain()
{
    QCOMPARE(Utils::atempoChain(1.5), QVector<double>({1.5}));
    QCOMPARE(Utils::atempoChain(4.0), QVector<double>({2.0, 2.0}));
    QCOMPARE(Utils::atempoChain(3.0), QVector<double>({2.0, 1.5}));
    QCOMPARE(Utils::atempoChain(0.25), QVector<double>({0.5, 0.5}));
    QVERIFY(Utils::atempoChain(0.0).isEmpty());
}

void TestUtils::testEstimateEta()
{
    QCOMPARE(Utils::estimateEta(10.0, 0.5), 10.0);
    QCOMPARE(Utils::estimateEta(30.0, 1.0), 0.0);
    QCOMPARE(Utils::estimateEta(10.0, 0.0), -1.0);
}

void TestUtils::testSafeOutputName()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QDir dir(tmp.path());

    QCOMPARE(FileUtils::safeOutputName(tmp.path(), "/in/clip.mov", "mp4"), dir.filePath("clip.mp4"));

    QFile first(dir.filePath("clip.mp4"));
    QVERIFY(first.open(QIODevice::WriteOnly));
    first.close();
    QCOMPARE(FileUtils::safeOutputName(tmp.path(), "/in/clip.mov", ".mp4"), dir.filePath("clip (1).mp4"));

    QFile second(dir.filePath("clip (1).mp4"));
    QVERIFY(second.open(QIODevice::WriteOnly));
    second.close();
    QCOMPARE(FileUtils::safeOutputName(tmp.path(), "/in/clip.mov", "mp4"), dir.filePath("clip (2).mp4"));

    // Only the last suffix is replaced
    QCOMPARE(FileUtils::safeOutputName(tmp.path(), "/in/my.holiday.mkv", "webm"), dir.filePath("my.holiday.webm"));

    // Placeholder-looking stems are copied literally
    QFile taken(dir.filePath("sale%1.mp4"));
    QVERIFY(taken.open(QIODevice::WriteOnly));
    taken.close();
    QCOMPARE(FileUtils::safeOutputName(tmp.path(), "/in/sale%1.mov", "mp4"), dir.filePath("sale%1 (1).mp4"));

    QFile encoded(dir.filePath("a%2Fb.mkv"));
    QVERIFY(encoded.open(QIODevice::WriteOnly));
    encoded.close();
    QCOMPARE(FileUtils::safeOutputName(tmp.path(), "/in/a%2Fb.mp4", "mkv"), dir.filePath("a%2Fb (1).mkv"));
}

void TestUtils::testCollectFilesRecursive()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QDir dir(tmp.path());
    QVERIFY(dir.mkpath("sub/deeper"));
    for (const QString& rel : {QString("b.mp4"), QString("sub/a.jpg"), QString("sub/deeper/c.txt")}) {
        QFile f(dir.filePath(rel));
        QVERIFY(f.open(QIODevice::WriteOnly));
    }

    const QStringList files = FileUtils::collectFilesRecursive(tmp.path());
    QCOMPARE(files.size(), 3);
    QStringList sorted = files;
    sorted.sort();
    QCOMPARE(files, sorted);
    QVERIFY(files.contains(dir.filePath("sub/deeper/c.txt")));
}

QTEST_APPLESS_MAIN(TestUtils)
#include "test_utils.moc"
