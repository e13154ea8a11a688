#include <QtTest>
#include <QTemporaryDir>
#include <QStandardPaths>
#include <QSignalSpy>
#include <QRegularExpression>
#include <QThread>
#include <QFile>
#include <QDir>

#include "../src/log_manager.h"
#include "../src/log_viewer_widget.h"

class TestLogManager : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void testLevelParsing();
    void testEntryFormat();
    void testMinimumLevel();
    void testRingIsBounded();
    void testEntriesFromOtherThreads();
    void testRotation();
    void testViewerFilter();
};

void TestLogManager::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TestLogManager::init()
{
    LogManager::instance().setMinimumLevel(LogManager::Level::Info);
    LogManager::instance().clear();
}

void TestLogManager::testLevelParsing()
{
    bool ok = false;
    QCOMPARE(LogManager::levelFromString("warn", &ok), LogManager::Level::Warn);
    QVERIFY(ok);
    QCOMPARE(LogManager::levelFromString("WARNING"), LogManager::Level::Warn);
    QCOMPARE(LogManager::levelFromString(" ok "), LogManager::Level::Ok);
    QCOMPARE(LogManager::levelFromString("CRITICAL"), LogManager::Level::Fatal);
    QCOMPARE(LogManager::levelFromString("chatter", &ok), LogManager::Level::Info);
    QVERIFY(!ok);

    QCOMPARE(LogManager::levelName(LogManager::Level::Ok), QString("OK"));
    QCOMPARE(LogManager::levelName(LogManager::Level::Error), QString("ERROR"));
    QVERIFY(LogManager::Level::Ok > LogManager::Level::Info);
    QVERIFY(LogManager::Level::Warn > LogManager::Level::Ok);
}

void TestLogManager::testEntryFormat()
{
    QSignalSpy spy(&LogManager::instance(), &LogManager::logAdded);
    LogManager::instance().addLog("Done: clip.mp4", "ok");

    QCOMPARE(spy.count(), 1);
    const QString entry = spy.first().at(0).toString();
    QVERIFY(QRegularExpression("^\\[\\d\\d:\\d\\d:\\d\\d\\.\\d{3}\\] \\[OK\\] Done: clip.mp4$").match(entry).hasMatch());
    QCOMPARE(LogManager::levelOf(entry), QString("OK"));
    QCOMPARE(LogManager::levelOf("no tag here"), QString());
    QCOMPARE(LogManager::instance().logs().size(), 1);
}

void TestLogManager::testMinimumLevel()
{
    LogManager::instance().addLog("ffmpeg -y -i a.mp4 out.mp4", "DEBUG");
    QCOMPARE(LogManager::instance().logs().size(), 0);

    LogManager::instance().setMinimumLevel(LogManager::Level::Debug);
    LogManager::instance().addLog("ffmpeg -y -i a.mp4 out.mp4", "DEBUG");
    QCOMPARE(LogManager::instance().logs().size(), 1);
}

void TestLogManager::testRingIsBounded()
{
    for (int i = 0; i < 1005; ++i) LogManager::instance().addLog(QString("line %1").arg(i));
    const QStringList logs = LogManager::instance().logs();
    QCOMPARE(logs.size(), 1000);
    QVERIFY(logs.first().endsWith("line 5"));
    QVERIFY(logs.last().endsWith("line 1004"));
}

void TestLogManager::testEntriesFromOtherThreads()
{
    QSignalSpy spy(&LogManager::instance(), &LogManager::logAdded);
    QThread* t = QThread::create([]() { LogManager::instance().addLog("from worker", "WARN"); });
    t->start();
    QVERIFY(t->wait(5000));
    delete t;

    // Re-posted to the owning thread
    QVERIFY(spy.count() == 1 || spy.wait(2000));
    QVERIFY(spy.first().at(0).toString().endsWith("[WARN] from worker"));
}

void TestLogManager::testRotation()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = QDir(tmp.path()).filePath("media_converter.log");

    // Missing file needs nothing
    QVERIFY(LogManager::rotateIfLarger(path, 10));

    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("0123456789ABCDEF");
    f.close();

    QVERIFY(LogManager::rotateIfLarger(path, 64));
    QVERIFY(QFile::exists(path));

    QFile old(path + ".1");
    QVERIFY(old.open(QIODevice::WriteOnly));
    old.write("older session");
    old.close();

    QVERIFY(LogManager::rotateIfLarger(path, 10));
    QVERIFY(!QFile::exists(path));
    QFile rotated(path + ".1");
    QVERIFY(rotated.open(QIODevice::ReadOnly));
    QCOMPARE(rotated.readAll(), QByteArray("0123456789ABCDEF"));
}

void TestLogManager::testViewerFilter()
{
    const QString warn = "[10:00:00.000] [WARN] Fast copy disabled";
    const QString debug = "[10:00:00.000] [DEBUG] ffmpeg -y";
    QVERIFY(LogViewerWidget::passesFilter(warn, LogManager::Level::Info));
    QVERIFY(!LogViewerWidget::passesFilter(warn, LogManager::Level::Error));
    QVERIFY(!LogViewerWidget::passesFilter(debug, LogManager::Level::Info));
    QVERIFY(LogViewerWidget::passesFilter("untagged text", LogManager::Level::Error));

    QCOMPARE(LogViewerWidget::colorToken(LogManager::Level::Ok), QString("success"));
    QCOMPARE(LogViewerWidget::colorToken(LogManager::Level::Fatal), QString("error"));
    for (int l = int(LogManager::Level::Debug); l <= int(LogManager::Level::Fatal); ++l) {
        QVERIFY(ThemeManager::tokenNames().contains(LogViewerWidget::colorToken(static_cast<LogManager::Level>(l))));
    }
}

QTEST_GUILESS_MAIN(TestLogManager)
#include "test_log_manager.moc"
