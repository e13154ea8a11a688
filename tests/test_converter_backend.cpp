#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QStandardPaths>
#include <QSignalSpy>
#include <QSettings>
#include <QFileInfo>
#include <QFile>
#include <QDir>
#include <QUrl>

#include "../src/converter_backend.h"

namespace {

const char* kFakeFfmpeg =
    "#!/bin/sh\n"
    "for last; do :; done\n"
    "echo 'out_time_us=250000'\n"
    "echo 'progress=continue'\n"
    "echo 'progress=end'\n"
    ": > \"$last\"\n"
    "exit 0\n";

} // namespace

class TestConverterBackend : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void init();

    void testFormatLogLine();
    void testProgressTexts();
    void testMediaInfoMap();
    void testInputWarnings();

    void testRefreshEncodersLogsBinaries();
    void testStartWithoutFfmpeg();
    void testStartWithEmptyQueue();
    void testQueueEditing();
    void testPresets();
    void testConvertsQueueEndToEnd();

private:
    QString presetFile() const { return QDir(m_tmp.path()).filePath("presets.json"); }
    QString makeInput(const QString& name);
    QString fakeFfmpeg();

    QTemporaryDir m_tmp;
};

QString TestConverterBackend::makeInput(const QString& name)
{
    const QString p = QDir(m_tmp.path()).filePath("in/" + name);
    QDir().mkpath(QFileInfo(p).absolutePath());
    QFile f(p);
    if (f.open(QIODevice::WriteOnly)) f.write("junk");
    return p;
}

QString TestConverterBackend::fakeFfmpeg()
{
    const QString path = QDir(m_tmp.path()).filePath("bin/ffmpeg");
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        f.write(kFakeFfmpeg);
        f.close();
        f.setPermissions(f.permissions() | QFileDevice::ExeOwner | QFileDevice::ExeUser);
    }
    return path;
}

void TestConverterBackend::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName("MediaConverterTests");
    QCoreApplication::setApplicationName("test_converter_backend");
    QVERIFY(m_tmp.isValid());
    qRegisterMetaType<ProgressSnapshot>("ProgressSnapshot");
}

void TestConverterBackend::init()
{
    QSettings().clear();
}

void TestConverterBackend::testFormatLogLine()
{
    QCOMPARE(ConverterBackend::formatLogLine("WARN", "disk almost full", QTime(9, 5, 7)),
             QString("[09:05:07] WARN: disk almost full"));
}

void TestConverterBackend::testProgressTexts()
{
    ProgressSnapshot s;
    s.fileFraction = 0.05;
    s.outTimeSec = 3.0;
    s.fileDurationSec = 60.0;
    s.fileEtaSec = 57.0;
    s.totalFraction = 0.5;
    s.totalEtaSec = 90.0;
    QCOMPARE(ConverterBackend::formatFileProgress(s), QString::fromUtf8("File: 05% • 00:03 / 01:00 • ETA 00:57"));
    QCOMPARE(ConverterBackend::formatTotalProgress(s), QString::fromUtf8("Total: 50% • ETA 01:30"));

    s.fileFraction = -1.0;
    QCOMPARE(ConverterBackend::formatFileProgress(s), QString("File: --"));

    QCOMPARE(ConverterBackend::formatTotalProgress(ProgressSnapshot()), QString::fromUtf8("Total: 00% • ETA --:--"));
}

void TestConverterBackend::testMediaInfoMap()
{
    const QString dash = QString::fromUtf8("—");
    const QVariantMap empty = ConverterBackend::mediaInfoMap(QString(), nullptr);
    QCOMPARE(empty.value("name").toString(), dash);
    QCOMPARE(empty.value("codec").toString(), dash);
    QCOMPARE(empty.value("container").toString(), dash);

    MediaInfo::MediaDetails d;
    d.durationSec = 75.0;
    d.videoCodec = "h264";
    d.audioCodec = "aac";
    d.width = 1920;
    d.height = 1080;
    d.formatName = "matroska,webm";
    d.sizeBytes = 2048;
    const QVariantMap m = ConverterBackend::mediaInfoMap("clip.mkv", &d);
    QCOMPARE(m.value("name").toString(), QString("clip.mkv"));
    QCOMPARE(m.value("duration").toString(), QString("01:15"));
    QCOMPARE(m.value("codec").toString(), QString("h264 / aac"));
    QCOMPARE(m.value("resolution").toString(), QString("1920x1080"));
    QCOMPARE(m.value("size").toString(), QString("2.0 KB"));
    QCOMPARE(m.value("container").toString(), QString("matroska,webm"));

    // Audio only
    MediaInfo::MediaDetails audio;
    audio.audioCodec = "mp3";
    const QVariantMap a = ConverterBackend::mediaInfoMap("song.mp3", &audio);
    QCOMPARE(a.value("codec").toString(), QString("- / mp3"));
    QCOMPARE(a.value("resolution").toString(), dash);
}

void TestConverterBackend::testInputWarnings()
{
    QVERIFY(ConverterBackend::inputWarnings(QVariantMap{{"resize_w", ""}, {"speed", "1.5"}}).isEmpty());

    const QStringList w = ConverterBackend::inputWarnings(
        QVariantMap{{"resize_w", "wide"}, {"crop_h", "0"}, {"speed", "-1"}});
    QCOMPARE(w.size(), 3);
}

void TestConverterBackend::testStartWithoutFfmpeg()
{
    ConverterBackend backend(presetFile());
    backend.setFfmpegPath(QDir(m_tmp.path()).filePath("missing/ffmpeg"));
    backend.addFiles({makeInput("a.mp4")});

    QSignalSpy spyMissing(&backend, &ConverterBackend::ffmpegMissing);
    QCOMPARE(backend.startConversion(ConversionSettings()), ConverterBackend::StartResult::FfmpegMissing);
    QCOMPARE(spyMissing.count(), 1);
    QVERIFY(!backend.isRunning());
}

void TestConverterBackend::testStartWithEmptyQueue()
{
#ifdef Q_OS_WIN
    QSKIP("The fake ffmpeg is a POSIX shell script");
#endif
    ConverterBackend backend(presetFile());
    backend.setFfmpegPath(fakeFfmpeg());
    QCOMPARE(backend.startConversion(ConversionSettings()), ConverterBackend::StartResult::QueueEmpty);
    QCOMPARE(backend.startConversionMap(QVariantMap()), int(ConverterBackend::StartResult::QueueEmpty));
    QVERIFY(!backend.isRunning());
}

void TestConverterBackend::testQueueEditing()
{
    ConverterBackend backend(presetFile());
    QSignalSpy spyLog(&backend, &ConverterBackend::logAppended);

    QCOMPARE(backend.addFiles({makeInput("a.mp4"), makeInput("notes.txt")}), 1);
    QCOMPARE(backend.addUrls({QUrl::fromLocalFile(makeInput("b.png")), QUrl("https://example.com/c.mp4")}), 1);
    QCOMPARE(backend.queue()->count(), 2);
    QVERIFY(spyLog.count() >= 2);
    QVERIFY(spyLog.first().at(1).toString().contains("OK: Added 1 files"));

    backend.removeRows({0});
    QCOMPARE(backend.queue()->count(), 1);

    QSignalSpy spyInfo(&backend, &ConverterBackend::mediaInfoChanged);
    backend.clearQueue();
    QCOMPARE(backend.queue()->count(), 0);
    QCOMPARE(spyInfo.count(), 1);
    QCOMPARE(backend.mediaInfo().value("name").toString(), QString::fromUtf8("—"));
}

void TestConverterBackend::testPresets()
{
    QFile::remove(presetFile());
    ConverterBackend backend(presetFile());
    const int builtIns = backend.presetNames().size();
    QSignalSpy spyPresets(&backend, &ConverterBackend::presetsChanged);

    QVariantMap values = backend.defaultSettings();
    values["crf"] = 30;
    QVERIFY(backend.savePreset(" Archive ", values));
    QCOMPARE(spyPresets.count(), 1);
    QVERIFY(backend.presetExists("Archive"));
    QCOMPARE(backend.presetNames().size(), builtIns + 1);
    QVERIFY(QFile::exists(presetFile()));
    QCOMPARE(QSettings().value("Ui/LastPreset").toString(), QString("Archive"));

    QCOMPARE(backend.loadPreset("Archive").value("crf").toInt(), 30);
    QVERIFY(backend.loadPreset("Nope").isEmpty());

    QVERIFY(!backend.savePreset("  ", values));
    QVERIFY(backend.deletePreset("Archive"));
    QVERIFY(!backend.deletePreset("Archive"));
    QCOMPARE(spyPresets.count(), 2);

    ConverterBackend reloaded(presetFile());
    QVERIFY(!reloaded.presetExists("Archive"));
}

void TestConverterBackend::testRefreshEncodersLogsBinaries()
{
#ifdef Q_OS_WIN
    QSKIP("The fake ffmpeg is a POSIX shell script");
#endif
    // Lists no encoders and writes nothing
    const QString path = QDir(m_tmp.path()).filePath("quiet/ffmpeg");
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write("#!/bin/sh\nexit 0\n");
    f.close();
    f.setPermissions(f.permissions() | QFileDevice::ExeOwner | QFileDevice::ExeUser);

    ConverterBackend backend(presetFile());
    backend.setFfmpegPath(path);
    QSignalSpy spyLog(&backend, &ConverterBackend::logAppended);
    backend.refreshEncoders();

    bool found = false;
    for (const QList<QVariant>& args : spyLog) {
        const QString level = args.at(0).toString();
        const QString line = args.at(1).toString();
        if (level == "OK" && line.contains(path)) found = true;
        // A missing ffprobe never blocks conversion
        QVERIFY2(!(level == "WARN" && line.contains("FFprobe")), qPrintable(line));
    }
    QVERIFY(found);
}

void TestConverterBackend::testConvertsQueueEndToEnd()
{
#ifdef Q_OS_WIN
    QSKIP("The fake ffmpeg is a POSIX shell script");
#endif
    const QString outDir = QDir(m_tmp.path()).filePath("out");
    ConverterBackend backend(presetFile());
    backend.setFfmpegPath(fakeFfmpeg());
    backend.setOutputDir(outDir);
    QCOMPARE(backend.addFiles({makeInput("trip.mov"), makeInput("scan.bmp")}), 2);

    QSignalSpy spyFinished(&backend, &ConverterBackend::queueFinished);
    QSignalSpy spyLog(&backend, &ConverterBackend::logAppended);

    QVariantMap raw = backend.defaultSettings();
    raw["resize_w"] = "abc";
    QCOMPARE(backend.startConversionMap(raw), int(ConverterBackend::StartResult::Started));
    QVERIFY(backend.isRunning());
    QCOMPARE(backend.startConversion(ConversionSettings()), ConverterBackend::StartResult::AlreadyRunning);

    QVERIFY(spyFinished.wait(15000));
    QCOMPARE(spyFinished.first().at(0).toBool(), false);
    QVERIFY(!backend.isRunning());
    QCOMPARE(backend.statusText(), QString("Done."));
    QCOMPARE(backend.totalProgress(), 1.0);

    QVERIFY(QFileInfo::exists(QDir(outDir).filePath("trip.mp4")));
    QVERIFY(QFileInfo::exists(QDir(outDir).filePath("scan.jpg")));

    bool warned = false;
    for (const QList<QVariant>& args : spyLog) {
        if (args.at(1).toString().contains("Invalid resize width.")) warned = true;
    }
    QVERIFY(warned);
}

QTEST_GUILESS_MAIN(TestConverterBackend)
#include "test_converter_backend.moc"
