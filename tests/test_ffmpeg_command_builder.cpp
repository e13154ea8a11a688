#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include <QFileInfo>

#include "../src/ffmpeg_command_builder.h"

class TestFfmpegCommandBuilder : public QObject {
    Q_OBJECT
private slots:
    void init();
    void testDefaultVideoCommand();
    void testHardwareEncoderPreferred();
    void testWebmForcesVp9();
    void testGifCommand();
    void testFiltersAndSpeed();
    void testTrim();
    void testFastCopyCommand();
    void testFastCopyDecision();
    void testImageCommand();
    void testTextFilter();
    void testWatermark();
    void testPortrait();
    void testMetadataArgs();
    void testMergeCommand();
    void testMergeCopyDecision();
    void testConcatListEscaping();
    void testWithProgressOutput();
    void testEncoderSelectionFallbacks();
    void testEscaping();

private:
    FfmpegCommandBuilder makeBuilder(const QSet<QString>& caps);
    QStringList m_warnings;
};

FfmpegCommandBuilder TestFfmpegCommandBuilder::makeBuilder(const QSet<QString>& caps)
{
    return FfmpegCommandBuilder(caps, [this](const QString& level, const QString& message) {
        if (level == "WARN") m_warnings << message;
    });
}

void TestFfmpegCommandBuilder::init()
{
    m_warnings.clear();
}

void TestFfmpegCommandBuilder::testDefaultVideoCommand()
{
    const FfmpegCommandBuilder b = makeBuilder({"libx264"});
    const QStringList args = b.buildVideoCommand("/in/a.mov", "/out/a.mp4", ConversionSettings(), false);
    const QStringList expected = {
        "-n", "-i", "/in/a.mov",
        "-map", "0:v:0?", "-map", "0:a:0?",
        "-c:v", "libx264", "-preset", "medium", "-crf", "23", "-pix_fmt", "yuv420p",
        "-c:a", "aac", "-b:a", "192k",
        "-movflags", "+faststart",
        "-map_metadata", "0",
        "/out/a.mp4"
    };
    QCOMPARE(args, expected);
    QVERIFY(m_warnings.isEmpty());

    ConversionSettings overwrite;
    overwrite.overwrite = true;
    QCOMPARE(b.buildVideoCommand("/in/a.mov", "/out/a.mp4", overwrite, false).first(), QString("-y"));
}

void TestFfmpegCommandBuilder::testHardwareEncoderPreferred()
{
    const FfmpegCommandBuilder b = makeBuilder({"libx264", "h264_nvenc"});
    const QStringList args = b.buildVideoCommand("/in/a.mov", "/out/a.mp4", ConversionSettings(), false);
    QVERIFY(args.contains("h264_nvenc"));
    // x264 presets are not passed to hardware encoders
    QVERIFY(!args.contains("-preset"));
    const int cq = args.indexOf("-cq");
    QVERIFY(cq > 0);
    QCOMPARE(args.at(cq + 1), QString("23"));

    ConversionSettings cpuOnly;
    cpuOnly.hwEncoder = "cpu";
    QVERIFY(b.buildVideoCommand("/in/a.mov", "/out/a.mp4", cpuOnly, false).contains("libx264"));
}

void TestFfmpegCommandBuilder::testWebmForcesVp9()
{
    const FfmpegCommandBuilder b = makeBuilder({});
    ConversionSettings s;
    s.outVideoFormat = "webm";
    s.videoCodec = "h264";
    const QStringList args = b.buildVideoCommand("/in/a.mov", "/out/a.webm", s, false);

    const int cv = args.indexOf("-c:v");
    QCOMPARE(args.at(cv + 1), QString("libvpx-vp9"));
    QVERIFY(args.contains("libopus"));
    QVERIFY(!args.contains("+faststart"));
    QVERIFY(!args.contains("-pix_fmt"));
    QCOMPARE(m_warnings.size(), 1);
    QVERIFY(m_warnings.first().contains("VP9"));
}

void TestFfmpegCommandBuilder::testGifCommand()
{
    const FfmpegCommandBuilder b = makeBuilder({});
    const QStringList args = b.buildVideoCommand("/in/a.mp4", "/out/a.gif", ConversionSettings(), false);
    const QStringList expected = {
        "-n", "-i", "/in/a.mp4",
        "-vf", "fps=12,scale=640:-1:flags=lanczos", "-map", "0:v:0?",
        "-an",
        "-map_metadata", "0",
        "/out/a.gif"
    };
    QCOMPARE(args, expected);
}

void TestFfmpegCommandBuilder::testFiltersAndSpeed()
{
    const FfmpegCommandBuilder b = makeBuilder({"libx264"});
    ConversionSettings s;
    s.resizeWidth = 1280;
    s.rotate = "cw90";
    s.speed = 2.0;
    s.cropWidth = 640;
    s.cropHeight = 360;
    s.cropX = 10;
    s.cropY = 20;

    const QStringList args = b.buildVideoCommand("/in/a.mov", "/out/a.mp4", s, false);
    const int vf = args.indexOf("-vf");
    QVERIFY(vf > 0);
    QCOMPARE(args.at(vf + 1), QString("scale=1280:-1,crop=640:360:10:20,transpose=1,setpts=PTS/2"));
    const int af = args.indexOf("-filter:a");
    QVERIFY(af > 0);
    QCOMPARE(args.at(af + 1), QString("atempo=2.000"));

    ConversionSettings fast;
    fast.speed = 4.0;
    QCOMPARE(FfmpegCommandBuilder::audioSpeedFilter(fast), QString("atempo=2.000,atempo=2.000"));
    QVERIFY(FfmpegCommandBuilder::audioSpeedFilter(ConversionSettings()).isEmpty());
}

void TestFfmpegCommandBuilder::testTrim()
{
    const FfmpegCommandBuilder b = makeBuilder({});
    ConversionSettings s;
    s.trimStart = 5.0;
    s.trimEnd = 65.0;
    QCOMPARE(b.trimArgs(s), QStringList({"-ss", "5.000", "-to", "65.000"}));

    const QStringList args = b.buildVideoCommand("/in/a.mov", "/out/a.mp4", s, false);
    QCOMPARE(args.mid(0, 7), QStringList({"-n", "-i", "/in/a.mov", "-ss", "5.000", "-to", "65.000"}));

    s.trimEnd = 3.0;
    QCOMPARE(b.trimArgs(s), QStringList({"-ss", "5.000"}));
    QCOMPARE(m_warnings.size(), 1);

    ConversionSettings endOnly;
    endOnly.trimEnd = 10.0;
    QCOMPARE(b.trimArgs(endOnly), QStringList({"-to", "10.000"}));
}

void TestFfmpegCommandBuilder::testFastCopyCommand()
{
    const FfmpegCommandBuilder b = makeBuilder({});
    const QStringList args = b.buildVideoCommand("/in/a.mp4", "/out/a.mp4", ConversionSettings(), true);
    const QStringList expected = {
        "-n", "-i", "/in/a.mp4",
        "-map", "0", "-c", "copy",
        "-map_metadata", "0",
        "-movflags", "+faststart",
        "/out/a.mp4"
    };
    QCOMPARE(args, expected);
}

void TestFfmpegCommandBuilder::testFastCopyDecision()
{
    MediaInfo::MediaDetails h264;
    h264.videoCodec = "h264";
    MediaInfo::MediaDetails vp9;
    vp9.videoCodec = "vp9";

    QVERIFY(FfmpegCommandBuilder::fastCopyAllowed("/in/a.mp4", "mp4", &h264, false, false).allowed);
    QVERIFY(FfmpegCommandBuilder::fastCopyAllowed("/in/a.MKV", "mkv", nullptr, false, false).allowed);

    const auto container = FfmpegCommandBuilder::fastCopyAllowed("/in/a.mov", "mp4", &h264, false, false);
    QVERIFY(!container.allowed);
    QVERIFY(!container.reason.isEmpty());

    QVERIFY(!FfmpegCommandBuilder::fastCopyAllowed("/in/a.gif", "gif", nullptr, false, false).allowed);
    QVERIFY(!FfmpegCommandBuilder::fastCopyAllowed("/in/a.mp4", "mp4", &h264, true, false).allowed);
    QVERIFY(!FfmpegCommandBuilder::fastCopyAllowed("/in/a.mp4", "mp4", &h264, false, true).allowed);
    QVERIFY(!FfmpegCommandBuilder::fastCopyAllowed("/in/a.mp4", "mp4", &vp9, false, false).allowed);

    QVERIFY(FfmpegCommandBuilder::containerSupportsCodec("webm", "vp9"));
    QVERIFY(!FfmpegCommandBuilder::containerSupportsCodec("webm", "h264"));
    QVERIFY(FfmpegCommandBuilder::containerSupportsCodec("mkv", "anything"));
}

void TestFfmpegCommandBuilder::testImageCommand()
{
    const FfmpegCommandBuilder b = makeBuilder({});
    ConversionSettings s;
    s.imageQuality = 90;
    QCOMPARE(b.buildImageCommand("/in/p.png", "/out/p.jpg", s),
             QStringList({"-n", "-i", "/in/p.png", "-map_metadata", "0", "-q:v", "5", "/out/p.jpg"}));

    s.imageQuality = 80;
    const QStringList webp = b.buildImageCommand("/in/p.png", "/out/p.webp", s);
    QCOMPARE(webp.mid(webp.size() - 3), QStringList({"-q:v", "80", "/out/p.webp"}));

    QVERIFY(!b.buildImageCommand("/in/p.jpg", "/out/p.png", s).contains("-q:v"));

    s.resizeHeight = 720;
    s.rotate = "180";
    const QStringList resized = b.buildImageCommand("/in/p.jpg", "/out/p.png", s);
    const int vf = resized.indexOf("-vf");
    QVERIFY(vf > 0);
    QCOMPARE(resized.at(vf + 1), QString("scale=-1:720,transpose=1,transpose=1"));
}

void TestFfmpegCommandBuilder::testTextFilter()
{
    ConversionSettings s;
    QVERIFY(FfmpegCommandBuilder::textFilter(s).isEmpty());

    s.textWatermark = "Hello: it's";
    QCOMPARE(FfmpegCommandBuilder::textFilter(s),
             QString("drawtext=text='Hello\\: it\\'s':x=W-tw-10:y=H-th-10:fontsize=24:fontcolor=white"));

    s.textBox = true;
    s.textPosition = "top_left";
    QCOMPARE(FfmpegCommandBuilder::textFilter(s),
             QString("drawtext=text='Hello\\: it\\'s':x=10:y=10:fontsize=24:fontcolor=white:box=1:boxcolor=black@0.50"));

    // Text containing %1 must survive untouched
    ConversionSettings pct;
    pct.textWatermark = "100%1";
    QVERIFY(FfmpegCommandBuilder::textFilter(pct).contains("text='100%1'"));
}

void TestFfmpegCommandBuilder::testWatermark()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString logo = QDir(tmp.path()).filePath("logo.png");
    QFile f(logo);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.close();

    const FfmpegCommandBuilder b = makeBuilder({"libx264"});
    ConversionSettings s;
    s.watermarkPath = logo;

    const FfmpegCommandBuilder::FilterSpec spec = b.videoFilterSpec(s, "mp4");
    QCOMPARE(spec.option, QString("-filter_complex"));
    QCOMPARE(spec.graph, QString("[0:v]null[vbase];"
                                 "[1:v]format=rgba,scale=iw*0.3:ih*0.3,colorchannelmixer=aa=0.8[wm];"
                                 "[vbase][wm]overlay=W-w-10:H-h-10[vout]"));
    QCOMPARE(spec.outputLabel, QString("[vout]"));
    QCOMPARE(spec.extraInputs, QStringList({logo}));

    const QStringList args = b.buildVideoCommand("/in/a.mov", "/out/a.mp4", s, false);
    QCOMPARE(args.mid(0, 5), QStringList({"-n", "-i", "/in/a.mov", "-i", logo}));
    const int map = args.indexOf("-map");
    QCOMPARE(args.at(map + 1), QString("[vout]"));

    ConversionSettings missing;
    missing.watermarkPath = QDir(tmp.path()).filePath("nope.png");
    const FfmpegCommandBuilder::FilterSpec none = b.videoFilterSpec(missing, "mp4");
    QVERIFY(none.option.isEmpty());
    QVERIFY(!none.filtersUsed);
    QCOMPARE(m_warnings.size(), 1);
}

void TestFfmpegCommandBuilder::testPortrait()
{
    const FfmpegCommandBuilder b = makeBuilder({});
    ConversionSettings crop;
    crop.portrait = "crop_1080";
    crop.resizeWidth = 540;
    const FfmpegCommandBuilder::FilterSpec cropSpec = b.videoFilterSpec(crop, "mp4");
    QCOMPARE(cropSpec.option, QString("-vf"));
    QVERIFY(cropSpec.graph.startsWith("scale='if(gt(a,9/16),-2,1080)':'if(gt(a,9/16),1920,-2)',crop=1080:1920,setsar=1,"));
    QVERIFY(cropSpec.graph.endsWith("scale=540:-1"));

    ConversionSettings blur;
    blur.portrait = "blur_720";
    const FfmpegCommandBuilder::FilterSpec blurSpec = b.videoFilterSpec(blur, "mp4");
    QCOMPARE(blurSpec.option, QString("-filter_complex"));
    QCOMPARE(blurSpec.outputLabel, QString("[vbase]"));
    QVERIFY(blurSpec.graph.contains("boxblur=20:1"));
    QVERIFY(blurSpec.graph.endsWith("[vbase]"));
}

void TestFfmpegCommandBuilder::testMetadataArgs()
{
    ConversionSettings s;
    QCOMPARE(FfmpegCommandBuilder::metadataArgs(s), QStringList({"-map_metadata", "0"}));

    s.copyMetadata = false;
    QVERIFY(FfmpegCommandBuilder::metadataArgs(s).isEmpty());

    s.stripMetadata = true;
    s.metaTitle = " Trip ";
    s.metaAuthor = "Olena";
    QCOMPARE(FfmpegCommandBuilder::metadataArgs(s),
             QStringList({"-map_metadata", "-1", "-metadata", "title=Trip", "-metadata", "artist=Olena"}));
}

void TestFfmpegCommandBuilder::testMergeCommand()
{
    const FfmpegCommandBuilder b = makeBuilder({"libx264"});
    const QStringList copy = b.buildMergeCommand("/tmp/list.txt", "/out/m.mp4", ConversionSettings(), true);
    const QStringList expected = {
        "-n", "-f", "concat", "-safe", "0", "-i", "/tmp/list.txt",
        "-map", "0", "-c", "copy",
        "-map_metadata", "0",
        "-movflags", "+faststart",
        "/out/m.mp4"
    };
    QCOMPARE(copy, expected);

    const QStringList encode = b.buildMergeCommand("/tmp/list.txt", "/out/m.mp4", ConversionSettings(), false);
    QCOMPARE(encode.mid(0, 7), QStringList({"-n", "-f", "concat", "-safe", "0", "-i", "/tmp/list.txt"}));
    QVERIFY(encode.contains("libx264"));
}

void TestFfmpegCommandBuilder::testMergeCopyDecision()
{
    MediaInfo::MediaDetails a;
    a.videoCodec = "h264";
    a.audioCodec = "aac";
    MediaInfo::MediaDetails other = a;
    other.videoCodec = "hevc";

    QHash<QString, MediaInfo::MediaDetails> infos;
    infos["/in/a.mp4"] = a;
    infos["/in/b.mp4"] = a;
    const QStringList inputs = {"/in/a.mp4", "/in/b.mp4"};

    QVERIFY(FfmpegCommandBuilder::mergeCopyAllowed(inputs, "mp4", infos, false, false, {}).allowed);
    QVERIFY(!FfmpegCommandBuilder::mergeCopyAllowed(inputs, "mkv", infos, false, false, {}).allowed);
    QVERIFY(!FfmpegCommandBuilder::mergeCopyAllowed(inputs, "mp4", infos, true, false, {}).allowed);
    QVERIFY(!FfmpegCommandBuilder::mergeCopyAllowed(inputs, "mp4", infos, false, false, {"-ss", "1.000"}).allowed);

    infos["/in/b.mp4"] = other;
    QVERIFY(!FfmpegCommandBuilder::mergeCopyAllowed(inputs, "mp4", infos, false, false, {}).allowed);

    infos.remove("/in/b.mp4");
    QVERIFY(!FfmpegCommandBuilder::mergeCopyAllowed(inputs, "mp4", infos, false, false, {}).allowed);
}

void TestFfmpegCommandBuilder::testConcatListEscaping()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString listPath = QDir(tmp.path()).filePath("list.txt");

    QString err;
    QVERIFY(FfmpegCommandBuilder::writeConcatList({"/videos/one.mp4", "/videos/it's.mp4"}, listPath, &err));

    QFile f(listPath);
    QVERIFY(f.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString content = QString::fromUtf8(f.readAll());
    QCOMPARE(content, QString("file '/videos/one.mp4'\nfile '/videos/it'\\''s.mp4'\n"));

    QVERIFY(!FfmpegCommandBuilder::writeConcatList({"/a.mp4"}, QDir(tmp.path()).filePath("no/such/dir/list.txt"), &err));
    QVERIFY(!err.isEmpty());
}

void TestFfmpegCommandBuilder::testWithProgressOutput()
{
    QCOMPARE(FfmpegCommandBuilder::withProgressOutput({"-y", "-i", "a.mov", "b.mp4"}),
             QStringList({"-y", "-progress", "pipe:1", "-nostats", "-hide_banner", "-i", "a.mov", "b.mp4"}));
    QVERIFY(FfmpegCommandBuilder::withProgressOutput({}).isEmpty());
}

void TestFfmpegCommandBuilder::testEncoderSelectionFallbacks()
{
    const FfmpegCommandBuilder b = makeBuilder({"libx264"});

    const FfmpegCommandBuilder::Encoder nv = b.selectEncoder("h264", "nvidia");
    QCOMPARE(nv.name, QString("libx264"));
    QVERIFY(!nv.hardware);
    QCOMPARE(m_warnings.size(), 1);

    const FfmpegCommandBuilder::Encoder hevc = b.selectEncoder("h265", "cpu");
    QCOMPARE(hevc.name, QString("libx264"));
    QCOMPARE(m_warnings.size(), 2);

    // Without detected encoders the CPU encoder is trusted
    const FfmpegCommandBuilder unknown = makeBuilder({});
    QCOMPARE(unknown.selectEncoder("h265", "auto").name, QString("libx265"));
    QCOMPARE(unknown.selectEncoder("av1", "auto").name, QString("libaom-av1"));

    const FfmpegCommandBuilder svt = makeBuilder({"libsvtav1", "av1_qsv"});
    QCOMPARE(svt.selectEncoder("av1", "cpu").name, QString("libsvtav1"));
    const FfmpegCommandBuilder::Encoder qsv = svt.selectEncoder("av1", "intel");
    QCOMPARE(qsv.name, QString("av1_qsv"));
    QVERIFY(qsv.hardware);

    QCOMPARE(FfmpegCommandBuilder::encoderQualityArgs("h264_qsv", 20), QStringList({"-global_quality", "20"}));
    QCOMPARE(FfmpegCommandBuilder::encoderQualityArgs("hevc_amf", 20),
             QStringList({"-rc", "cqp", "-qp_i", "20", "-qp_p", "20", "-qp_b", "20"}));
    QCOMPARE(FfmpegCommandBuilder::encoderQualityArgs("libvpx-vp9", 31), QStringList({"-crf", "31", "-b:v", "0"}));
}

void TestFfmpegCommandBuilder::testEscaping()
{
    QCOMPARE(FfmpegCommandBuilder::escapeFilterPath("C:\\Windows\\Fonts\\arial.ttf"), QString("C\\:/Windows/Fonts/arial.ttf"));
    QCOMPARE(FfmpegCommandBuilder::escapeDrawtext("a\\b"), QString("a\\\\b"));
}

QTEST_APPLESS_MAIN(TestFfmpegCommandBuilder)
#include "test_ffmpeg_command_builder.moc"
