#include <QtTest>
#include "../src/progress_parser.h"

class TestProgressParser : public QObject {
    Q_OBJECT
private slots:
    void testBlockBoundaries();
    void testTimeKeys();
    void testIgnoresGarbage();
    void testSnapshotWithSpeed();
    void testSnapshotWithoutSpeed();
    void testSnapshotUnknownDuration();
    void testReset();
};

void TestProgressParser::testBlockBoundaries()
{
    FfmpegProgressParser p;
    QVERIFY(!p.feedLine("frame=120"));
    QVERIFY(!p.feedLine("out_time_us=4000000"));
    QVERIFY(!p.feedLine("speed=2.0x"));
    QVERIFY(p.feedLine("progress=continue"));
    QVERIFY(!p.finished());
    QCOMPARE(p.outTimeSec(), 4.0);
    QCOMPARE(p.speed(), 2.0);

    QVERIFY(p.feedLine("progress=end"));
    QVERIFY(p.finished());
}

void TestProgressParser::testTimeKeys()
{
    FfmpegProgressParser p;
    p.feedLine("out_time_ms=1500000");
    QCOMPARE(p.outTimeSec(), 1.5);
    p.feedLine("out_time=00:01:02.250000");
    QCOMPARE(p.outTimeSec(), 62.25);
    p.feedLine("  out_time_us = 3000000  ");
    QCOMPARE(p.outTimeSec(), 3.0);
}

void TestProgressParser::testIgnoresGarbage()
{
    FfmpegProgressParser p;
    p.feedLine("out_time_us=2000000");
    p.feedLine("speed=1.5x");

    QVERIFY(!p.feedLine("no equals sign here"));
    QVERIFY(!p.feedLine("=value"));
    QVERIFY(!p.feedLine("out_time_us=N/A"));
    QVERIFY(!p.feedLine("out_time=N/A"));
    QVERIFY(!p.feedLine("speed=N/A"));
    QVERIFY(!p.feedLine(""));

    QCOMPARE(p.outTimeSec(), 2.0);
    QCOMPARE(p.speed(), 1.5);
}

void TestProgressParser::testSnapshotWithSpeed()
{
    FfmpegProgressParser p;
    p.feedLine("out_time_us=30000000");
    p.feedLine("speed=2x");
    p.feedLine("progress=continue");

    ProgressContext ctx;
    ctx.fileDurationSec = 60.0;
    ctx.doneDurationSec = 60.0;
    ctx.totalDurationSec = 180.0;
    ctx.doneFiles = 1;
    ctx.totalFiles = 3;

    const ProgressSnapshot s = p.snapshot(ctx, 15.0, 45.0);
    QCOMPARE(s.fileFraction, 0.5);
    QCOMPARE(s.outTimeSec, 30.0);
    QCOMPARE(s.fileDurationSec, 60.0);
    // (60 - 30) / 2
    QCOMPARE(s.fileEtaSec, 15.0);
    QCOMPARE(s.totalFraction, 0.5);
    QCOMPARE(s.totalEtaSec, 45.0);
}

void TestProgressParser::testSnapshotWithoutSpeed()
{
    FfmpegProgressParser p;
    p.feedLine("out_time_us=25000000");

    ProgressContext ctx;
    ctx.fileDurationSec = 100.0;
    ctx.totalDurationSec = 100.0;
    ctx.totalFiles = 1;

    const ProgressSnapshot s = p.snapshot(ctx, 10.0, 10.0);
    QCOMPARE(s.fileFraction, 0.25);
    QCOMPARE(s.fileEtaSec, 30.0);
    QCOMPARE(s.totalFraction, 0.25);
    QCOMPARE(s.totalEtaSec, 30.0);

    // Output past the probed duration is clamped
    p.feedLine("out_time_us=120000000");
    const ProgressSnapshot over = p.snapshot(ctx, 10.0, 10.0);
    QCOMPARE(over.fileFraction, 1.0);
    QCOMPARE(over.totalFraction, 1.0);
}

void TestProgressParser::testSnapshotUnknownDuration()
{
    FfmpegProgressParser p;
    p.feedLine("out_time_us=5000000");

    ProgressContext ctx;
    ctx.doneFiles = 1;
    ctx.totalFiles = 4;

    const ProgressSnapshot s = p.snapshot(ctx, 2.0, 8.0);
    QVERIFY(s.fileFraction < 0.0);
    QVERIFY(s.fileEtaSec < 0.0);
    // Falls back to counting files
    QCOMPARE(s.totalFraction, 0.25);
    QCOMPARE(s.totalEtaSec, 24.0);
}

void TestProgressParser::testReset()
{
    FfmpegProgressParser p;
    p.feedLine("out_time_us=5000000");
    p.feedLine("speed=3x");
    p.feedLine("progress=end");
    p.reset();
    QCOMPARE(p.outTimeSec(), 0.0);
    QCOMPARE(p.speed(), 0.0);
    QVERIFY(!p.finished());
}

QTEST_APPLESS_MAIN(TestProgressParser)
#include "test_progress_parser.moc"
