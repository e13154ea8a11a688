#include <QtTest>
#include "../src/ui/file_type_helpers.h"

class TestFileTypeHelpers : public QObject {
    Q_OBJECT
private slots:
    void testExtensions();
    void testMediaKindForPath();
    void testOutputFormats();
};

void TestFileTypeHelpers::testExtensions()
{
    QVERIFY(isVideoFile("mp4"));
    QVERIFY(isVideoFile(".MKV"));
    QVERIFY(isVideoFile("m2ts"));
    QVERIFY(!isVideoFile("jpg"));

    QVERIFY(isImageFile("JPEG"));
    QVERIFY(isImageFile(".heic"));
    QVERIFY(!isImageFile("txt"));
    QVERIFY(!isImageFile(""));
}

void TestFileTypeHelpers::testMediaKindForPath()
{
    QCOMPARE(mediaKindForPath("/videos/Clip.MOV"), MediaKind::Video);
    QCOMPARE(mediaKindForPath("/photos/shot.webp"), MediaKind::Photo);
    QCOMPARE(mediaKindForPath("/docs/readme.txt"), MediaKind::Unknown);
    QCOMPARE(mediaKindForPath("/no/extension"), MediaKind::Unknown);

    QCOMPARE(mediaKindName(MediaKind::Video), QString("video"));
    QCOMPARE(mediaKindName(MediaKind::Photo), QString("photo"));
    QVERIFY(mediaKindName(MediaKind::Unknown).isEmpty());
}

void TestFileTypeHelpers::testOutputFormats()
{
    QCOMPARE(outputVideoFormats().first(), QString("mp4"));
    QVERIFY(outputVideoFormats().contains("gif"));
    QCOMPARE(outputImageFormats().first(), QString("jpg"));
    QVERIFY(outputImageFormats().contains("webp"));
}

QTEST_APPLESS_MAIN(TestFileTypeHelpers)
#include "test_file_type_helpers.moc"
