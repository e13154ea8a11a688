#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>
#include <QPair>

// Every option that shapes an ffmpeg invocation. Numeric fields use sentinels
// for "not applied": 0 for sizes, -1 for trim points, 1.0 for speed.
struct ConversionSettings {
    QString outVideoFormat = "mp4";
    QString outImageFormat = "jpg";
    int crf = 23;
    QString encoderPreset = "medium";
    QString portrait = "off";
    int imageQuality = 90;
    bool overwrite = false;
    bool fastCopy = false;

    double trimStart = -1.0;
    double trimEnd = -1.0;
    bool merge = false;
    QString mergeName = "merged";

    int resizeWidth = 0;
    int resizeHeight = 0;
    int cropWidth = 0;
    int cropHeight = 0;
    int cropX = 0;
    int cropY = 0;
    QString rotate = "0";
    double speed = 1.0;

    QString watermarkPath;
    QString watermarkPosition = "bottom_right";
    int watermarkOpacity = 80;   // percent
    int watermarkScale = 30;     // percent of the watermark's own size

    QString textWatermark;
    QString textPosition = "bottom_right";
    int textSize = 24;
    QString textColor = "white";
    bool textBox = false;
    QString textBoxColor = "black";
    int textBoxOpacity = 50;
    QString textFont;

    QString videoCodec = "auto";
    QString hwEncoder = "auto";

    bool stripMetadata = false;
    bool copyMetadata = true;
    QString metaTitle;
    QString metaComment;
    QString metaAuthor;
    QString metaCopyright;

    bool hasTrimStart() const { return trimStart >= 0.0; }
    bool hasTrimEnd() const { return trimEnd >= 0.0; }
    bool hasSpeedChange() const;
    // Watermark path set but the file does not exist
    bool hasMissingWatermark() const;

    // Flat option-name -> scalar map used by presets and the QML bridge
    QVariantMap toPresetMap() const;
    // Starts from defaults; keys missing from the map keep their default value
    static ConversionSettings fromPresetMap(const QVariantMap& map);

    // Non-fatal problems worth reporting before a run (missing font, watermark...)
    QStringList validationWarnings() const;
};

// Choice tables: stable id plus an untranslated label for the pickers.
namespace ConversionOptions {

using Choice = QPair<QString, const char*>;

const QVector<Choice>& portraitChoices();
const QVector<Choice>& rotateChoices();
const QVector<Choice>& positionChoices();
const QVector<Choice>& codecChoices();
const QVector<Choice>& hwChoices();
const QStringList& encoderPresets();

bool isValidChoice(const QVector<Choice>& choices, const QString& id);

// Portrait id -> mode ("crop"/"blur") and target size; false for "off" or unknown ids
bool portraitTarget(const QString& id, QString& mode, int& width, int& height);

// ffmpeg filter for a rotation id; empty for no rotation
QString rotateFilter(const QString& id);

// overlay x:y expression for a position id (main W/H, overlay w/h)
QString overlayPosition(const QString& id);
// drawtext x/y expressions for a position id (text tw/th)
QString textPosition(const QString& id);

} // namespace ConversionOptions
