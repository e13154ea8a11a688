#include "conversion_settings.h"
#include "ui/file_type_helpers.h"
#include "utils.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QDir>

#include <cmath>

namespace {

QString expandHome(const QString& path)
{
    if (path.startsWith("~/")) return QDir::home().filePath(path.mid(2));
    return path;
}

// Presets written by hand or by older builds may store numbers as strings;
// an empty string means "not set".
int readInt(const QVariantMap& map, const char* key, int fallback, int unset)
{
    if (!map.contains(key)) return fallback;
    const QVariant v = map.value(key);
    if (v.typeId() == QMetaType::QString) {
        bool ok = false;
        const int parsed = Utils::parseInt(v.toString(), &ok);
        return ok ? parsed : unset;
    }
    bool ok = false;
    const int parsed = v.toInt(&ok);
    return ok ? parsed : fallback;
}

double readSeconds(const QVariantMap& map, const char* key)
{
    if (!map.contains(key)) return -1.0;
    const QVariant v = map.value(key);
    bool ok = false;
    double parsed = 0.0;
    if (v.typeId() == QMetaType::QString) parsed = Utils::parseTimeToSeconds(v.toString(), &ok);
    else parsed = v.toDouble(&ok);
    return (ok && parsed >= 0.0) ? parsed : -1.0;
}

double readSpeed(const QVariantMap& map, const char* key)
{
    if (!map.contains(key)) return 1.0;
    const QVariant v = map.value(key);
    bool ok = false;
    const double parsed = v.typeId() == QMetaType::QString ? Utils::parseDouble(v.toString(), &ok) : v.toDouble(&ok);
    return (ok && parsed > 0.0) ? parsed : 1.0;
}

QString readString(const QVariantMap& map, const char* key, const QString& fallback)
{
    return map.contains(key) ? map.value(key).toString() : fallback;
}

bool readBool(const QVariantMap& map, const char* key, bool fallback)
{
    return map.contains(key) ? map.value(key).toBool() : fallback;
}

QString readChoice(const QVariantMap& map, const char* key, const QVector<ConversionOptions::Choice>& choices, const QString& fallback)
{
    const QString id = readString(map, key, fallback).trimmed();
    return ConversionOptions::isValidChoice(choices, id) ? id : fallback;
}

QString readFormat(const QVariantMap& map, const char* key, const QStringList& formats, const QString& fallback)
{
    const QString fmt = readString(map, key, fallback).trimmed().toLower();
    return formats.contains(fmt) ? fmt : fallback;
}

QVariant sizeOrEmpty(int value)
{
    return value > 0 ? QVariant(value) : QVariant(QString());
}

QVariant secondsOrEmpty(double value)
{
    return value >= 0.0 ? QVariant(value) : QVariant(QString());
}

} // namespace

bool ConversionSettings::hasSpeedChange() const
{
    return speed > 0.0 && std::abs(speed - 1.0) >= 0.001;
}

QVariantMap ConversionSettings::toPresetMap() const
{
    QVariantMap m;
    m["out_video_fmt"] = outVideoFormat;
    m["out_image_fmt"] = outImageFormat;
    m["crf"] = crf;
    m["preset"] = encoderPreset;
    m["portrait"] = portrait;
    m["img_quality"] = imageQuality;
    m["overwrite"] = overwrite;
    m["fast_copy"] = fastCopy;
    m["trim_start"] = secondsOrEmpty(trimStart);
    m["trim_end"] = secondsOrEmpty(trimEnd);
    m["merge"] = merge;
    m["merge_name"] = mergeName;
    m["resize_w"] = sizeOrEmpty(resizeWidth);
    m["resize_h"] = sizeOrEmpty(resizeHeight);
    m["crop_w"] = sizeOrEmpty(cropWidth);
    m["crop_h"] = sizeOrEmpty(cropHeight);
    m["crop_x"] = cropX;
    m["crop_y"] = cropY;
    m["rotate"] = rotate;
    m["speed"] = speed;
    m["wm_path"] = watermarkPath;
    m["wm_pos"] = watermarkPosition;
    m["wm_opacity"] = watermarkOpacity;
    m["wm_scale"] = watermarkScale;
    m["text_wm"] = textWatermark;
    m["text_pos"] = textPosition;
    m["text_size"] = textSize;
    m["text_color"] = textColor;
    m["text_box"] = textBox;
    m["text_box_color"] = textBoxColor;
    m["text_box_opacity"] = textBoxOpacity;
    m["text_font"] = textFont;
    m["codec"] = videoCodec;
    m["hw"] = hwEncoder;
    m["strip_metadata"] = stripMetadata;
    m["copy_metadata"] = copyMetadata;
    m["meta_title"] = metaTitle;
    m["meta_comment"] = metaComment;
    m["meta_author"] = metaAuthor;
    m["meta_copyright"] = metaCopyright;
    return m;
}

ConversionSettings ConversionSettings::fromPresetMap(const QVariantMap& map)
{
    using namespace ConversionOptions;
    ConversionSettings s;
    const ConversionSettings d;

    s.outVideoFormat = readFormat(map, "out_video_fmt", outputVideoFormats(), d.outVideoFormat);
    s.outImageFormat = readFormat(map, "out_image_fmt", outputImageFormats(), d.outImageFormat);
    s.crf = std::clamp(readInt(map, "crf", d.crf, d.crf), 0, 63);
    s.encoderPreset = readString(map, "preset", d.encoderPreset).trimmed();
    if (!encoderPresets().contains(s.encoderPreset)) s.encoderPreset = d.encoderPreset;
    s.portrait = readChoice(map, "portrait", portraitChoices(), d.portrait);
    s.imageQuality = std::clamp(readInt(map, "img_quality", d.imageQuality, d.imageQuality), 1, 100);
    s.overwrite = readBool(map, "overwrite", d.overwrite);
    s.fastCopy = readBool(map, "fast_copy", d.fastCopy);

    s.trimStart = readSeconds(map, "trim_start");
    s.trimEnd = readSeconds(map, "trim_end");
    s.merge = readBool(map, "merge", d.merge);
    s.mergeName = readString(map, "merge_name", d.mergeName).trimmed();
    if (s.mergeName.isEmpty()) s.mergeName = d.mergeName;

    s.resizeWidth = std::max(0, readInt(map, "resize_w", 0, 0));
    s.resizeHeight = std::max(0, readInt(map, "resize_h", 0, 0));
    s.cropWidth = std::max(0, readInt(map, "crop_w", 0, 0));
    s.cropHeight = std::max(0, readInt(map, "crop_h", 0, 0));
    s.cropX = std::max(0, readInt(map, "crop_x", 0, 0));
    s.cropY = std::max(0, readInt(map, "crop_y", 0, 0));
    s.rotate = readChoice(map, "rotate", rotateChoices(), d.rotate);
    s.speed = readSpeed(map, "speed");

    s.watermarkPath = readString(map, "wm_path", QString()).trimmed();
    s.watermarkPosition = readChoice(map, "wm_pos", positionChoices(), d.watermarkPosition);
    s.watermarkOpacity = std::clamp(readInt(map, "wm_opacity", d.watermarkOpacity, d.watermarkOpacity), 0, 100);
    s.watermarkScale = std::clamp(readInt(map, "wm_scale", d.watermarkScale, d.watermarkScale), 1, 100);

    s.textWatermark = readString(map, "text_wm", QString()).trimmed();
    s.textPosition = readChoice(map, "text_pos", positionChoices(), d.textPosition);
    s.textSize = std::max(1, readInt(map, "text_size", d.textSize, d.textSize));
    s.textColor = readString(map, "text_color", d.textColor).trimmed();
    if (s.textColor.isEmpty()) s.textColor = d.textColor;
    s.textBox = readBool(map, "text_box", d.textBox);
    s.textBoxColor = readString(map, "text_box_color", d.textBoxColor).trimmed();
    if (s.textBoxColor.isEmpty()) s.textBoxColor = d.textBoxColor;
    s.textBoxOpacity = std::clamp(readInt(map, "text_box_opacity", d.textBoxOpacity, d.textBoxOpacity), 0, 100);
    s.textFont = readString(map, "text_font", QString()).trimmed();

    s.videoCodec = readChoice(map, "codec", codecChoices(), d.videoCodec);
    s.hwEncoder = readChoice(map, "hw", hwChoices(), d.hwEncoder);

    s.stripMetadata = readBool(map, "strip_metadata", d.stripMetadata);
    s.copyMetadata = readBool(map, "copy_metadata", d.copyMetadata);
    s.metaTitle = readString(map, "meta_title", QString()).trimmed();
    s.metaComment = readString(map, "meta_comment", QString()).trimmed();
    s.metaAuthor = readString(map, "meta_author", QString()).trimmed();
    s.metaCopyright = readString(map, "meta_copyright", QString()).trimmed();
    return s;
}

bool ConversionSettings::hasMissingWatermark() const
{
    return !watermarkPath.trimmed().isEmpty() && !QFileInfo::exists(expandHome(watermarkPath.trimmed()));
}

QStringList ConversionSettings::validationWarnings() const
{
    QStringList out;
    if (hasMissingWatermark()) {
        out << QCoreApplication::translate("ConversionSettings", "Watermark file not found: %1").arg(watermarkPath);
    }
    if (!textFont.isEmpty() && !QFileInfo::exists(expandHome(textFont))) {
        out << QCoreApplication::translate("ConversionSettings", "Font file not found: %1").arg(textFont);
    }
    if (hasTrimStart() && hasTrimEnd() && trimEnd <= trimStart) {
        out << QCoreApplication::translate("ConversionSettings", "Trim end is not after trim start; the end point will be ignored.");
    }
    return out;
}

namespace ConversionOptions {

const QVector<Choice>& portraitChoices()
{
    static const QVector<Choice> c = {
        {"off",       QT_TRANSLATE_NOOP("ConversionOptions", "Off")},
        {"crop_1080", QT_TRANSLATE_NOOP("ConversionOptions", "9:16 (1080x1920) - crop")},
        {"blur_1080", QT_TRANSLATE_NOOP("ConversionOptions", "9:16 (1080x1920) - blur")},
        {"crop_720",  QT_TRANSLATE_NOOP("ConversionOptions", "9:16 (720x1280) - crop")},
        {"blur_720",  QT_TRANSLATE_NOOP("ConversionOptions", "9:16 (720x1280) - blur")},
    };
    return c;
}

const QVector<Choice>& rotateChoices()
{
    static const QVector<Choice> c = {
        {"0",     QT_TRANSLATE_NOOP("ConversionOptions", "No rotation")},
        {"cw90",  QT_TRANSLATE_NOOP("ConversionOptions", "90° right")},
        {"ccw90", QT_TRANSLATE_NOOP("ConversionOptions", "90° left")},
        {"180",   QT_TRANSLATE_NOOP("ConversionOptions", "180°")},
    };
    return c;
}

const QVector<Choice>& positionChoices()
{
    static const QVector<Choice> c = {
        {"top_left",     QT_TRANSLATE_NOOP("ConversionOptions", "Top left")},
        {"top_right",    QT_TRANSLATE_NOOP("ConversionOptions", "Top right")},
        {"bottom_left",  QT_TRANSLATE_NOOP("ConversionOptions", "Bottom left")},
        {"bottom_right", QT_TRANSLATE_NOOP("ConversionOptions", "Bottom right")},
        {"center",       QT_TRANSLATE_NOOP("ConversionOptions", "Center")},
    };
    return c;
}

const QVector<Choice>& codecChoices()
{
    static const QVector<Choice> c = {
        {"auto", QT_TRANSLATE_NOOP("ConversionOptions", "Auto")},
        {"h264", QT_TRANSLATE_NOOP("ConversionOptions", "H.264 (AVC)")},
        {"h265", QT_TRANSLATE_NOOP("ConversionOptions", "H.265 (HEVC)")},
        {"av1",  QT_TRANSLATE_NOOP("ConversionOptions", "AV1")},
        {"vp9",  QT_TRANSLATE_NOOP("ConversionOptions", "VP9 (WebM)")},
    };
    return c;
}

const QVector<Choice>& hwChoices()
{
    static const QVector<Choice> c = {
        {"auto",   QT_TRANSLATE_NOOP("ConversionOptions", "Auto")},
        {"cpu",    QT_TRANSLATE_NOOP("ConversionOptions", "CPU only")},
        {"nvidia", QT_TRANSLATE_NOOP("ConversionOptions", "NVIDIA (NVENC)")},
        {"intel",  QT_TRANSLATE_NOOP("ConversionOptions", "Intel (QSV)")},
        {"amd",    QT_TRANSLATE_NOOP("ConversionOptions", "AMD (AMF)")},
    };
    return c;
}

const QStringList& encoderPresets()
{
    static const QStringList p = {
        "ultrafast","superfast","veryfast","faster","fast","medium","slow","slower","veryslow"
    };
    return p;
}

bool isValidChoice(const QVector<Choice>& choices, const QString& id)
{
    for (const Choice& c : choices) {
        if (c.first == id) return true;
    }
    return false;
}

bool portraitTarget(const QString& id, QString& mode, int& width, int& height)
{
    if (id == "crop_1080") { mode = "crop"; width = 1080; height = 1920; return true; }
    if (id == "blur_1080") { mode = "blur"; width = 1080; height = 1920; return true; }
    if (id == "crop_720")  { mode = "crop"; width = 720;  height = 1280; return true; }
    if (id == "blur_720")  { mode = "blur"; width = 720;  height = 1280; return true; }
    return false;
}

QString rotateFilter(const QString& id)
{
    if (id == "cw90") return QStringLiteral("transpose=1");
    if (id == "ccw90") return QStringLiteral("transpose=2");
    if (id == "180") return QStringLiteral("transpose=1,transpose=1");
    return QString();
}

QString overlayPosition(const QString& id)
{
    if (id == "top_right") return QStringLiteral("W-w-10:10");
    if (id == "bottom_left") return QStringLiteral("10:H-h-10");
    if (id == "bottom_right") return QStringLiteral("W-w-10:H-h-10");
    if (id == "center") return QStringLiteral("(W-w)/2:(H-h)/2");
    return QStringLiteral("10:10");
}

QString textPosition(const QString& id)
{
    if (id == "top_right") return QStringLiteral("W-tw-10:10");
    if (id == "bottom_left") return QStringLiteral("10:H-th-10");
    if (id == "bottom_right") return QStringLiteral("W-tw-10:H-th-10");
    if (id == "center") return QStringLiteral("(W-tw)/2:(H-th)/2");
    return QStringLiteral("10:10");
}

} // namespace ConversionOptions
