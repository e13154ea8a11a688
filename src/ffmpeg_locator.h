#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

namespace FfmpegTools {

// Executable name with the platform suffix ("ffmpeg" / "ffmpeg.exe")
QString executableName(const QString& tool);

// Search order: next to the application, <appdir>/bin, $FFMPEG_ROOT/bin, PATH.
// Returns an empty string when nothing usable is found.
QString findFfmpeg();
// Prefers the folder of the given ffmpeg, then the same search as findFfmpeg.
QString findFfprobe(const QString& ffmpegPath);

bool isUsableBinary(const QString& path);

// Encoder names from "ffmpeg -hide_banner -encoders" output
QSet<QString> parseEncoderList(const QString& text);
// Runs ffmpeg; an empty set when it cannot be run or exits non-zero.
QSet<QString> detectEncoders(const QString& ffmpegPath, int timeoutMs = 10000);

// Short tags for the encoder families present (NVENC, QSV, AMF, x265, AV1, VP9)
QStringList encoderSummary(const QSet<QString>& caps);

} // namespace FfmpegTools
