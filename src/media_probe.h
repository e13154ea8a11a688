#pragma once
#include <QString>
#include <QtGlobal>

namespace MediaInfo {
struct MediaDetails {
    double durationSec = -1.0;   // -1 when the container does not report it
    QString videoCodec;
    QString audioCodec;
    int width = 0;
    int height = 0;
    QString formatName;          // e.g. "mov,mp4,m4a,3gp,3g2,mj2"
    qint64 sizeBytes = -1;

    bool hasVideo() const { return !videoCodec.isEmpty(); }
};

// Probes a media file for duration, codecs, resolution and container.
// Returns true on success. On failure, returns false and optionally fills errorMessage.
bool probeMediaFile(const QString& filePath, MediaDetails& out, QString* errorMessage = nullptr);

// "clip.mp4: 01:23 | h264/aac | 1920x1080 | 12.3 MB"
QString summaryLine(const QString& name, const MediaDetails& d);
}
