#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

enum class MediaKind { Video, Photo, Unknown };

// Common helpers for checking file types across the UI.
// Extensions are passed without the leading dot and compared case-insensitively.
bool isImageFile(const QString& ext);
bool isVideoFile(const QString& ext);

MediaKind mediaKindForPath(const QString& path);
QString mediaKindName(MediaKind kind);

// Target containers offered in the format pickers
const QStringList& outputVideoFormats();
const QStringList& outputImageFormats();
