#include "ui/file_type_helpers.h"

#include <QFileInfo>

namespace {

inline QString normalize(const QString& ext)
{
    QString lower = ext.toLower();
    if (lower.startsWith('.')) lower.remove(0, 1);
    return lower;
}

} // namespace

bool isImageFile(const QString& ext)
{
    static const QSet<QString> exts = {
        "jpg","jpeg","png","webp","bmp","tif","tiff","heic","heif"
    };
    return exts.contains(normalize(ext));
}

bool isVideoFile(const QString& ext)
{
    static const QSet<QString> exts = {
        "mov","mp4","mkv","webm","avi","m4v","flv","wmv","mts","m2ts"
    };
    return exts.contains(normalize(ext));
}

MediaKind mediaKindForPath(const QString& path)
{
    const QString ext = QFileInfo(path).suffix();
    if (isVideoFile(ext)) return MediaKind::Video;
    if (isImageFile(ext)) return MediaKind::Photo;
    return MediaKind::Unknown;
}

QString mediaKindName(MediaKind kind)
{
    switch (kind) {
        case MediaKind::Video: return QStringLiteral("video");
        case MediaKind::Photo: return QStringLiteral("photo");
        case MediaKind::Unknown: break;
    }
    return QString();
}

const QStringList& outputVideoFormats()
{
    static const QStringList formats = {"mp4","mkv","webm","mov","avi","gif"};
    return formats;
}

const QStringList& outputImageFormats()
{
    static const QStringList formats = {"jpg","png","webp","bmp","tiff"};
    return formats;
}
