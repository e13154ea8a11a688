#include "preset_store.h"
#include "log_manager.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

PresetStore::PresetStore(const QString& filePath)
    : m_filePath(filePath.isEmpty() ? defaultFilePath() : filePath)
    , m_presets(builtInPresets())
{
}

QString PresetStore::defaultFilePath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath("presets.json");
}

QMap<QString, QVariantMap> PresetStore::builtInPresets()
{
    QMap<QString, QVariantMap> p;
    p[QString::fromUtf8("H.264 • Balanced (MP4)")] = QVariantMap{
        {"out_video_fmt", "mp4"}, {"crf", 23}, {"preset", "medium"},
        {"codec", "h264"}, {"hw", "auto"}, {"fast_copy", false}};
    p[QString::fromUtf8("H.265 • Smaller size (MP4)")] = QVariantMap{
        {"out_video_fmt", "mp4"}, {"crf", 26}, {"preset", "slow"},
        {"codec", "h265"}, {"hw", "auto"}, {"fast_copy", false}};
    p[QString::fromUtf8("AV1 • Quality/size (MKV)")] = QVariantMap{
        {"out_video_fmt", "mkv"}, {"crf", 30}, {"preset", "medium"},
        {"codec", "av1"}, {"hw", "auto"}, {"fast_copy", false}};
    p[QString::fromUtf8("WebM • VP9 (Web)")] = QVariantMap{
        {"out_video_fmt", "webm"}, {"crf", 28}, {"preset", "slow"},
        {"codec", "vp9"}, {"hw", "auto"}, {"fast_copy", false}};
    p[QString::fromUtf8("GPU • NVENC H.264 (Fast)")] = QVariantMap{
        {"out_video_fmt", "mp4"}, {"crf", 23}, {"preset", "fast"},
        {"codec", "h264"}, {"hw", "nvidia"}, {"fast_copy", false}};
    p[QString::fromUtf8("Fast Copy (no re-encode)")] = QVariantMap{
        {"fast_copy", true}, {"codec", "auto"}, {"hw", "auto"}};
    p[QString::fromUtf8("GIF 480p")] = QVariantMap{
        {"out_video_fmt", "gif"}, {"crf", 23}, {"preset", "medium"},
        {"codec", "auto"}, {"fast_copy", false}, {"resize_w", "640"}, {"resize_h", ""}};
    p[QString::fromUtf8("Photo → JPG (90)")] = QVariantMap{
        {"out_image_fmt", "jpg"}, {"img_quality", 90}};
    p[QString::fromUtf8("Photo → WebP (80)")] = QVariantMap{
        {"out_image_fmt", "webp"}, {"img_quality", 80}};
    return p;
}

bool PresetStore::load(QString* errorMessage)
{
    m_presets = builtInPresets();

    QFile f(m_filePath);
    if (!f.exists()) return true;
    if (!f.open(QIODevice::ReadOnly)) {
        if (errorMessage) *errorMessage = QString("Cannot read %1: %2").arg(m_filePath, f.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        const QString reason = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                                            : QString("top level is not an object");
        if (errorMessage) *errorMessage = QString("Ignoring malformed preset file %1: %2").arg(m_filePath, reason);
        return false;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it.value().isObject()) continue;
        m_presets[it.key()] = it.value().toObject().toVariantMap();
    }
    LogManager::instance().addLog(QString("[Presets] Loaded %1 presets from %2").arg(m_presets.size()).arg(m_filePath), "DEBUG");
    return true;
}

bool PresetStore::save(QString* errorMessage) const
{
    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QJsonObject root;
    for (auto it = m_presets.constBegin(); it != m_presets.constEnd(); ++it) {
        root.insert(it.key(), QJsonObject::fromVariantMap(it.value()));
    }

    QSaveFile f(m_filePath);
    if (!f.open(QIODevice::WriteOnly)) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(m_filePath, f.errorString());
        return false;
    }
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(m_filePath, f.errorString());
        return false;
    }
    return true;
}

QStringList PresetStore::names() const
{
    QStringList out = m_presets.keys();
    out.sort(Qt::CaseInsensitive);
    return out;
}

bool PresetStore::upsert(const QString& name, const QVariantMap& values)
{
    const QString key = name.trimmed();
    if (key.isEmpty()) return false;
    m_presets[key] = values;
    return true;
}

bool PresetStore::remove(const QString& name)
{
    return m_presets.remove(name) > 0;
}
