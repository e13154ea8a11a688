#include "converter_backend.h"
#include "ffmpeg_locator.h"
#include "log_manager.h"
#include "media_converter_worker.h"
#include "utils.h"

#include <QDesktopServices>
#include <QDir>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QSettings>
#include <QUrl>
#include <QtConcurrent>

namespace {

struct ProbeResult {
    bool ok = false;
    MediaInfo::MediaDetails details;
    QString error;
};

const QString kDash = QString::fromUtf8("—");

bool filledButInvalidSize(const QVariantMap& raw, const char* key)
{
    const QString text = raw.value(key).toString().trimmed();
    if (text.isEmpty()) return false;
    bool ok = false;
    const int v = Utils::parseInt(text, &ok);
    return !ok || v <= 0;
}

} // namespace

ConverterBackend::ConverterBackend(const QString& presetFile, QObject* parent)
    : QObject(parent)
    , m_presets(presetFile)
{
    qRegisterMetaType<ProgressSnapshot>("ProgressSnapshot");

    QString err;
    if (!m_presets.load(&err)) {
        appendLog("WARN", tr("Presets file is damaged, using built-in presets: %1").arg(err));
    }

    QSettings settings;
    m_ffmpegPath = settings.value("Paths/Ffmpeg").toString();
    if (!FfmpegTools::isUsableBinary(m_ffmpegPath)) m_ffmpegPath = FfmpegTools::findFfmpeg();
    if (!m_ffmpegPath.isEmpty()) m_ffprobePath = FfmpegTools::findFfprobe(m_ffmpegPath);
    m_outputDir = settings.value("Paths/OutputDir", defaultOutputDir()).toString();

    m_mediaInfo = mediaInfoMap(QString(), nullptr);
    m_statusText = tr("Ready");
    resetProgress();

    m_worker = new MediaConverterWorker();
    m_worker->moveToThread(&m_thread);
    connect(&m_thread, &QThread::finished, m_worker, &QObject::deleteLater);
    connect(m_worker, &MediaConverterWorker::logLine, this, &ConverterBackend::appendLog);
    connect(m_worker, &MediaConverterWorker::statusChanged, this, &ConverterBackend::onWorkerStatus);
    connect(m_worker, &MediaConverterWorker::progressChanged, this, &ConverterBackend::onWorkerProgress);
    connect(m_worker, &MediaConverterWorker::queueStarted, this, &ConverterBackend::onQueueStarted);
    connect(m_worker, &MediaConverterWorker::queueFinished, this, &ConverterBackend::onQueueFinished);
    m_thread.start(QThread::LowPriority);
}

ConverterBackend::~ConverterBackend()
{
    if (m_running && m_worker) {
        QMetaObject::invokeMethod(m_worker, &MediaConverterWorker::stop, Qt::BlockingQueuedConnection);
    }
    m_thread.quit();
    m_thread.wait();
}

QString ConverterBackend::defaultOutputDir()
{
    return QDir::home().filePath("Videos/converted");
}

void ConverterBackend::setFfmpegPath(const QString& path)
{
    const QString p = path.trimmed();
    if (p == m_ffmpegPath) return;
    m_ffmpegPath = p;
    m_ffprobePath = p.isEmpty() ? QString() : FfmpegTools::findFfprobe(p);
    QSettings().setValue("Paths/Ffmpeg", m_ffmpegPath);
    emit ffmpegPathChanged();
}

void ConverterBackend::setOutputDir(const QString& dir)
{
    const QString d = dir.trimmed();
    if (d == m_outputDir) return;
    m_outputDir = d;
    QSettings().setValue("Paths/OutputDir", m_outputDir);
    emit outputDirChanged();
}

QString ConverterBackend::formatLogLine(const QString& level, const QString& message, const QTime& time)
{
    return QString("[%1] %2: %3").arg(time.toString("HH:mm:ss"), level, message);
}

QString ConverterBackend::formatFileProgress(const ProgressSnapshot& s)
{
    if (s.fileFraction < 0.0) return tr("File: --");
    const int pct = qBound(0, int(s.fileFraction * 100.0), 100);
    return tr("File: %1% • %2 / %3 • ETA %4")
        .arg(QString("%1").arg(pct, 2, 10, QChar('0')),
             Utils::formatTime(s.outTimeSec),
             Utils::formatTime(s.fileDurationSec),
             Utils::formatTime(s.fileEtaSec));
}

QString ConverterBackend::formatTotalProgress(const ProgressSnapshot& s)
{
    const int pct = qBound(0, int(s.totalFraction * 100.0), 100);
    return tr("Total: %1% • ETA %2")
        .arg(QString("%1").arg(pct, 2, 10, QChar('0')), Utils::formatTime(s.totalEtaSec));
}

QVariantMap ConverterBackend::mediaInfoMap(const QString& name, const MediaInfo::MediaDetails* d)
{
    QVariantMap m;
    m["name"] = name.isEmpty() ? kDash : name;
    if (!d) {
        m["duration"] = kDash;
        m["codec"] = kDash;
        m["resolution"] = kDash;
        m["size"] = kDash;
        m["container"] = kDash;
        return m;
    }
    m["duration"] = Utils::formatTime(d->durationSec);
    m["codec"] = QString("%1 / %2").arg(d->videoCodec.isEmpty() ? QStringLiteral("-") : d->videoCodec,
                                        d->audioCodec.isEmpty() ? QStringLiteral("-") : d->audioCodec);
    m["resolution"] = (d->width > 0 && d->height > 0) ? QString("%1x%2").arg(d->width).arg(d->height) : kDash;
    m["size"] = Utils::formatBytes(d->sizeBytes);
    m["container"] = d->formatName.isEmpty() ? kDash : d->formatName;
    return m;
}

QStringList ConverterBackend::inputWarnings(const QVariantMap& raw)
{
    QStringList out;
    if (filledButInvalidSize(raw, "resize_w")) out << tr("Invalid resize width.");
    if (filledButInvalidSize(raw, "resize_h")) out << tr("Invalid resize height.");
    if (filledButInvalidSize(raw, "crop_w")) out << tr("Invalid crop width.");
    if (filledButInvalidSize(raw, "crop_h")) out << tr("Invalid crop height.");

    const QString speed = raw.value("speed").toString().trimmed();
    if (!speed.isEmpty()) {
        bool ok = false;
        const double v = Utils::parseDouble(speed, &ok);
        if (!ok || v <= 0.0) out << tr("Invalid speed.");
    }
    return out;
}

void ConverterBackend::appendLog(const QString& level, const QString& message)
{
    LogManager::instance().addLog(message, level);
    emit logAppended(level, formatLogLine(level, message, QTime::currentTime()));
}

void ConverterBackend::setStatus(const QString& text)
{
    if (m_statusText == text) return;
    m_statusText = text;
    emit statusTextChanged();
}

void ConverterBackend::resetProgress()
{
    m_fileProgress = 0.0;
    m_totalProgress = 0.0;
    m_fileProgressText = tr("File: --");
    m_totalProgressText = formatTotalProgress(ProgressSnapshot());
    emit progressChanged();
}

void ConverterBackend::refreshEncoders()
{
    if (m_ffmpegPath.isEmpty()) {
        const QString found = FfmpegTools::findFfmpeg();
        if (!found.isEmpty()) setFfmpegPath(found);
    }
    if (m_ffmpegPath.isEmpty()) {
        appendLog("ERROR", tr("FFmpeg not found. Set the path to ffmpeg or add it to PATH."));
        return;
    }
    m_ffprobePath = FfmpegTools::findFfprobe(m_ffmpegPath);

    m_encoderCaps = FfmpegTools::detectEncoders(m_ffmpegPath);
    const QStringList summary = FfmpegTools::encoderSummary(m_encoderCaps);
    m_encoderInfo = tr("Available: %1").arg(summary.isEmpty() ? tr("none") : summary.join(", "));
    emit encodersChanged();

    appendLog("OK", tr("FFmpeg found: %1").arg(m_ffmpegPath));
    // Media info comes from libavformat; ffprobe is only reported
    if (!m_ffprobePath.isEmpty()) appendLog("INFO", tr("FFprobe found: %1").arg(m_ffprobePath));
}

int ConverterBackend::addFiles(const QStringList& paths)
{
    const int added = m_queue.addPaths(paths);
    if (added > 0) appendLog("OK", tr("Added %1 files").arg(added));
    else appendLog("WARN", tr("No supported files to add."));
    return added;
}

int ConverterBackend::addFolder(const QString& dir)
{
    if (dir.trimmed().isEmpty()) return 0;
    const int added = m_queue.addFolder(dir);
    if (added > 0) appendLog("OK", tr("Added %1 files").arg(added));
    else appendLog("WARN", tr("No supported files in the folder."));
    return added;
}

int ConverterBackend::addUrls(const QList<QUrl>& urls)
{
    int added = 0;
    QStringList files;
    for (const QUrl& url : urls) {
        if (!url.isLocalFile()) continue;
        const QString path = url.toLocalFile();
        if (QFileInfo(path).isDir()) added += addFolder(path);
        else files << path;
    }
    if (!files.isEmpty()) added += addFiles(files);
    return added;
}

void ConverterBackend::removeRows(const QList<int>& rows)
{
    if (m_running) return;
    const int removed = m_queue.removeRowsList(rows);
    if (removed > 0) appendLog("INFO", tr("Removed %1").arg(removed));
}

void ConverterBackend::clearQueue()
{
    if (m_running) return;
    m_queue.clear();
    selectQueueIndex(-1);
    appendLog("INFO", tr("Queue cleared"));
}

void ConverterBackend::selectQueueIndex(int row)
{
    if (row < 0 || row >= m_queue.count()) {
        m_selectedPath.clear();
        m_mediaInfo = mediaInfoMap(QString(), nullptr);
        emit mediaInfoChanged();
        return;
    }

    const QueueItem item = m_queue.itemAt(row);
    m_selectedPath = item.path;
    auto it = m_infoCache.constFind(item.path);
    if (it != m_infoCache.constEnd()) {
        m_mediaInfo = mediaInfoMap(item.displayName, &it.value());
    } else {
        m_mediaInfo = mediaInfoMap(item.displayName, nullptr);
        requestMediaInfo(item);
    }
    emit mediaInfoChanged();
}

void ConverterBackend::requestMediaInfo(const QueueItem& item)
{
    if (m_infoPending.contains(item.path)) return;
    m_infoPending.insert(item.path);

    const QString path = item.path;
    const QString name = item.displayName;
    auto* watcher = new QFutureWatcher<ProbeResult>(this);
    connect(watcher, &QFutureWatcher<ProbeResult>::finished, this, [this, watcher, path, name]() {
        const ProbeResult r = watcher->result();
        watcher->deleteLater();
        m_infoPending.remove(path);
        if (!r.ok) {
            appendLog("WARN", tr("Cannot read media info for %1: %2").arg(name, r.error));
            return;
        }
        m_infoCache.insert(path, r.details);
        if (m_selectedPath == path) {
            m_mediaInfo = mediaInfoMap(name, &r.details);
            emit mediaInfoChanged();
        }
    });
    watcher->setFuture(QtConcurrent::run([path]() {
        ProbeResult r;
        r.ok = MediaInfo::probeMediaFile(path, r.details, &r.error);
        return r;
    }));
}

ConverterBackend::StartResult ConverterBackend::startConversion(const ConversionSettings& settings)
{
    if (m_running) return StartResult::AlreadyRunning;

    if (!FfmpegTools::isUsableBinary(m_ffmpegPath)) {
        appendLog("ERROR", tr("FFmpeg not found. Set the path to ffmpeg."));
        emit ffmpegMissing();
        return StartResult::FfmpegMissing;
    }
    if (m_queue.count() == 0) return StartResult::QueueEmpty;

    const QString outDir = m_outputDir.isEmpty() ? defaultOutputDir() : m_outputDir;
    if (!QDir().mkpath(outDir)) {
        appendLog("ERROR", tr("Cannot create the output folder: %1").arg(outDir));
        return StartResult::OutputDirFailed;
    }

    m_running = true;
    emit runningChanged();
    resetProgress();
    setStatus(tr("Conversion started..."));

    const QVector<QueueItem> items = m_queue.items();
    const QString ffmpeg = m_ffmpegPath;
    const QSet<QString> caps = m_encoderCaps;
    MediaConverterWorker* worker = m_worker;
    QMetaObject::invokeMethod(m_worker, [worker, ffmpeg, caps, items, settings, outDir]() {
        worker->setFfmpegPath(ffmpeg);
        worker->setEncoderCaps(caps);
        worker->start(items, settings, outDir);
    }, Qt::QueuedConnection);
    return StartResult::Started;
}

int ConverterBackend::startConversionMap(const QVariantMap& raw)
{
    const StartResult result = startConversion(ConversionSettings::fromPresetMap(raw));
    if (result == StartResult::Started) {
        for (const QString& w : inputWarnings(raw)) appendLog("WARN", w);
    }
    return static_cast<int>(result);
}

void ConverterBackend::stopConversion()
{
    if (!m_running) return;
    setStatus(tr("Stopping after the current file..."));
    QMetaObject::invokeMethod(m_worker, &MediaConverterWorker::stop, Qt::QueuedConnection);
}

bool ConverterBackend::savePreset(const QString& name, const QVariantMap& values)
{
    const QString key = name.trimmed();
    if (!m_presets.upsert(key, values)) return false;

    QString err;
    if (!m_presets.save(&err)) {
        appendLog("ERROR", tr("Cannot save presets: %1").arg(err));
        emit presetsChanged();
        return false;
    }
    QSettings().setValue("Ui/LastPreset", key);
    emit presetsChanged();
    appendLog("OK", tr("Preset saved: %1").arg(key));
    return true;
}

QVariantMap ConverterBackend::loadPreset(const QString& name)
{
    if (!m_presets.contains(name)) return QVariantMap();
    QSettings().setValue("Ui/LastPreset", name);
    appendLog("OK", tr("Preset loaded: %1").arg(name));
    return m_presets.preset(name);
}

bool ConverterBackend::deletePreset(const QString& name)
{
    if (!m_presets.remove(name)) return false;
    QString err;
    if (!m_presets.save(&err)) appendLog("ERROR", tr("Cannot save presets: %1").arg(err));
    emit presetsChanged();
    appendLog("OK", tr("Preset deleted: %1").arg(name));
    return true;
}

bool ConverterBackend::openOutputDir()
{
    const QString dir = m_outputDir.isEmpty() ? defaultOutputDir() : m_outputDir;
    if (!QDir().mkpath(dir)) {
        appendLog("ERROR", tr("Cannot create the output folder: %1").arg(dir));
        return false;
    }
    return QDesktopServices::openUrl(QUrl::fromLocalFile(dir));
}

void ConverterBackend::onWorkerStatus(const QString& text)
{
    setStatus(text);
}

void ConverterBackend::onWorkerProgress(const ProgressSnapshot& snapshot)
{
    m_fileProgress = qMax(0.0, snapshot.fileFraction);
    m_totalProgress = qBound(0.0, snapshot.totalFraction, 1.0);
    m_fileProgressText = formatFileProgress(snapshot);
    m_totalProgressText = formatTotalProgress(snapshot);
    emit progressChanged();
}

void ConverterBackend::onQueueStarted(int totalFiles, double totalDurationSec)
{
    resetProgress();
    appendLog("INFO", tr("Queue: %1 files, total duration %2").arg(totalFiles).arg(Utils::formatTime(totalDurationSec > 0 ? totalDurationSec : -1.0)));
}

void ConverterBackend::onQueueFinished(bool stopped)
{
    m_running = false;
    emit runningChanged();
    setStatus(stopped ? tr("Stopped.") : tr("Done."));
    emit queueFinished(stopped);
}
