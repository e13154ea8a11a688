#pragma once

#include <QObject>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QThread>
#include <QTime>
#include <QUrl>
#include <QVariantMap>

#include "conversion_settings.h"
#include "media_probe.h"
#include "preset_store.h"
#include "progress_parser.h"
#include "queue_model.h"

class MediaConverterWorker;

// State shared by the widgets window and the QML front-end: the queue, presets,
// ffmpeg discovery, media info of the selected item and the worker thread.
// Dialogs are left to the front-ends; this class only reports through signals.
class ConverterBackend : public QObject {
    Q_OBJECT
    Q_PROPERTY(QueueModel* queue READ queue CONSTANT)
    Q_PROPERTY(QString ffmpegPath READ ffmpegPath WRITE setFfmpegPath NOTIFY ffmpegPathChanged)
    Q_PROPERTY(QString ffprobePath READ ffprobePath NOTIFY ffmpegPathChanged)
    Q_PROPERTY(QString outputDir READ outputDir WRITE setOutputDir NOTIFY outputDirChanged)
    Q_PROPERTY(QString encoderInfo READ encoderInfo NOTIFY encodersChanged)
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)
    Q_PROPERTY(double fileProgress READ fileProgress NOTIFY progressChanged)
    Q_PROPERTY(double totalProgress READ totalProgress NOTIFY progressChanged)
    Q_PROPERTY(QString fileProgressText READ fileProgressText NOTIFY progressChanged)
    Q_PROPERTY(QString totalProgressText READ totalProgressText NOTIFY progressChanged)
    Q_PROPERTY(QStringList presetNames READ presetNames NOTIFY presetsChanged)
    Q_PROPERTY(QVariantMap mediaInfo READ mediaInfo NOTIFY mediaInfoChanged)
    Q_PROPERTY(QVariantMap defaultSettings READ defaultSettings CONSTANT)
public:
    enum class StartResult {
        Started,
        AlreadyRunning,
        FfmpegMissing,
        QueueEmpty,
        OutputDirFailed,
    };
    Q_ENUM(StartResult)

    // presetFile empty -> PresetStore::defaultFilePath()
    explicit ConverterBackend(const QString& presetFile = QString(), QObject* parent = nullptr);
    ~ConverterBackend() override;

    QueueModel* queue() { return &m_queue; }
    PresetStore& presets() { return m_presets; }

    QString ffmpegPath() const { return m_ffmpegPath; }
    void setFfmpegPath(const QString& path);
    QString ffprobePath() const { return m_ffprobePath; }
    QString outputDir() const { return m_outputDir; }
    void setOutputDir(const QString& dir);
    QString encoderInfo() const { return m_encoderInfo; }
    QSet<QString> encoderCaps() const { return m_encoderCaps; }

    bool isRunning() const { return m_running; }
    QString statusText() const { return m_statusText; }
    double fileProgress() const { return m_fileProgress; }
    double totalProgress() const { return m_totalProgress; }
    QString fileProgressText() const { return m_fileProgressText; }
    QString totalProgressText() const { return m_totalProgressText; }
    QStringList presetNames() const { return m_presets.names(); }
    QVariantMap mediaInfo() const { return m_mediaInfo; }
    QVariantMap defaultSettings() const { return ConversionSettings().toPresetMap(); }

    static QString defaultOutputDir();
    // "[HH:MM:SS] LEVEL: message"
    static QString formatLogLine(const QString& level, const QString& message, const QTime& time);
    static QString formatFileProgress(const ProgressSnapshot& s);
    static QString formatTotalProgress(const ProgressSnapshot& s);
    // Keys name, duration, codec, resolution, size, container; a dash placeholder when unknown
    static QVariantMap mediaInfoMap(const QString& name, const MediaInfo::MediaDetails* d);
    // Raw form values that are filled in but do not parse (resize, crop, speed)
    static QStringList inputWarnings(const QVariantMap& raw);

    StartResult startConversion(const ConversionSettings& settings);

public slots:
    void refreshEncoders();
    int addFiles(const QStringList& paths);
    int addFolder(const QString& dir);
    // Local files and folders from drag and drop or the QML file dialogs
    int addUrls(const QList<QUrl>& urls);
    void removeRows(const QList<int>& rows);
    void clearQueue();
    void selectQueueIndex(int row);

    // QML entry point: raw form map, validated and converted
    int startConversionMap(const QVariantMap& raw);
    void stopConversion();

    // Presets: callers confirm overwrite/deletion first
    bool savePreset(const QString& name, const QVariantMap& values);
    QVariantMap loadPreset(const QString& name);
    bool deletePreset(const QString& name);
    bool presetExists(const QString& name) const { return m_presets.contains(name.trimmed()); }

    bool openOutputDir();
    void appendLog(const QString& level, const QString& message);

signals:
    void ffmpegPathChanged();
    void outputDirChanged();
    void encodersChanged();
    void runningChanged();
    void statusTextChanged();
    void progressChanged();
    void presetsChanged();
    void mediaInfoChanged();
    void ffmpegMissing();
    void logAppended(const QString& level, const QString& line);
    void queueFinished(bool stopped);

private slots:
    void onWorkerStatus(const QString& text);
    void onWorkerProgress(const ProgressSnapshot& snapshot);
    void onQueueStarted(int totalFiles, double totalDurationSec);
    void onQueueFinished(bool stopped);

private:
    void setStatus(const QString& text);
    void resetProgress();
    void requestMediaInfo(const QueueItem& item);

    QueueModel m_queue;
    PresetStore m_presets;
    QString m_ffmpegPath;
    QString m_ffprobePath;
    QString m_outputDir;
    QSet<QString> m_encoderCaps;
    QString m_encoderInfo;

    QThread m_thread;
    MediaConverterWorker* m_worker = nullptr;
    bool m_running = false;

    QString m_statusText;
    double m_fileProgress = 0.0;
    double m_totalProgress = 0.0;
    QString m_fileProgressText;
    QString m_totalProgressText;

    QHash<QString, MediaInfo::MediaDetails> m_infoCache;
    QSet<QString> m_infoPending;
    QString m_selectedPath;
    QVariantMap m_mediaInfo;
};
