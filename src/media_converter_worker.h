#pragma once

#include <QObject>
#include <QProcess>
#include <QVector>
#include <QHash>
#include <QSet>
#include <QStringList>
#include <QElapsedTimer>
#include <QByteArray>

#include "conversion_settings.h"
#include "ffmpeg_command_builder.h"
#include "media_probe.h"
#include "progress_parser.h"
#include "queue_model.h"

// Runs the conversion queue one ffmpeg process at a time. Lives on its own
// thread; start()/stop() are meant to be invoked through queued calls.
class MediaConverterWorker : public QObject {
    Q_OBJECT
public:
    explicit MediaConverterWorker(QObject* parent=nullptr);

    void setFfmpegPath(const QString& path) { m_ffmpegPath = path; }
    void setEncoderCaps(const QSet<QString>& caps) { m_builder.setEncoderCaps(caps); }
    bool isRunning() const { return m_running; }

signals:
    void queueStarted(int totalFiles, double totalDurationSec);
    void statusChanged(const QString& text);
    void logLine(const QString& level, const QString& message);
    void progressChanged(const ProgressSnapshot& snapshot);
    void fileFinished(const QString& path, bool success);
    void queueFinished(bool stopped);

public slots:
    void start(const QVector<QueueItem>& items, const ConversionSettings& settings, const QString& outputDir);
    void stop();

private slots:
    void onReadyStdOut();
    void onReadyStdErr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    struct Job {
        bool merge = false;
        QueueItem item;          // single file jobs
        QStringList inputs;      // merge job
        QString outputPath;
        double durationSec = -1.0;
        int fileCount = 1;
    };

    void probeAll();
    void planJobs();
    void startNext();
    bool prepareMerge(Job& job, QStringList& args);
    bool prepareSingle(Job& job, QStringList& args);
    void launch(const QStringList& args);
    void completeCurrent(bool success);
    void finishQueue();
    void emitQueueProgress();
    void consumeStdout(bool flushAll);
    void consumeStderr(bool flushAll);
    void cleanupProcess();

    QString m_ffmpegPath;
    FfmpegCommandBuilder m_builder;
    ConversionSettings m_settings;
    QString m_outputDir;
    QVector<QueueItem> m_items;
    QHash<QString, MediaInfo::MediaDetails> m_infos;
    QVector<Job> m_jobs;
    int m_jobIndex = -1;

    QProcess* m_proc = nullptr;
    QByteArray m_stdoutBuffer;
    QByteArray m_stderrBuffer;
    QString m_concatListPath;
    FfmpegProgressParser m_parser;
    ProgressContext m_ctx;
    QElapsedTimer m_fileTimer;
    QElapsedTimer m_totalTimer;

    bool m_running = false;
    bool m_stopRequested = false;
    bool m_launchFailed = false;
};
