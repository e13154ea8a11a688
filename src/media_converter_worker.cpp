#include "media_converter_worker.h"
#include "file_utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QTimer>
#include <QUuid>

namespace {
constexpr int kTerminateGraceMs = 3000;
}

MediaConverterWorker::MediaConverterWorker(QObject* parent) : QObject(parent)
{
    m_builder.setLogCallback([this](const QString& level, const QString& message) {
        emit logLine(level, message);
    });
}

void MediaConverterWorker::start(const QVector<QueueItem>& items, const ConversionSettings& settings, const QString& outputDir)
{
    if (m_running) {
        emit logLine("WARN", tr("A conversion is already running."));
        return;
    }

    m_stopRequested = false;
    m_launchFailed = false;

    if (m_ffmpegPath.isEmpty()) {
        emit logLine("ERROR", tr("FFmpeg not found. Set the path to ffmpeg."));
        emit queueFinished(true);
        return;
    }
    if (items.isEmpty()) {
        emit logLine("WARN", tr("The queue is empty."));
        emit queueFinished(true);
        return;
    }
    if (!QDir().mkpath(outputDir)) {
        emit logLine("ERROR", tr("Cannot create the output folder: %1").arg(outputDir));
        emit queueFinished(true);
        return;
    }

    m_running = true;
    m_items = items;
    m_settings = settings;
    m_outputDir = outputDir;
    m_jobs.clear();
    m_jobIndex = -1;
    m_ctx = ProgressContext();
    m_ctx.totalFiles = items.size();

    for (const QString& w : settings.validationWarnings()) emit logLine("WARN", w);
    // Already reported above; the builder would repeat it for every file
    if (m_settings.hasMissingWatermark()) m_settings.watermarkPath.clear();

    probeAll();
    emit queueStarted(m_ctx.totalFiles, m_ctx.totalDurationSec);

    planJobs();
    m_totalTimer.start();
    startNext();
}

void MediaConverterWorker::stop()
{
    if (!m_running) return;
    m_stopRequested = true;
    emit statusChanged(tr("Stopping after the current file..."));
    if (m_proc && m_proc->state() != QProcess::NotRunning) {
        m_proc->terminate();
        QPointer<QProcess> proc = m_proc;
        QTimer::singleShot(kTerminateGraceMs, this, [proc]() {
            if (proc && proc->state() != QProcess::NotRunning) proc->kill();
        });
    }
}

void MediaConverterWorker::probeAll()
{
    m_infos.clear();
    for (const QueueItem& it : m_items) {
        MediaInfo::MediaDetails d;
        QString err;
        if (!MediaInfo::probeMediaFile(it.path, d, &err)) {
            emit logLine("WARN", tr("Cannot read media info for %1: %2").arg(it.displayName, err));
            continue;
        }
        m_infos.insert(it.path, d);
        if (it.kind == MediaKind::Video && d.durationSec > 0.0) m_ctx.totalDurationSec += d.durationSec;
        emit logLine("INFO", MediaInfo::summaryLine(it.displayName, d));
    }
}

void MediaConverterWorker::planJobs()
{
    QStringList videos;
    for (const QueueItem& it : m_items) {
        if (it.kind == MediaKind::Video) videos << it.path;
    }

    bool merge = m_settings.merge;
    if (merge && videos.size() < 2) {
        emit logLine("WARN", tr("Merge is enabled but fewer than 2 videos are queued. Skipping merge."));
        merge = false;
    }

    if (merge) {
        Job job;
        job.merge = true;
        job.inputs = videos;
        job.fileCount = videos.size();
        job.durationSec = 0.0;
        for (const QString& v : videos) {
            const double d = m_infos.value(v).durationSec;
            if (d > 0.0) job.durationSec += d;
        }
        m_jobs.append(job);
    }

    for (const QueueItem& it : m_items) {
        if (merge && it.kind == MediaKind::Video) continue;
        Job job;
        job.item = it;
        if (it.kind == MediaKind::Video) job.durationSec = m_infos.value(it.path).durationSec;
        m_jobs.append(job);
    }
}

void MediaConverterWorker::startNext()
{
    cleanupProcess();

    while (true) {
        if (m_stopRequested) {
            emit logLine("WARN", tr("Stopped by user."));
            finishQueue();
            return;
        }

        m_jobIndex += 1;
        if (m_jobIndex >= m_jobs.size()) { finishQueue(); return; }

        Job& job = m_jobs[m_jobIndex];
        QStringList args;
        const bool ready = job.merge ? prepareMerge(job, args) : prepareSingle(job, args);
        if (ready) {
            launch(args);
            return;
        }
        // Job could not be prepared; it counts as done and the queue moves on
        m_ctx.doneFiles += job.fileCount;
        if (!job.merge) emit fileFinished(job.item.path, false);
        emitQueueProgress();
    }
}

bool MediaConverterWorker::prepareMerge(Job& job, QStringList& args)
{
    QString name = m_settings.mergeName.trimmed();
    if (name.isEmpty()) name = "merged";
    QString fileName = QFileInfo(name).fileName();
    if (QFileInfo(fileName).suffix().isEmpty()) fileName += "." + m_settings.outVideoFormat;

    QString outPath = QDir(m_outputDir).filePath(fileName);
    if (!m_settings.overwrite) outPath = FileUtils::safeOutputName(m_outputDir, outPath, QFileInfo(outPath).suffix());
    job.outputPath = outPath;
    const QString outName = QFileInfo(outPath).fileName();
    const QString outExt = QFileInfo(outPath).suffix().toLower();

    emit statusChanged(tr("Processing (merge): %1").arg(outName));
    emit logLine("INFO", tr("Merging %1 videos -> %2").arg(QString::number(job.inputs.size()), outName));

    const FfmpegCommandBuilder::FilterSpec spec = m_builder.videoFilterSpec(m_settings, outExt);
    const QString audioFilter = FfmpegCommandBuilder::audioSpeedFilter(m_settings);
    const QStringList trim = m_builder.trimArgs(m_settings);
    const FfmpegCommandBuilder::CopyDecision copy = FfmpegCommandBuilder::mergeCopyAllowed(
        job.inputs, outExt, m_infos, spec.filtersUsed, !audioFilter.isEmpty(), trim);
    const bool allowFast = m_settings.fastCopy && copy.allowed;
    if (m_settings.fastCopy && !copy.allowed) {
        emit logLine("WARN", tr("Fast copy (merge) disabled: %1").arg(copy.reason));
    }

    m_concatListPath = QDir(QDir::tempPath()).filePath(
        QString("media_converter_concat_%1.txt").arg(QUuid::createUuid().toString(QUuid::WithoutBraces)));
    QString err;
    if (!FfmpegCommandBuilder::writeConcatList(job.inputs, m_concatListPath, &err)) {
        emit logLine("ERROR", tr("Merge error: %1").arg(err));
        m_concatListPath.clear();
        return false;
    }

    args = m_builder.buildMergeCommand(m_concatListPath, outPath, m_settings, allowFast);
    return true;
}

bool MediaConverterWorker::prepareSingle(Job& job, QStringList& args)
{
    const QueueItem& it = job.item;
    if (!FileUtils::fileExists(it.path)) {
        emit logLine("ERROR", tr("File not found: %1").arg(it.path));
        return false;
    }

    const bool isVideo = it.kind == MediaKind::Video;
    const QString outExt = isVideo ? m_settings.outVideoFormat : m_settings.outImageFormat;
    QString outPath;
    if (m_settings.overwrite) {
        outPath = QDir(m_outputDir).filePath(QFileInfo(it.path).completeBaseName() + "." + outExt);
    } else {
        outPath = FileUtils::safeOutputName(m_outputDir, it.path, outExt);
    }
    job.outputPath = outPath;

    emit statusChanged(tr("Processing: %1").arg(it.displayName));
    emit logLine("INFO", QString("-> %1 (%2) ==> %3").arg(it.displayName, mediaKindName(it.kind), QFileInfo(outPath).fileName()));

    if (!isVideo) {
        args = m_builder.buildImageCommand(it.path, outPath, m_settings);
        return true;
    }

    const FfmpegCommandBuilder::FilterSpec spec = m_builder.videoFilterSpec(m_settings, outExt);
    const QString audioFilter = FfmpegCommandBuilder::audioSpeedFilter(m_settings);
    auto infoIt = m_infos.constFind(it.path);
    const MediaInfo::MediaDetails* info = infoIt != m_infos.constEnd() ? &infoIt.value() : nullptr;
    const FfmpegCommandBuilder::CopyDecision copy = FfmpegCommandBuilder::fastCopyAllowed(
        it.path, outExt, info, spec.filtersUsed, !audioFilter.isEmpty());
    const bool allowFast = m_settings.fastCopy && copy.allowed;
    if (m_settings.fastCopy && !copy.allowed) {
        emit logLine("WARN", tr("Fast copy disabled for %1: %2").arg(it.displayName, copy.reason));
    }
    args = m_builder.buildVideoCommand(it.path, outPath, m_settings, allowFast);
    return true;
}

void MediaConverterWorker::launch(const QStringList& args)
{
    const Job& job = m_jobs[m_jobIndex];
    m_parser.reset();
    m_stdoutBuffer.clear();
    m_stderrBuffer.clear();
    m_ctx.fileDurationSec = job.durationSec;

    m_proc = new QProcess(this);
    connect(m_proc, &QProcess::readyReadStandardOutput, this, &MediaConverterWorker::onReadyStdOut);
    connect(m_proc, &QProcess::readyReadStandardError, this, &MediaConverterWorker::onReadyStdErr);
    connect(m_proc, qOverload<int,QProcess::ExitStatus>(&QProcess::finished), this, &MediaConverterWorker::onFinished);
    connect(m_proc, &QProcess::errorOccurred, this, &MediaConverterWorker::onErrorOccurred);

    const QStringList fullArgs = FfmpegCommandBuilder::withProgressOutput(args);
    m_proc->setProgram(m_ffmpegPath);
    m_proc->setArguments(fullArgs);
    emit logLine("DEBUG", QString("%1 %2").arg(QFileInfo(m_ffmpegPath).fileName(), fullArgs.join(' ')));
    m_fileTimer.restart();
    m_proc->start();
}

void MediaConverterWorker::onReadyStdOut()
{
    if (!m_proc) return;
    m_stdoutBuffer += m_proc->readAllStandardOutput();
    consumeStdout(false);
}

void MediaConverterWorker::onReadyStdErr()
{
    if (!m_proc) return;
    m_stderrBuffer += m_proc->readAllStandardError();
    consumeStderr(false);
}

void MediaConverterWorker::consumeStdout(bool flushAll)
{
    int nl;
    while ((nl = m_stdoutBuffer.indexOf('\n')) >= 0 || (flushAll && !m_stdoutBuffer.isEmpty())) {
        const int take = nl >= 0 ? nl : m_stdoutBuffer.size();
        const QString line = QString::fromUtf8(m_stdoutBuffer.left(take));
        m_stdoutBuffer.remove(0, nl >= 0 ? nl + 1 : take);
        if (m_parser.feedLine(line)) {
            const double fileElapsed = m_fileTimer.elapsed() / 1000.0;
            const double totalElapsed = m_totalTimer.elapsed() / 1000.0;
            emit progressChanged(m_parser.snapshot(m_ctx, fileElapsed, totalElapsed));
        }
    }
}

void MediaConverterWorker::consumeStderr(bool flushAll)
{
    int nl;
    while ((nl = m_stderrBuffer.indexOf('\n')) >= 0 || (flushAll && !m_stderrBuffer.isEmpty())) {
        const int take = nl >= 0 ? nl : m_stderrBuffer.size();
        const QString line = QString::fromUtf8(m_stderrBuffer.left(take)).trimmed();
        m_stderrBuffer.remove(0, nl >= 0 ? nl + 1 : take);
        if (line.isEmpty()) continue;
        const QString low = line.toLower();
        if (low.contains("error") || low.contains("invalid") || low.contains("failed")) {
            emit logLine("WARN", line);
        }
    }
}

void MediaConverterWorker::onFinished(int exitCode, QProcess::ExitStatus status)
{
    if (!m_proc || m_jobIndex < 0 || m_jobIndex >= m_jobs.size()) return;
    m_stdoutBuffer += m_proc->readAllStandardOutput();
    m_stderrBuffer += m_proc->readAllStandardError();
    consumeStdout(true);
    consumeStderr(true);

    const Job& job = m_jobs[m_jobIndex];
    const bool ok = status == QProcess::NormalExit && exitCode == 0 && QFileInfo::exists(job.outputPath);
    const QString outName = QFileInfo(job.outputPath).fileName();
    const int code = status == QProcess::NormalExit ? exitCode : -1;
    if (ok) {
        emit logLine("OK", job.merge ? tr("Done (merge): %1").arg(outName) : tr("Done: %1").arg(outName));
    } else if (job.merge) {
        emit logLine("ERROR", tr("Merge failed (code %1)").arg(code));
    } else {
        emit logLine("ERROR", tr("Conversion failed: %1 (code %2)").arg(job.item.displayName, QString::number(code)));
    }
    completeCurrent(ok);
}

void MediaConverterWorker::onErrorOccurred(QProcess::ProcessError error)
{
    // Crashes and kills are reported through finished(); only a failed launch ends the queue here
    if (error != QProcess::FailedToStart || !m_proc) return;
    emit logLine("ERROR", tr("FFmpeg could not be started: %1. Check the path to ffmpeg.").arg(m_proc->errorString()));
    m_launchFailed = true;
    m_stopRequested = true;
    cleanupProcess();
    finishQueue();
}

void MediaConverterWorker::completeCurrent(bool success)
{
    const Job& job = m_jobs[m_jobIndex];
    m_ctx.doneFiles += job.fileCount;
    if (job.durationSec > 0.0) m_ctx.doneDurationSec += job.durationSec;
    emit fileFinished(job.merge ? job.outputPath : job.item.path, success);
    emitQueueProgress();

    // Let the finished() emission unwind before the QProcess is released
    QMetaObject::invokeMethod(this, &MediaConverterWorker::startNext, Qt::QueuedConnection);
}

void MediaConverterWorker::emitQueueProgress()
{
    m_parser.reset();
    ProgressContext ctx = m_ctx;
    ctx.fileDurationSec = -1.0;
    emit progressChanged(m_parser.snapshot(ctx, 0.0, m_totalTimer.isValid() ? m_totalTimer.elapsed() / 1000.0 : 0.0));
}

void MediaConverterWorker::cleanupProcess()
{
    if (m_proc) {
        m_proc->disconnect(this);
        if (m_proc->state() != QProcess::NotRunning) {
            m_proc->kill();
            m_proc->waitForFinished(1000);
        }
        m_proc->deleteLater();
        m_proc = nullptr;
    }
    if (!m_concatListPath.isEmpty()) {
        QFile::remove(m_concatListPath);
        m_concatListPath.clear();
    }
}

void MediaConverterWorker::finishQueue()
{
    if (!m_running) return;
    m_running = false;
    emit statusChanged(m_stopRequested ? tr("Stopped.") : tr("Done."));
    emit queueFinished(m_stopRequested);
}
