#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QCoreApplication>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QThread>

#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);

    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dir);
    const QString path = QDir(dir).filePath("media_converter.log");
    if (!rotateIfLarger(path, MAX_FILE_BYTES)) {
        fprintf(stderr, "Cannot rotate %s\n", path.toLocal8Bit().constData());
    }
    m_file.setFileName(path);
    if (m_file.open(QIODevice::Append | QIODevice::Text)) {
        m_ts.setDevice(&m_file);
        m_ts << "\n--- " << QCoreApplication::applicationName() << ' '
             << QCoreApplication::applicationVersion() << " session "
             << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
        m_ts.flush();
    }
}

LogManager::~LogManager() {
    flushPending();
    if (m_ts.device()) {
        m_ts.flush();
    }
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

LogManager::Level LogManager::levelFromString(const QString& tag, bool* ok) {
    const QString upper = tag.trimmed().toUpper();
    if (ok) *ok = true;
    if (upper == "DEBUG") return Level::Debug;
    if (upper == "INFO") return Level::Info;
    if (upper == "OK") return Level::Ok;
    if (upper == "WARN" || upper == "WARNING") return Level::Warn;
    if (upper == "ERROR") return Level::Error;
    if (upper == "FATAL" || upper == "CRITICAL") return Level::Fatal;
    if (ok) *ok = false;
    return Level::Info;
}

QString LogManager::levelName(Level level) {
    switch (level) {
        case Level::Debug: return QStringLiteral("DEBUG");
        case Level::Info: return QStringLiteral("INFO");
        case Level::Ok: return QStringLiteral("OK");
        case Level::Warn: return QStringLiteral("WARN");
        case Level::Error: return QStringLiteral("ERROR");
        case Level::Fatal: return QStringLiteral("FATAL");
    }
    return QStringLiteral("INFO");
}

void LogManager::addLog(const QString& message, const QString& level) {
    // The worker thread posts here so the ring, the signals and the file stream stay on one thread
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, message, level]() { addLog(message, level); }, Qt::QueuedConnection);
        return;
    }

    const Level lvl = levelFromString(level);
    if (lvl < m_minimumLevel) return;

    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, levelName(lvl), message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
    } // unlock before emitting, the viewer calls logs() from its slot

    emit logsChanged();
    emit logAdded(logEntry);

    if (m_ts.device()) {
        m_ts << logEntry << '\n';
        scheduleFlush(lvl);
    }
}

QString LogManager::levelOf(const QString& entry) {
    static const QRegularExpression rx("^\\[[^\\]]*\\] \\[([A-Z]+)\\]");
    const QRegularExpressionMatch m = rx.match(entry);
    return m.hasMatch() ? m.captured(1) : QString();
}

bool LogManager::rotateIfLarger(const QString& filePath, qint64 maxBytes) {
    const QFileInfo fi(filePath);
    if (!fi.exists() || fi.size() <= maxBytes) return true;
    const QString previous = filePath + ".1";
    if (QFile::exists(previous) && !QFile::remove(previous)) return false;
    return QFile::rename(filePath, previous);
}

void LogManager::flushPending() {
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
    if (m_flushTimer.isActive()) {
        m_flushTimer.stop();
    }
}

void LogManager::scheduleFlush(Level level) {
    if (!m_ts.device()) {
        return;
    }
    m_pendingFlush = true;

    // Failures are flushed right away so a crash mid-queue still leaves them on disk
    if (level >= Level::Warn) {
        m_flushTimer.stop();
        flushPending();
        return;
    }
    m_flushTimer.start(FLUSH_INTERVAL_MS);
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    LogManager::Level level = LogManager::Level::Info;
    switch (type) {
        case QtDebugMsg:
            level = LogManager::Level::Debug;
            break;
        case QtInfoMsg:
            level = LogManager::Level::Info;
            break;
        case QtWarningMsg:
            level = LogManager::Level::Warn;
            break;
        case QtCriticalMsg:
            level = LogManager::Level::Error;
            break;
        case QtFatalMsg:
            level = LogManager::Level::Fatal;
            break;
    }

    // Queued so a message emitted inside a QML binding does not re-enter it
    const QString tag = LogManager::levelName(level);
    QMetaObject::invokeMethod(&LogManager::instance(), [tag, msg]() {
        LogManager::instance().addLog(msg, tag);
    }, Qt::QueuedConnection);

    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    fprintf(stderr, "[%s] [%s] %s\n",
            timestamp.toLocal8Bit().constData(),
            tag.toLocal8Bit().constData(),
            msg.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        abort();
    }
}
