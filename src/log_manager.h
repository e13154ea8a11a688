#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <QTimer>

// Application log shared by the worker thread, the backend and both front-ends.
// Entries look like "[hh:mm:ss.zzz] [LEVEL] message" and are mirrored to
// <AppDataLocation>/media_converter.log.
class LogManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(QStringList logs READ logs NOTIFY logsChanged)

public:
    // Ordered by severity; OK reports a finished file and ranks above INFO
    enum class Level {
        Debug,
        Info,
        Ok,
        Warn,
        Error,
        Fatal,
    };
    Q_ENUM(Level)

    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;
    QString logFilePath() const { return m_file.fileName(); }

    // Entries below the minimum level are dropped; default Info
    Level minimumLevel() const { return m_minimumLevel; }
    void setMinimumLevel(Level level) { m_minimumLevel = level; }

    Q_INVOKABLE void addLog(const QString& message, const QString& level = "INFO");
    Q_INVOKABLE void clear();

    // Unknown tags map to Info
    static Level levelFromString(const QString& tag, bool* ok = nullptr);
    static QString levelName(Level level);
    // Level tag of a formatted entry, empty if none
    static QString levelOf(const QString& entry);

    // Keeps one previous session as <file>.1 once the log grows past maxBytes
    static bool rotateIfLarger(const QString& filePath, qint64 maxBytes);

signals:
    void logsChanged();
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(Level level);

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    Level m_minimumLevel = Level::Info;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
    static constexpr qint64 MAX_FILE_BYTES = 1024 * 1024;
};

// Routes qDebug/qInfo/qWarning/qCritical/qFatal into LogManager and stderr
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
