#include "ffmpeg_locator.h"
#include "log_manager.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QProcessEnvironment>
#include <QStandardPaths>

#include <initializer_list>

namespace FfmpegTools {

namespace {

QString searchTool(const QString& tool, const QStringList& preferredDirs)
{
    const QString exe = executableName(tool);
    QStringList dirs = preferredDirs;

    const QString appDir = QCoreApplication::applicationDirPath();
    dirs << appDir << QDir(appDir).filePath("bin");

    const QString root = QProcessEnvironment::systemEnvironment().value("FFMPEG_ROOT");
    if (!root.isEmpty()) dirs << QDir(root).filePath("bin") << root;

    for (const QString& d : dirs) {
        const QString cand = QDir(d).filePath(exe);
        if (isUsableBinary(cand)) return QFileInfo(cand).absoluteFilePath();
    }
    return QStandardPaths::findExecutable(tool);
}

bool intersects(const QSet<QString>& caps, std::initializer_list<const char*> names)
{
    for (const char* n : names) {
        if (caps.contains(QLatin1String(n))) return true;
    }
    return false;
}

} // namespace

QString executableName(const QString& tool)
{
#ifdef Q_OS_WIN
    return tool + ".exe";
#else
    return tool;
#endif
}

QString findFfmpeg()
{
    const QString path = searchTool("ffmpeg", {});
    if (path.isEmpty()) qWarning() << "[FFmpeg] ffmpeg not found next to the application or on PATH";
    return path;
}

QString findFfprobe(const QString& ffmpegPath)
{
    QStringList dirs;
    if (!ffmpegPath.isEmpty()) dirs << QFileInfo(ffmpegPath).absolutePath();
    return searchTool("ffprobe", dirs);
}

bool isUsableBinary(const QString& path)
{
    if (path.isEmpty()) return false;
    QFileInfo fi(path);
    return fi.exists() && fi.isFile() && fi.isExecutable();
}

QSet<QString> parseEncoderList(const QString& text)
{
    QSet<QString> encoders;
    const QStringList lines = text.split('\n');
    for (QString line : lines) {
        line = line.trimmed();
        if (line.isEmpty() || line.startsWith("Encoders:") || line.startsWith("--")) continue;
        const QStringList parts = line.split(' ', Qt::SkipEmptyParts);
        if (parts.size() < 2) continue;
        // Legend lines look like "V..... = Video"; real rows have a 6-char flag column
        if (parts[1] == "=") continue;
        encoders.insert(parts[1]);
    }
    return encoders;
}

QSet<QString> detectEncoders(const QString& ffmpegPath, int timeoutMs)
{
    if (ffmpegPath.isEmpty()) return {};
    QProcess p;
    p.start(ffmpegPath, {"-hide_banner", "-encoders"});
    if (!p.waitForStarted(timeoutMs)) {
        LogManager::instance().addLog(QString("[FFmpeg] Cannot start %1: %2").arg(ffmpegPath, p.errorString()), "WARN");
        return {};
    }
    if (!p.waitForFinished(timeoutMs)) {
        p.kill();
        p.waitForFinished(1000);
        LogManager::instance().addLog("[FFmpeg] Timed out listing encoders", "WARN");
        return {};
    }
    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) return {};
    return parseEncoderList(QString::fromUtf8(p.readAllStandardOutput()));
}

QStringList encoderSummary(const QSet<QString>& caps)
{
    QStringList summary;
    if (intersects(caps, {"h264_nvenc", "hevc_nvenc", "av1_nvenc"})) summary << "NVENC";
    if (intersects(caps, {"h264_qsv", "hevc_qsv", "av1_qsv"})) summary << "QSV";
    if (intersects(caps, {"h264_amf", "hevc_amf", "av1_amf"})) summary << "AMF";
    if (caps.contains("libx265")) summary << "x265";
    if (intersects(caps, {"libsvtav1", "libaom-av1"})) summary << "AV1";
    if (caps.contains("libvpx-vp9")) summary << "VP9";
    return summary;
}

} // namespace FfmpegTools
