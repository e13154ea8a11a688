#pragma once
#include <QtGlobal>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QRegularExpression>

#include <algorithm>

namespace Utils {

// Seconds as MM:SS, or HH:MM:SS once an hour is reached. Negative means unknown.
inline QString formatTime(double seconds) {
    if (seconds < 0.0) return QStringLiteral("--:--");
    const qint64 total = qRound64(seconds);
    const qint64 h = total / 3600;
    const qint64 m = (total % 3600) / 60;
    const qint64 s = total % 60;
    if (h > 0) {
        return QString("%1:%2:%3").arg(h, 2, 10, QChar('0')).arg(m, 2, 10, QChar('0')).arg(s, 2, 10, QChar('0'));
    }
    return QString("%1:%2").arg(m, 2, 10, QChar('0')).arg(s, 2, 10, QChar('0'));
}

// Human readable size with one decimal. Negative means unknown.
inline QString formatBytes(qint64 bytes) {
    if (bytes < 0) return QStringLiteral("--");
    double value = double(bytes);
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    for (const char* unit : units) {
        if (value < 1024.0) return QString("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(unit));
        value /= 1024.0;
    }
    return QString("%1 PB").arg(value, 0, 'f', 1);
}

inline bool isPlainNumber(const QString& raw) {
    static const QRegularExpression rx("^\\d+(\\.\\d+)?$");
    return rx.match(raw).hasMatch();
}

// Accepts "SS(.fff)", "MM:SS(.fff)" and "HH:MM:SS(.fff)".
inline double parseTimeToSeconds(const QString& text, bool* ok = nullptr) {
    if (ok) *ok = false;
    const QString raw = text.trimmed();
    if (raw.isEmpty()) return 0.0;
    if (isPlainNumber(raw)) {
        if (ok) *ok = true;
        return raw.toDouble();
    }
    const QStringList parts = raw.split(':');
    if (parts.size() != 2 && parts.size() != 3) return 0.0;
    bool okH = true, okM = false, okS = false;
    int hours = 0;
    int idx = 0;
    if (parts.size() == 3) hours = parts[idx++].trimmed().toInt(&okH);
    const int minutes = parts[idx++].trimmed().toInt(&okM);
    const double secs = parts[idx].trimmed().toDouble(&okS);
    if (!okH || !okM || !okS) return 0.0;
    if (ok) *ok = true;
    return hours * 3600.0 + minutes * 60.0 + secs;
}

inline int parseInt(const QString& text, bool* ok = nullptr) {
    const QString raw = text.trimmed();
    if (raw.isEmpty()) { if (ok) *ok = false; return 0; }
    return raw.toInt(ok);
}

inline double parseDouble(const QString& text, bool* ok = nullptr) {
    const QString raw = text.trimmed();
    if (raw.isEmpty()) { if (ok) *ok = false; return 0.0; }
    return raw.toDouble(ok);
}

// ffmpeg reports either plain seconds or HH:MM:SS.micro
inline double parseFfmpegTime(const QString& value, bool* ok = nullptr) {
    if (ok) *ok = false;
    const QString raw = value.trimmed();
    if (raw.isEmpty()) return 0.0;
    if (isPlainNumber(raw)) {
        if (ok) *ok = true;
        return raw.toDouble();
    }
    const QStringList parts = raw.split(':');
    if (parts.size() != 3) return 0.0;
    bool okH = false, okM = false, okS = false;
    const int h = parts[0].toInt(&okH);
    const int m = parts[1].toInt(&okM);
    const double s = parts[2].toDouble(&okS);
    if (!okH || !okM || !okS) return 0.0;
    if (ok) *ok = true;
    return h * 3600.0 + m * 60.0 + s;
}

// atempo only accepts factors in [0.5, 2.0]; larger changes are chained.
inline QVector<double> atempoChain(double speed) {
    QVector<double> factors;
    if (speed <= 0.0) return factors;
    while (speed > 2.0) { factors.append(2.0); speed /= 2.0; }
    while (speed < 0.5) { factors.append(0.5); speed /= 0.5; }
    factors.append(speed);
    return factors;
}

// Remaining time extrapolated from elapsed time and completed fraction; -1 when unknown.
inline double estimateEta(double elapsedSec, double progress) {
    if (progress <= 0.0) return -1.0;
    return std::max(elapsedSec / progress - elapsedSec, 0.0);
}

} // namespace Utils
