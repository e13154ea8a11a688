#include "progress_parser.h"
#include "utils.h"

#include <algorithm>

void FfmpegProgressParser::reset()
{
    m_outTimeSec = 0.0;
    m_speed = 0.0;
    m_finished = false;
}

bool FfmpegProgressParser::feedLine(const QString& line)
{
    const QString trimmed = line.trimmed();
    const int eq = trimmed.indexOf('=');
    if (eq <= 0) return false;

    const QString key = trimmed.left(eq).trimmed();
    const QString value = trimmed.mid(eq + 1).trimmed();

    // out_time_ms is reported in microseconds as well
    if (key == "out_time_us" || key == "out_time_ms") {
        bool ok = false;
        const qint64 us = value.toLongLong(&ok);
        if (ok && us >= 0) m_outTimeSec = double(us) / 1000000.0;
    } else if (key == "out_time") {
        bool ok = false;
        const double sec = Utils::parseFfmpegTime(value, &ok);
        if (ok) m_outTimeSec = sec;
    } else if (key == "speed") {
        QString v = value;
        v.remove('x');
        bool ok = false;
        const double sp = v.trimmed().toDouble(&ok);
        if (ok && sp >= 0.0) m_speed = sp;
    } else if (key == "progress") {
        if (value == "end") m_finished = true;
        return true;
    }
    return false;
}

ProgressSnapshot FfmpegProgressParser::snapshot(const ProgressContext& ctx, double fileElapsedSec, double totalElapsedSec) const
{
    ProgressSnapshot snap;
    snap.outTimeSec = m_outTimeSec;
    snap.fileDurationSec = ctx.fileDurationSec;

    if (ctx.fileDurationSec > 0.0) {
        snap.fileFraction = std::min(m_outTimeSec / ctx.fileDurationSec, 1.0);
        const double elapsed = std::max(fileElapsedSec, 0.001);
        if (m_speed > 0.0) {
            snap.fileEtaSec = std::max((ctx.fileDurationSec - m_outTimeSec) / m_speed, 0.0);
        } else if (snap.fileFraction > 0.0) {
            snap.fileEtaSec = Utils::estimateEta(elapsed, snap.fileFraction);
        }
    }

    if (ctx.totalDurationSec > 0.0) {
        snap.totalFraction = std::min((ctx.doneDurationSec + m_outTimeSec) / ctx.totalDurationSec, 1.0);
    } else {
        const double filePart = snap.fileFraction > 0.0 ? snap.fileFraction : 0.0;
        snap.totalFraction = std::min((ctx.doneFiles + filePart) / double(std::max(ctx.totalFiles, 1)), 1.0);
    }
    if (snap.totalFraction > 0.0) snap.totalEtaSec = Utils::estimateEta(totalElapsedSec, snap.totalFraction);

    return snap;
}
