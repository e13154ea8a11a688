#pragma once

#include <QMetaType>
#include <QString>

// Fractions are 0..1; negative values mean "unknown".
struct ProgressSnapshot {
    double fileFraction = -1.0;
    double outTimeSec = 0.0;
    double fileDurationSec = -1.0;
    double fileEtaSec = -1.0;
    double totalFraction = 0.0;
    double totalEtaSec = -1.0;
};
Q_DECLARE_METATYPE(ProgressSnapshot)

// Where the running file sits inside the whole queue
struct ProgressContext {
    double fileDurationSec = -1.0;
    double doneDurationSec = 0.0;
    double totalDurationSec = 0.0;
    int doneFiles = 0;
    int totalFiles = 0;
};

// Consumes "key=value" lines written by ffmpeg -progress.
class FfmpegProgressParser {
public:
    void reset();

    // Returns true when the line closes a progress block ("progress=continue|end").
    // Lines without '=' and values that do not parse are ignored.
    bool feedLine(const QString& line);

    double outTimeSec() const { return m_outTimeSec; }
    double speed() const { return m_speed; }   // 0 when not reported yet
    bool finished() const { return m_finished; }

    ProgressSnapshot snapshot(const ProgressContext& ctx, double fileElapsedSec, double totalElapsedSec) const;

private:
    double m_outTimeSec = 0.0;
    double m_speed = 0.0;
    bool m_finished = false;
};
