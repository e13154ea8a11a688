#include "media_probe.h"
#include "utils.h"

#include <QFile>
#include <QFileInfo>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/log.h>
}

namespace MediaInfo {

namespace {

QString codecName(const AVCodecParameters* par)
{
    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    const char* name = codec && codec->name ? codec->name : avcodec_get_name(par->codec_id);
    return name ? QString::fromUtf8(name) : QString();
}

} // namespace

bool probeMediaFile(const QString& filePath, MediaDetails& out, QString* errorMessage)
{
    // Reduce FFmpeg logging noise; probes also run from the thread pool
    static const bool logLevelSet = []() {
        av_log_set_level(AV_LOG_ERROR);
        return true;
    }();
    Q_UNUSED(logLevelSet);

    out = MediaDetails();

    AVFormatContext* fmtCtx = nullptr;
    QByteArray localPath = QFile::encodeName(filePath);
    int ret = avformat_open_input(&fmtCtx, localPath.constData(), nullptr, nullptr);
    if (ret < 0) {
        if (errorMessage) *errorMessage = QString("avformat_open_input failed (%1)").arg(ret);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        if (errorMessage) *errorMessage = QString("avformat_find_stream_info failed (%1)").arg(ret);
        avformat_close_input(&fmtCtx);
        return false;
    }

    if (fmtCtx->duration != AV_NOPTS_VALUE && fmtCtx->duration > 0) {
        out.durationSec = double(fmtCtx->duration) / double(AV_TIME_BASE);
    }
    if (fmtCtx->iformat && fmtCtx->iformat->name) {
        out.formatName = QString::fromUtf8(fmtCtx->iformat->name);
    }
    if (fmtCtx->pb) {
        const int64_t size = avio_size(fmtCtx->pb);
        if (size > 0) out.sizeBytes = size;
    }

    int vIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    int aIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);

    if (vIdx >= 0) {
        AVStream* vs = fmtCtx->streams[vIdx];
        AVCodecParameters* vp = vs ? vs->codecpar : nullptr;
        if (vp) {
            out.videoCodec = codecName(vp);
            out.width = vp->width;
            out.height = vp->height;
        }
    }

    if (aIdx >= 0) {
        AVStream* as = fmtCtx->streams[aIdx];
        AVCodecParameters* ap = as ? as->codecpar : nullptr;
        if (ap) out.audioCodec = codecName(ap);
    }

    avformat_close_input(&fmtCtx);

    if (out.sizeBytes < 0) {
        QFileInfo fi(filePath);
        if (fi.exists()) out.sizeBytes = fi.size();
    }
    return true;
}

QString summaryLine(const QString& name, const MediaDetails& d)
{
    const QString v = d.videoCodec.isEmpty() ? QStringLiteral("-") : d.videoCodec;
    const QString a = d.audioCodec.isEmpty() ? QStringLiteral("-") : d.audioCodec;
    const QString res = (d.width > 0 && d.height > 0) ? QString("%1x%2").arg(d.width).arg(d.height)
                                                      : QStringLiteral("-");
    return QString("%1: %2 | %3/%4 | %5 | %6")
        .arg(name, Utils::formatTime(d.durationSec), v, a, res, Utils::formatBytes(d.sizeBytes));
}

} // namespace MediaInfo
