#include "ffmpeg_command_builder.h"
#include "utils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <algorithm>
#include <cmath>

namespace {

QString expandHome(const QString& path)
{
    if (path.startsWith("~/")) return QDir::home().filePath(path.mid(2));
    return path;
}

QString num(double v)
{
    return QString::number(v, 'g', 6);
}

QString normalizeExt(const QString& ext)
{
    QString e = ext.toLower();
    if (e.startsWith('.')) e.remove(0, 1);
    return e;
}

bool usesFaststart(const QString& ext)
{
    return ext == "mp4" || ext == "mov" || ext == "m4v";
}

QString tr(const char* text)
{
    return QCoreApplication::translate("FfmpegCommandBuilder", text);
}

} // namespace

FfmpegCommandBuilder::FfmpegCommandBuilder(const QSet<QString>& encoderCaps, LogCallback log)
    : m_caps(encoderCaps), m_log(std::move(log))
{
}

void FfmpegCommandBuilder::warn(const QString& message) const
{
    if (m_log) m_log("WARN", message);
}

QString FfmpegCommandBuilder::escapeDrawtext(const QString& text)
{
    QString out = text;
    out.replace("\\", "\\\\");
    out.replace(":", "\\:");
    out.replace("'", "\\'");
    return out;
}

QString FfmpegCommandBuilder::escapeFilterPath(const QString& path)
{
    QString out = path;
    out.replace("\\", "/");
    out.replace(":", "\\:");
    return out;
}

bool FfmpegCommandBuilder::containerSupportsCodec(const QString& ext, const QString& videoCodec)
{
    const QString e = normalizeExt(ext);
    const QString c = videoCodec.toLower();
    if (e == "mkv") return true;
    if (e == "mp4" || e == "m4v" || e == "mov") return c == "h264" || c == "hevc" || c == "h265" || c == "av1";
    if (e == "webm") return c == "vp8" || c == "vp9" || c == "av1";
    if (e == "avi") return c == "mpeg4" || c == "h264" || c == "xvid";
    return true;
}

QString FfmpegCommandBuilder::resolveCodec(const QString& outExt, const QString& codecChoice) const
{
    const QString ext = normalizeExt(outExt);
    QString choice = codecChoice.isEmpty() ? QStringLiteral("auto") : codecChoice;
    if (ext == "gif") return QStringLiteral("gif");
    if (choice == "auto") return ext == "webm" ? QStringLiteral("vp9") : QStringLiteral("h264");
    if (ext == "webm" && choice != "vp9" && choice != "av1") {
        warn(tr("WebM only supports VP9/AV1. Switching to VP9."));
        return QStringLiteral("vp9");
    }
    if ((ext == "mp4" || ext == "mov" || ext == "m4v" || ext == "avi") && choice == "vp9") {
        warn(tr("VP9 is not compatible with MP4/MOV/AVI. Switching to H.264."));
        return QStringLiteral("h264");
    }
    return choice;
}

FfmpegCommandBuilder::Encoder FfmpegCommandBuilder::selectEncoder(const QString& codec, const QString& hwPreference) const
{
    QHash<QString, QString> cpu;
    cpu["h264"] = "libx264";
    cpu["h265"] = "libx265";
    cpu["av1"] = m_caps.contains("libsvtav1") ? "libsvtav1" : "libaom-av1";
    cpu["vp9"] = "libvpx-vp9";
    if (!cpu.contains(codec)) return {QStringLiteral("libx264"), false};

    // vendor -> codec -> encoder; VP9 has no hardware mapping
    auto hwEncoder = [&codec](const QString& vendor) -> QString {
        const QString suffix = vendor == "nvidia" ? "_nvenc" : vendor == "intel" ? "_qsv" : vendor == "amd" ? "_amf" : QString();
        if (suffix.isEmpty()) return QString();
        if (codec == "h264") return "h264" + suffix;
        if (codec == "h265") return "hevc" + suffix;
        if (codec == "av1") return "av1" + suffix;
        return QString();
    };

    auto cpuFallback = [&]() -> Encoder {
        const QString enc = cpu.value(codec);
        if (!m_caps.isEmpty() && !m_caps.contains(enc)) {
            warn(tr("Encoder %1 is not available. Switching to libx264.").arg(enc));
            return {QStringLiteral("libx264"), false};
        }
        return {enc, false};
    };

    const QString pref = hwPreference.isEmpty() ? QStringLiteral("auto") : hwPreference;
    if (pref == "cpu") return cpuFallback();

    if (pref == "auto") {
        for (const char* vendor : {"nvidia", "intel", "amd"}) {
            const QString enc = hwEncoder(QLatin1String(vendor));
            if (!enc.isEmpty() && m_caps.contains(enc)) return {enc, true};
        }
        return cpuFallback();
    }

    const QString enc = hwEncoder(pref);
    if (!enc.isEmpty() && m_caps.contains(enc)) return {enc, true};
    warn(tr("The selected GPU encoder is not available. Using CPU."));
    return cpuFallback();
}

QStringList FfmpegCommandBuilder::encoderQualityArgs(const QString& encoder, int crf)
{
    const QString q = QString::number(crf);
    if (encoder == "libx264" || encoder == "libx265" || encoder == "libsvtav1" || encoder == "libaom-av1") {
        return {"-crf", q};
    }
    if (encoder == "libvpx-vp9") return {"-crf", q, "-b:v", "0"};
    if (encoder.endsWith("_nvenc")) return {"-rc:v", "vbr", "-cq", q, "-b:v", "0"};
    if (encoder.endsWith("_qsv")) return {"-global_quality", q};
    if (encoder.endsWith("_amf")) return {"-rc", "cqp", "-qp_i", q, "-qp_p", q, "-qp_b", q};
    return {};
}

QStringList FfmpegCommandBuilder::trimArgs(const ConversionSettings& s) const
{
    QStringList args;
    if (s.hasTrimStart()) args << "-ss" << QString::number(s.trimStart, 'f', 3);
    if (s.hasTrimEnd()) {
        if (s.hasTrimStart() && s.trimEnd <= s.trimStart) {
            warn(tr("Trim end <= start. Ignoring end."));
        } else {
            args << "-to" << QString::number(s.trimEnd, 'f', 3);
        }
    }
    return args;
}

QString FfmpegCommandBuilder::audioSpeedFilter(const ConversionSettings& s)
{
    if (!s.hasSpeedChange()) return QString();
    QStringList parts;
    for (double factor : Utils::atempoChain(s.speed)) {
        parts << QString("atempo=%1").arg(factor, 0, 'f', 3);
    }
    return parts.join(',');
}

QString FfmpegCommandBuilder::textFilter(const ConversionSettings& s)
{
    const QString text = s.textWatermark.trimmed();
    if (text.isEmpty()) return QString();

    const QString color = s.textColor.trimmed().isEmpty() ? QStringLiteral("white") : s.textColor.trimmed();
    const QString pos = ConversionOptions::textPosition(s.textPosition);
    const int colon = pos.indexOf(':');
    const QString x = pos.left(colon);
    const QString y = pos.mid(colon + 1);

    // Built by concatenation: user text may itself contain %N sequences
    QString draw = "drawtext=text='" + escapeDrawtext(text) + "':x=" + x + ":y=" + y
                   + ":fontsize=" + QString::number(s.textSize) + ":fontcolor=" + color;
    const QString font = s.textFont.trimmed();
    if (!font.isEmpty()) draw += ":fontfile='" + escapeFilterPath(font) + "'";
    if (s.textBox) {
        const double opacity = std::clamp(s.textBoxOpacity, 0, 100) / 100.0;
        const QString boxColor = s.textBoxColor.trimmed().isEmpty() ? QStringLiteral("black") : s.textBoxColor.trimmed();
        draw += ":box=1:boxcolor=" + boxColor + "@" + QString::number(opacity, 'f', 2);
    }
    return draw;
}

QString FfmpegCommandBuilder::watermarkInput(const ConversionSettings& s) const
{
    const QString raw = s.watermarkPath.trimmed();
    if (raw.isEmpty()) return QString();
    const QString path = expandHome(raw);
    if (!QFileInfo::exists(path)) {
        warn(tr("Watermark not found: %1").arg(raw));
        return QString();
    }
    return path;
}

QString FfmpegCommandBuilder::watermarkChain(const ConversionSettings& s) const
{
    const double scale = std::max(1, s.watermarkScale) / 100.0;
    const double opacity = std::clamp(s.watermarkOpacity, 0, 100) / 100.0;
    return QString("[1:v]format=rgba,scale=iw*%1:ih*%1,colorchannelmixer=aa=%2[wm]").arg(num(scale), num(opacity));
}

FfmpegCommandBuilder::FilterSpec FfmpegCommandBuilder::videoFilterSpec(const ConversionSettings& s, const QString& outExt) const
{
    const QString ext = normalizeExt(outExt);
    QStringList filters;

    const bool hasResize = s.resizeWidth > 0 || s.resizeHeight > 0;
    if (hasResize) {
        filters << QString("scale=%1:%2").arg(s.resizeWidth > 0 ? s.resizeWidth : -1)
                                          .arg(s.resizeHeight > 0 ? s.resizeHeight : -1);
    }
    if (s.cropWidth > 0 && s.cropHeight > 0) {
        filters << QString("crop=%1:%2:%3:%4").arg(s.cropWidth).arg(s.cropHeight).arg(s.cropX).arg(s.cropY);
    }
    const QString rotate = ConversionOptions::rotateFilter(s.rotate);
    if (!rotate.isEmpty()) filters << rotate;
    if (s.hasSpeedChange()) filters << QString("setpts=PTS/%1").arg(num(s.speed));
    const QString text = textFilter(s);
    if (!text.isEmpty()) filters << text;

    bool useBlur = false;
    QString blurGraph;
    QString mode; int pw = 0, ph = 0;
    if (ConversionOptions::portraitTarget(s.portrait, mode, pw, ph)) {
        if (mode == "crop") {
            filters.prepend(QString("scale='if(gt(a,9/16),-2,%1)':'if(gt(a,9/16),%2,-2)',crop=%1:%2,setsar=1").arg(pw).arg(ph));
        } else {
            useBlur = true;
            blurGraph = QString("[0:v]scale=%1:%2:force_original_aspect_ratio=increase,boxblur=20:1,crop=%1:%2[bg];"
                                "[0:v]scale=%1:%2:force_original_aspect_ratio=decrease[fg];"
                                "[bg][fg]overlay=(W-w)/2:(H-h)/2,setsar=1").arg(pw).arg(ph);
        }
    }

    if (ext == "gif") {
        filters << "fps=12";
        if (!hasResize) filters << "scale=640:-1:flags=lanczos";
    }

    const QString wm = watermarkInput(s);

    FilterSpec spec;
    if (!useBlur && wm.isEmpty()) {
        if (!filters.isEmpty()) {
            spec.option = "-vf";
            spec.graph = filters.join(',');
            spec.filtersUsed = true;
        }
        return spec;
    }

    QStringList parts;
    if (useBlur) {
        QString graph = blurGraph;
        if (!filters.isEmpty()) graph += "," + filters.join(',');
        parts << graph + "[vbase]";
    } else {
        parts << QString("[0:v]%1[vbase]").arg(filters.isEmpty() ? QStringLiteral("null") : filters.join(','));
    }

    spec.outputLabel = "[vbase]";
    if (!wm.isEmpty()) {
        parts << watermarkChain(s);
        parts << QString("[vbase][wm]overlay=%1[vout]").arg(ConversionOptions::overlayPosition(s.watermarkPosition));
        spec.outputLabel = "[vout]";
        spec.extraInputs << wm;
    }

    spec.option = "-filter_complex";
    spec.graph = parts.join(';');
    spec.filtersUsed = true;
    return spec;
}

FfmpegCommandBuilder::FilterSpec FfmpegCommandBuilder::imageFilterSpec(const ConversionSettings& s) const
{
    QStringList filters;
    if (s.resizeWidth > 0 || s.resizeHeight > 0) {
        filters << QString("scale=%1:%2").arg(s.resizeWidth > 0 ? s.resizeWidth : -1)
                                          .arg(s.resizeHeight > 0 ? s.resizeHeight : -1);
    }
    if (s.cropWidth > 0 && s.cropHeight > 0) {
        filters << QString("crop=%1:%2:%3:%4").arg(s.cropWidth).arg(s.cropHeight).arg(s.cropX).arg(s.cropY);
    }
    const QString rotate = ConversionOptions::rotateFilter(s.rotate);
    if (!rotate.isEmpty()) filters << rotate;
    const QString text = textFilter(s);
    if (!text.isEmpty()) filters << text;

    const QString wm = watermarkInput(s);

    FilterSpec spec;
    if (wm.isEmpty()) {
        if (!filters.isEmpty()) {
            spec.option = "-vf";
            spec.graph = filters.join(',');
            spec.filtersUsed = true;
        }
        return spec;
    }

    QStringList parts;
    parts << QString("[0:v]%1[vbase]").arg(filters.isEmpty() ? QStringLiteral("null") : filters.join(','));
    parts << watermarkChain(s);
    parts << QString("[vbase][wm]overlay=%1[vout]").arg(ConversionOptions::overlayPosition(s.watermarkPosition));

    spec.option = "-filter_complex";
    spec.graph = parts.join(';');
    spec.outputLabel = "[vout]";
    spec.extraInputs << wm;
    spec.filtersUsed = true;
    return spec;
}

QStringList FfmpegCommandBuilder::metadataArgs(const ConversionSettings& s)
{
    QStringList args;
    if (s.stripMetadata) args << "-map_metadata" << "-1";
    else if (s.copyMetadata) args << "-map_metadata" << "0";

    const QString title = s.metaTitle.trimmed();
    if (!title.isEmpty()) args << "-metadata" << "title=" + title;
    const QString comment = s.metaComment.trimmed();
    if (!comment.isEmpty()) args << "-metadata" << "comment=" + comment;
    const QString author = s.metaAuthor.trimmed();
    if (!author.isEmpty()) args << "-metadata" << "artist=" + author;
    const QString copyright = s.metaCopyright.trimmed();
    if (!copyright.isEmpty()) args << "-metadata" << "copyright=" + copyright;
    return args;
}

FfmpegCommandBuilder::CopyDecision FfmpegCommandBuilder::fastCopyAllowed(const QString& inputPath, const QString& outExt,
                                                                         const MediaInfo::MediaDetails* info,
                                                                         bool filtersUsed, bool audioFilterUsed)
{
    const QString ext = normalizeExt(outExt);
    if (ext == "gif") return {false, tr("GIF requires re-encoding")};
    if (filtersUsed || audioFilterUsed) return {false, tr("Filters or speed change are active")};
    if (QFileInfo(inputPath).suffix().toLower() != ext) return {false, tr("Container differs")};
    if (info && !info->videoCodec.isEmpty() && !containerSupportsCodec(ext, info->videoCodec)) {
        return {false, tr("Codec is not compatible with the container")};
    }
    return {true, QString()};
}

FfmpegCommandBuilder::CopyDecision FfmpegCommandBuilder::mergeCopyAllowed(const QStringList& inputs, const QString& outExt,
                                                                          const QHash<QString, MediaInfo::MediaDetails>& infos,
                                                                          bool filtersUsed, bool audioFilterUsed,
                                                                          const QStringList& trimArgs)
{
    if (filtersUsed || audioFilterUsed || !trimArgs.isEmpty()) return {false, tr("Filters or trim are active")};
    if (inputs.isEmpty()) return {false, tr("No inputs")};
    if (normalizeExt(outExt) != QFileInfo(inputs.first()).suffix().toLower()) return {false, tr("Container differs")};

    QSet<QString> vcodecs;
    QSet<QString> acodecs;
    for (const QString& path : inputs) {
        auto it = infos.constFind(path);
        if (it == infos.constEnd() || it->videoCodec.isEmpty()) return {false, tr("No probe data")};
        vcodecs.insert(it->videoCodec);
        if (!it->audioCodec.isEmpty()) acodecs.insert(it->audioCodec);
    }
    if (vcodecs.size() > 1 || acodecs.size() > 1) return {false, tr("Codecs differ")};
    return {true, QString()};
}

QStringList FfmpegCommandBuilder::encodeArgs(const QStringList& head, const FilterSpec& spec, const QString& audioFilter,
                                             const QString& outExt, const QString& output, const ConversionSettings& s) const
{
    QStringList args = head;

    if (!spec.option.isEmpty()) {
        args << spec.option << spec.graph;
        if (spec.option == "-filter_complex" && !spec.outputLabel.isEmpty()) args << "-map" << spec.outputLabel;
        else args << "-map" << "0:v:0?";
    } else {
        args << "-map" << "0:v:0?";
    }

    if (outExt == "gif") {
        args << "-an";
        args << metadataArgs(s);
        args << output;
        return args;
    }

    args << "-map" << "0:a:0?";
    if (!audioFilter.isEmpty()) args << "-filter:a" << audioFilter;

    const QString codec = resolveCodec(outExt, s.videoCodec);
    const Encoder enc = selectEncoder(codec, s.hwEncoder);
    args << "-c:v" << enc.name;
    if (!enc.hardware && (enc.name == "libx264" || enc.name == "libx265")) {
        const QString preset = s.encoderPreset.trimmed().isEmpty() ? QStringLiteral("medium") : s.encoderPreset.trimmed();
        args << "-preset" << preset;
    }
    args << encoderQualityArgs(enc.name, s.crf);

    static const QSet<QString> yuv420 = {
        "libx264", "libx265", "h264_nvenc", "hevc_nvenc", "h264_qsv", "hevc_qsv", "h264_amf", "hevc_amf"
    };
    if (yuv420.contains(enc.name)) args << "-pix_fmt" << "yuv420p";

    if (outExt == "webm") args << "-c:a" << "libopus" << "-b:a" << "128k";
    else args << "-c:a" << "aac" << "-b:a" << "192k";

    if (usesFaststart(outExt)) args << "-movflags" << "+faststart";

    args << metadataArgs(s);
    args << output;
    return args;
}

QStringList FfmpegCommandBuilder::buildVideoCommand(const QString& input, const QString& output,
                                                    const ConversionSettings& s, bool allowFastCopy) const
{
    const QString overwrite = s.overwrite ? QStringLiteral("-y") : QStringLiteral("-n");
    const QString outExt = QFileInfo(output).suffix().toLower();

    const QStringList trim = trimArgs(s);

    if (allowFastCopy) {
        QStringList args{overwrite, "-i", input};
        args << trim;
        args << "-map" << "0" << "-c" << "copy";
        args << metadataArgs(s);
        if (usesFaststart(outExt)) args << "-movflags" << "+faststart";
        args << output;
        return args;
    }

    const FilterSpec spec = videoFilterSpec(s, outExt);
    QStringList head{overwrite, "-i", input};
    if (!spec.extraInputs.isEmpty()) head << "-i" << spec.extraInputs.first();
    head << trim;
    return encodeArgs(head, spec, audioSpeedFilter(s), outExt, output, s);
}

QStringList FfmpegCommandBuilder::buildImageCommand(const QString& input, const QString& output,
                                                    const ConversionSettings& s) const
{
    const QString overwrite = s.overwrite ? QStringLiteral("-y") : QStringLiteral("-n");
    const QString ext = QFileInfo(output).suffix().toLower();

    const FilterSpec spec = imageFilterSpec(s);
    QStringList args{overwrite, "-i", input};
    if (!spec.extraInputs.isEmpty()) args << "-i" << spec.extraInputs.first();
    if (!spec.option.isEmpty()) {
        args << spec.option << spec.graph;
        if (spec.option == "-filter_complex" && !spec.outputLabel.isEmpty()) args << "-map" << spec.outputLabel;
    }

    args << metadataArgs(s);

    const int q = s.imageQuality;
    if (ext == "jpg" || ext == "jpeg") {
        const int qv = std::clamp(int(std::lround(31.0 - (q / 100.0) * 29.0)), 2, 31);
        args << "-q:v" << QString::number(qv);
    } else if (ext == "webp") {
        args << "-q:v" << QString::number(std::clamp(q, 0, 100));
    }

    args << output;
    return args;
}

QStringList FfmpegCommandBuilder::buildMergeCommand(const QString& listFile, const QString& output,
                                                    const ConversionSettings& s, bool allowFastCopy) const
{
    const QString overwrite = s.overwrite ? QStringLiteral("-y") : QStringLiteral("-n");
    const QString outExt = QFileInfo(output).suffix().toLower();

    const QStringList trim = trimArgs(s);
    const FilterSpec spec = videoFilterSpec(s, outExt);

    QStringList head{overwrite, "-f", "concat", "-safe", "0", "-i", listFile};
    if (!spec.extraInputs.isEmpty()) head << "-i" << spec.extraInputs.first();
    head << trim;

    if (allowFastCopy) {
        QStringList args = head;
        args << "-map" << "0" << "-c" << "copy";
        args << metadataArgs(s);
        if (usesFaststart(outExt)) args << "-movflags" << "+faststart";
        args << output;
        return args;
    }

    return encodeArgs(head, spec, audioSpeedFilter(s), outExt, output, s);
}

bool FfmpegCommandBuilder::writeConcatList(const QStringList& inputs, const QString& listPath, QString* errorMessage)
{
    QFile f(listPath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorMessage) *errorMessage = QString("Cannot write concat list %1: %2").arg(listPath, f.errorString());
        return false;
    }
    QTextStream ts(&f);
    ts.setEncoding(QStringConverter::Utf8);
    for (const QString& in : inputs) {
        QString safe = QFileInfo(in).absoluteFilePath();
        safe.replace("'", "'\\''");
        ts << "file '" << safe << "'\n";
    }
    ts.flush();
    if (ts.status() != QTextStream::Ok) {
        if (errorMessage) *errorMessage = QString("Cannot write concat list %1").arg(listPath);
        return false;
    }
    return true;
}

QStringList FfmpegCommandBuilder::withProgressOutput(const QStringList& args)
{
    if (args.isEmpty()) return args;
    QStringList out;
    out << args.first() << "-progress" << "pipe:1" << "-nostats" << "-hide_banner";
    out << args.mid(1);
    return out;
}
