#pragma once

#include "conversion_settings.h"
#include "media_probe.h"

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>

// Turns ConversionSettings into ffmpeg argument lists. Arguments never include
// the program itself; the caller owns the ffmpeg path. Extensions are passed
// lowercase without the dot ("mp4").
class FfmpegCommandBuilder {
public:
    using LogCallback = std::function<void(const QString& level, const QString& message)>;

    struct FilterSpec {
        QString option;           // "-vf", "-filter_complex" or empty
        QString graph;
        QString outputLabel;      // only for -filter_complex
        QStringList extraInputs;  // watermark image
        bool filtersUsed = false;
    };

    struct Encoder {
        QString name;
        bool hardware = false;
    };

    struct CopyDecision {
        bool allowed = false;
        QString reason;
    };

    explicit FfmpegCommandBuilder(const QSet<QString>& encoderCaps = QSet<QString>(), LogCallback log = LogCallback());

    void setEncoderCaps(const QSet<QString>& caps) { m_caps = caps; }
    const QSet<QString>& encoderCaps() const { return m_caps; }
    void setLogCallback(LogCallback log) { m_log = std::move(log); }

    static QString escapeDrawtext(const QString& text);
    static QString escapeFilterPath(const QString& path);
    static bool containerSupportsCodec(const QString& ext, const QString& videoCodec);

    QString resolveCodec(const QString& outExt, const QString& codecChoice) const;
    Encoder selectEncoder(const QString& codec, const QString& hwPreference) const;
    static QStringList encoderQualityArgs(const QString& encoder, int crf);

    QStringList trimArgs(const ConversionSettings& s) const;
    static QString audioSpeedFilter(const ConversionSettings& s);
    static QString textFilter(const ConversionSettings& s);
    FilterSpec videoFilterSpec(const ConversionSettings& s, const QString& outExt) const;
    FilterSpec imageFilterSpec(const ConversionSettings& s) const;
    static QStringList metadataArgs(const ConversionSettings& s);

    static CopyDecision fastCopyAllowed(const QString& inputPath, const QString& outExt,
                                        const MediaInfo::MediaDetails* info,
                                        bool filtersUsed, bool audioFilterUsed);
    static CopyDecision mergeCopyAllowed(const QStringList& inputs, const QString& outExt,
                                         const QHash<QString, MediaInfo::MediaDetails>& infos,
                                         bool filtersUsed, bool audioFilterUsed,
                                         const QStringList& trimArgs);

    QStringList buildVideoCommand(const QString& input, const QString& output,
                                  const ConversionSettings& s, bool allowFastCopy) const;
    QStringList buildImageCommand(const QString& input, const QString& output,
                                  const ConversionSettings& s) const;
    // listFile is a concat demuxer list written by writeConcatList()
    QStringList buildMergeCommand(const QString& listFile, const QString& output,
                                  const ConversionSettings& s, bool allowFastCopy) const;

    static bool writeConcatList(const QStringList& inputs, const QString& listPath, QString* errorMessage = nullptr);

    // Inserts "-progress pipe:1 -nostats -hide_banner" right after the overwrite flag
    static QStringList withProgressOutput(const QStringList& args);

private:
    void warn(const QString& message) const;
    QString watermarkInput(const ConversionSettings& s) const;
    QString watermarkChain(const ConversionSettings& s) const;
    QStringList encodeArgs(const QStringList& head, const FilterSpec& spec, const QString& audioFilter,
                           const QString& outExt, const QString& output, const ConversionSettings& s) const;

    QSet<QString> m_caps;
    LogCallback m_log;
};
