#include "encode_config_store.hpp"

#include "utils/logging.hpp"

#include <QSysInfo>

namespace
{
const QString kTargetSizeKey = "Compression/iTargetSizeMb";
const QString kFrameRateKey = "Compression/iFrameRate";
const QString kEncoderKey = "Compression/sEncoder";
const QString kResolutionKey = "Compression/sResolution";
const QString kPresetKey = "Compression/sPreset";
const QString kDarkModeKey = "Appearance/bDarkMode";
const QString kFFmpegKey = "Tools/sFFmpegPath";
const QString kFFprobeKey = "Tools/sFFprobePath";

optional<quint32> readUnsigned(const Settings& settings, const QString& key)
{
    const QVariant value = settings.get(key);
    if (value.isNull())
        return {};

    bool ok = false;
    const uint number = value.toString().trimmed().toUInt(&ok);
    if (!ok)
    {
        qCWarning(lcConfig) << "Ignoring non-numeric value" << value.toString() << "for" << key;
        return {};
    }

    return number;
}

template <typename T, typename Parser>
void readEnum(const Settings& settings, const QString& key, T& target, Parser parse)
{
    const QVariant value = settings.get(key);
    if (value.isNull())
        return;

    if (const optional<T> parsed = parse(value.toString()); parsed.has_value())
        target = *parsed;
    else
        qCWarning(lcConfig) << "Ignoring unknown value" << value.toString() << "for" << key;
}
}

EncodeConfig loadEncodeConfig(const Settings& settings)
{
    EncodeConfig config;

    if (QSysInfo::kernelType() == "winnt")
    {
        config.ffmpegProgram = "ffmpeg.exe";
        config.ffprobeProgram = "ffprobe.exe";
    }

    if (const optional<quint32> targetSize = readUnsigned(settings, kTargetSizeKey); targetSize.has_value())
        config.targetSizeMb = *targetSize;

    // 0 keeps the source frame rate
    if (const optional<quint32> frameRate = readUnsigned(settings, kFrameRateKey); frameRate.value_or(0) > 0)
        config.frameRate = frameRate;

    readEnum(settings, kEncoderKey, config.encoder, encoderFromString);
    readEnum(settings, kResolutionKey, config.resolution, resolutionFromString);
    readEnum(settings, kPresetKey, config.preset, presetFromString);

    if (const QVariant darkMode = settings.get(kDarkModeKey); !darkMode.isNull())
        config.darkModeEnabled = darkMode.toBool();

    if (const QString ffmpeg = settings.get(kFFmpegKey).toString().trimmed(); !ffmpeg.isEmpty())
        config.ffmpegProgram = ffmpeg;

    if (const QString ffprobe = settings.get(kFFprobeKey).toString().trimmed(); !ffprobe.isEmpty())
        config.ffprobeProgram = ffprobe;

    return config;
}

void saveEncodeConfig(Settings& settings, const EncodeConfig& config)
{
    settings.Set(kTargetSizeKey, config.targetSizeMb);
    settings.Set(kFrameRateKey, config.frameRate.value_or(0));
    settings.Set(kEncoderKey, toString(config.encoder));
    settings.Set(kResolutionKey, toString(config.resolution));
    settings.Set(kPresetKey, toString(config.preset));
    settings.Set(kDarkModeKey, config.darkModeEnabled);
    settings.Set(kFFmpegKey, config.ffmpegProgram);
    settings.Set(kFFprobeKey, config.ffprobeProgram);
    settings.sync();

    qCDebug(lcConfig) << "Saved configuration to" << settings.fileName();
}
