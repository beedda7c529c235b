#include "command_builder.hpp"

#include <algorithm>

namespace CommandBuilder
{
QStringList build(const QString& inputPath, const QString& outputPath, const EncodeConfig& config, const PlannedBitrate& planned)
{
    QStringList arguments { "-i", inputPath };

    if (const QString filters = videoFilters(config); !filters.isEmpty())
        arguments << "-filter:v" << filters;

    arguments << "-c:v" << videoCodecFor(config.encoder)
              << "-b:v" << QString::number(planned.videoBitsPerSecond)
              << "-c:a" << kAudioCodec
              << "-b:a" << QString::number(planned.audioBitsPerSecond);

    if (config.preset != Preset::Unspecified)
        arguments << "-preset" << toString(config.preset);

    arguments << "-y" << outputPath;

    return arguments;
}

QString videoFilters(const EncodeConfig& config)
{
    QStringList filters;

    if (config.frameRate.has_value())
        filters.append("fps=" + QString::number(*config.frameRate));

    if (const optional<int> height = heightFor(config.resolution); height.has_value())
        filters.append(QString("scale=-1:%1").arg(*height));

    return filters.join(',');
}

QString videoCodecFor(EncoderChoice encoder)
{
    return encoder == EncoderChoice::Gpu ? kGpuVideoCodec : kCpuVideoCodec;
}

QString outputPathFor(const QString& inputPath)
{
    const qsizetype separator = std::max(inputPath.lastIndexOf('/'), inputPath.lastIndexOf('\\'));
    const qsizetype dot = inputPath.lastIndexOf('.');

    // a leading dot names a hidden file, not an extension
    const QString stem = dot > separator + 1 ? inputPath.left(dot) : inputPath;

    return stem + "." + kOutputSuffix;
}

QString quote(const QString& argument)
{
    if (!argument.contains(' ') && !argument.contains('"') && !argument.contains('\''))
        return argument;

    QString escaped = argument;
    escaped.replace("\"", "\\\"");

    return "\"" + escaped + "\"";
}

QString render(const QString& program, const QStringList& arguments)
{
    QStringList parts { quote(program) };

    for (const QString& argument : arguments)
        parts.append(quote(argument));

    return parts.join(' ');
}
}
