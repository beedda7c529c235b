#ifndef COMMAND_BUILDER_H
#define COMMAND_BUILDER_H

#include "bitrate_planner.hpp"
#include "encode_config.hpp"

#include <QStringList>

namespace CommandBuilder
{
constexpr auto kCpuVideoCodec = "libx264";
constexpr auto kGpuVideoCodec = "h264_nvenc";
constexpr auto kAudioCodec = "aac";
constexpr auto kOutputSuffix = "compressed.mp4";

//!
//! \brief Builds the ffmpeg argument vector for one job.
//! \details Arguments are meant to be passed to QProcess as-is, never through a shell.
//!
[[nodiscard]] QStringList build(
    const QString& inputPath, const QString& outputPath, const EncodeConfig& config, const PlannedBitrate& planned
);

[[nodiscard]] QString videoFilters(const EncodeConfig& config);
[[nodiscard]] QString videoCodecFor(EncoderChoice encoder);

//! Replaces the extension of the file name with "compressed.mp4".
[[nodiscard]] QString outputPathFor(const QString& inputPath);

//! Renders a command line for display, quoting arguments that contain spaces or quotes.
[[nodiscard]] QString render(const QString& program, const QStringList& arguments);
[[nodiscard]] QString quote(const QString& argument);
}

#endif
