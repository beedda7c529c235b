#ifndef BITRATE_PLANNER_H
#define BITRATE_PLANNER_H

#include "encode_error.hpp"
#include "utils/either.hpp"

#include <QtGlobal>

struct PlannedBitrate {
    qint64 videoBitsPerSecond;
    qint64 audioBitsPerSecond;

    bool operator==(const PlannedBitrate&) const = default;
};

namespace BitratePlanner
{
// Legacy byte-to-GiB normalization factor
constexpr double kSizeNormalization = 1.073741824;
constexpr qint64 kBytesPerMegabyte = 1000 * 1000;
constexpr qint64 kMinAudioBitrate = 64000;
constexpr qint64 kMaxAudioBitrate = 256000;

//!
//! \brief Splits the bit budget of a target file size between video and audio.
//! \details Audio keeps its source bitrate unless it would take more than a tenth of the budget, in which case it
//! gets a tenth clamped to [64, 256] kbps. Video gets the rest, never less than 0.
//! \return The planned split, or InvalidDuration when the duration is not strictly positive.
//!
[[nodiscard]] Either<PlannedBitrate, EncodeError> plan(quint32 targetSizeMb, double durationSeconds, qint64 sourceAudioBps);

[[nodiscard]] double targetTotalBitrate(quint32 targetSizeMb, double durationSeconds);
}

#endif
