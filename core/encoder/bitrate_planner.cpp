#include "bitrate_planner.hpp"

#include <QObject>

#include <algorithm>
#include <cmath>
#include <limits>

namespace BitratePlanner
{
double targetTotalBitrate(quint32 targetSizeMb, double durationSeconds)
{
    const double targetBits = static_cast<double>(targetSizeMb) * kBytesPerMegabyte * 8.0;
    return targetBits / (kSizeNormalization * durationSeconds);
}

Either<PlannedBitrate, EncodeError> plan(quint32 targetSizeMb, double durationSeconds, qint64 sourceAudioBps)
{
    if (!std::isfinite(durationSeconds) || durationSeconds <= 0)
    {
        return EncodeError {
            EncodeError::InvalidDuration,
            QObject::tr("Cannot plan bitrates for a media duration of %1 seconds.").arg(durationSeconds)
        };
    }

    // saturate rather than overflow on absurdly short media
    const double totalBitrate = std::min(
        targetTotalBitrate(targetSizeMb, durationSeconds), static_cast<double>(std::numeric_limits<qint32>::max()) * 1000.0
    );

    qint64 audioBitrate = sourceAudioBps;
    if (10.0 * static_cast<double>(sourceAudioBps) > totalBitrate)
    {
        audioBitrate = std::clamp(static_cast<qint64>(totalBitrate / 10.0), kMinAudioBitrate, kMaxAudioBitrate);
    }

    const auto totalBitrateFloor = static_cast<qint64>(totalBitrate);
    const qint64 videoBitrate = std::max<qint64>(0, totalBitrateFloor - audioBitrate);

    return PlannedBitrate { .videoBitsPerSecond = videoBitrate, .audioBitsPerSecond = audioBitrate };
}
}
