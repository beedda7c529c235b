#include "encoder/bitrate_planner.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace
{
PlannedBitrate planned(quint32 targetSizeMb, double durationSeconds, qint64 sourceAudioBps)
{
    const auto result = BitratePlanner::plan(targetSizeMb, durationSeconds, sourceAudioBps);
    EXPECT_TRUE(result.isRight());
    return result.getRight();
}
}

TEST(BitratePlannerTest, TenMegabytesOverOneMinuteCapsLoudAudio)
{
    EXPECT_EQ(static_cast<qint64>(BitratePlanner::targetTotalBitrate(10, 60)), 1241763);

    const PlannedBitrate bitrate = planned(10, 60, 320000);

    EXPECT_EQ(bitrate.audioBitsPerSecond, 124176);
    EXPECT_EQ(bitrate.videoBitsPerSecond, 1117587);
}

TEST(BitratePlannerTest, KeepsSourceAudioWhenItFitsInATenthOfTheBudget)
{
    const auto total = static_cast<qint64>(BitratePlanner::targetTotalBitrate(100, 60));
    const PlannedBitrate bitrate = planned(100, 60, 128000);

    EXPECT_EQ(bitrate.audioBitsPerSecond, 128000);
    EXPECT_EQ(bitrate.videoBitsPerSecond, total - 128000);
}

TEST(BitratePlannerTest, ClampsAudioToFloorAndSaturatesVideoAtZero)
{
    // one hour in 25 MB leaves about 51 kbps in total
    const PlannedBitrate bitrate = planned(25, 3600, 128000);

    EXPECT_EQ(bitrate.audioBitsPerSecond, BitratePlanner::kMinAudioBitrate);
    EXPECT_EQ(bitrate.videoBitsPerSecond, 0);
}

TEST(BitratePlannerTest, ClampsAudioToCeiling)
{
    const auto total = static_cast<qint64>(BitratePlanner::targetTotalBitrate(100, 10));
    const PlannedBitrate bitrate = planned(100, 10, 8000000);

    EXPECT_EQ(bitrate.audioBitsPerSecond, BitratePlanner::kMaxAudioBitrate);
    EXPECT_EQ(bitrate.videoBitsPerSecond, total - BitratePlanner::kMaxAudioBitrate);
}

TEST(BitratePlannerTest, SourceWithoutAudioBitrateGetsAllTheBudgetForVideo)
{
    const auto total = static_cast<qint64>(BitratePlanner::targetTotalBitrate(8, 30));
    const PlannedBitrate bitrate = planned(8, 30, 0);

    EXPECT_EQ(bitrate.audioBitsPerSecond, 0);
    EXPECT_EQ(bitrate.videoBitsPerSecond, total);
}

TEST(BitratePlannerTest, RejectsNonPositiveDuration)
{
    for (const double duration : { 0.0, -1.0, std::numeric_limits<double>::quiet_NaN() }) {
        const auto result = BitratePlanner::plan(10, duration, 128000);

        ASSERT_TRUE(result.isLeft()) << duration;
        EXPECT_EQ(result.getLeft().kind, EncodeError::InvalidDuration);
    }
}

TEST(BitratePlannerTest, SamePlanForSameInputs)
{
    EXPECT_EQ(planned(42, 123.456, 192000), planned(42, 123.456, 192000));
}

TEST(BitratePlannerTest, VideoNeverNegativeAndAudioAlwaysBoundedOrUntouched)
{
    const quint32 targets[] = { 1, 8, 10, 25, 100, 4000 };
    const double durations[] = { 0.5, 5, 60, 600, 7200 };
    const qint64 audioRates[] = { 0, 32000, 96000, 128000, 320000, 1536000 };

    for (const quint32 target : targets) {
        for (const double duration : durations) {
            for (const qint64 audio : audioRates) {
                const PlannedBitrate bitrate = planned(target, duration, audio);
                const double total = BitratePlanner::targetTotalBitrate(target, duration);

                EXPECT_GE(bitrate.videoBitsPerSecond, 0);

                if (10.0 * audio > total) {
                    EXPECT_GE(bitrate.audioBitsPerSecond, BitratePlanner::kMinAudioBitrate);
                    EXPECT_LE(bitrate.audioBitsPerSecond, BitratePlanner::kMaxAudioBitrate);
                } else {
                    EXPECT_EQ(bitrate.audioBitsPerSecond, audio);
                }
            }
        }
    }
}
