#include "formats/media_probe.hpp"

#include "test_support.hpp"

#include <QTemporaryDir>
#include <gtest/gtest.h>

TEST(MediaProbeTest, ParsesBitrateThenDuration)
{
    const ProbeResult result = MediaProbe::parse("320000\n60.000000\n");

    ASSERT_TRUE(result.isRight());
    EXPECT_EQ(result.getRight().audioBitrateBps, 320000);
    EXPECT_DOUBLE_EQ(result.getRight().durationSeconds, 60.0);
}

TEST(MediaProbeTest, ToleratesCarriageReturnsAndBlankLines)
{
    const ProbeResult result = MediaProbe::parse("\r\n128000\r\n\r\n12.5\r\n");

    ASSERT_TRUE(result.isRight());
    EXPECT_EQ(result.getRight().audioBitrateBps, 128000);
    EXPECT_DOUBLE_EQ(result.getRight().durationSeconds, 12.5);
}

TEST(MediaProbeTest, RejectsUnreadableValues)
{
    const ProbeResult noDuration = MediaProbe::parse("320000\nN/A\n");
    ASSERT_TRUE(noDuration.isLeft());
    EXPECT_EQ(noDuration.getLeft().kind, EncodeError::ProbeParseError);
    EXPECT_TRUE(noDuration.getLeft().details.contains("N/A"));

    const ProbeResult noBitrate = MediaProbe::parse("N/A\n60.0\n");
    ASSERT_TRUE(noBitrate.isLeft());
    EXPECT_EQ(noBitrate.getLeft().kind, EncodeError::ProbeParseError);
}

TEST(MediaProbeTest, RejectsWrongNumberOfValues)
{
    const QList<QByteArray> outputs {
        QByteArray(),
        QByteArray("60.0\n"),
        QByteArray("\n\n"),
        QByteArray("320000\n60.0\n128000\n"),
    };

    for (const QByteArray& output : outputs) {
        const ProbeResult result = MediaProbe::parse(output);

        ASSERT_TRUE(result.isLeft()) << output.constData();
        EXPECT_EQ(result.getLeft().kind, EncodeError::ProbeParseError);
    }
}

TEST(MediaProbeTest, AsksForFirstAudioStreamAndFormatDuration)
{
    const QStringList arguments = MediaProbe::arguments("/tmp/my clip.mkv");

    EXPECT_EQ(arguments.at(arguments.indexOf("-select_streams") + 1), "a:0");
    EXPECT_EQ(arguments.at(arguments.indexOf("-show_entries") + 1), "format=duration:stream=bit_rate");
    EXPECT_EQ(arguments.at(arguments.indexOf("-of") + 1), "default=noprint_wrappers=1:nokey=1");
    EXPECT_EQ(arguments.last(), "/tmp/my clip.mkv");
}

#ifndef Q_OS_WIN

TEST(MediaProbeTest, ReportsMissingProgram)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const MediaProbe probe(QDir(dir.path()).filePath("no-such-ffprobe"));
    const ProbeResult result = probe.probe("/tmp/clip.mkv");

    ASSERT_TRUE(result.isLeft());
    EXPECT_EQ(result.getLeft().kind, EncodeError::ProbeUnavailable);
}

TEST(MediaProbeTest, ReportsFailingProbeWithItsErrorOutput)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString program = writeScript(QDir(dir.path()), "ffprobe", "echo 'Invalid data found' >&2\nexit 1\n");
    const ProbeResult result = MediaProbe(program).probe("/tmp/clip.mkv");

    ASSERT_TRUE(result.isLeft());
    EXPECT_EQ(result.getLeft().kind, EncodeError::ProbeFailed);
    EXPECT_EQ(result.getLeft().details, "Invalid data found");
}

TEST(MediaProbeTest, ReadsStatsFromProbeOutput)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString program = writeScript(QDir(dir.path()), "ffprobe", "printf '192000\\n42.5\\n'\n");
    const ProbeResult result = MediaProbe(program).probe("/tmp/clip.mkv");

    ASSERT_TRUE(result.isRight());
    EXPECT_EQ(result.getRight().audioBitrateBps, 192000);
    EXPECT_DOUBLE_EQ(result.getRight().durationSeconds, 42.5);
}

#endif
