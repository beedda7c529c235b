#include "encoder/encode_config.hpp"
#include "settings/encode_config_store.hpp"
#include "settings/ini_settings.hpp"

#include "test_support.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class EncodeConfigStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        workDir = QDir(dir.path());
    }

    QString writeDefaults(const QByteArray& contents) const
    {
        const QString path = workDir.filePath("config_default.ini");

        QFile file(path);
        if (file.open(QIODevice::WriteOnly | QIODevice::Truncate))
            file.write(contents);

        return path;
    }

    QTemporaryDir dir;
    QDir workDir;
};

TEST_F(EncodeConfigStoreTest, EmptySettingsGiveDefaults)
{
    const IniSettings settings(workDir.filePath("config.ini"));
    const EncodeConfig config = loadEncodeConfig(settings);

    EXPECT_EQ(config.targetSizeMb, 10u);
    EXPECT_FALSE(config.frameRate.has_value());
    EXPECT_EQ(config.encoder, EncoderChoice::Cpu);
    EXPECT_EQ(config.resolution, Resolution::Original);
    EXPECT_EQ(config.preset, Preset::Unspecified);
    EXPECT_FALSE(config.darkModeEnabled);
}

TEST_F(EncodeConfigStoreTest, SavedConfigLoadsBack)
{
    EncodeConfig saved;
    saved.targetSizeMb = 25;
    saved.frameRate = 24;
    saved.encoder = EncoderChoice::Gpu;
    saved.resolution = Resolution::R480;
    saved.preset = Preset::Slow;
    saved.darkModeEnabled = true;
    saved.ffmpegProgram = "/opt/ffmpeg/bin/ffmpeg";
    saved.ffprobeProgram = "/opt/ffmpeg/bin/ffprobe";

    {
        IniSettings settings(workDir.filePath("config.ini"));
        saveEncodeConfig(settings, saved);
    }

    const IniSettings reopened(workDir.filePath("config.ini"));
    const EncodeConfig loaded = loadEncodeConfig(reopened);

    EXPECT_EQ(loaded.targetSizeMb, 25u);
    EXPECT_EQ(loaded.frameRate, 24u);
    EXPECT_EQ(loaded.encoder, EncoderChoice::Gpu);
    EXPECT_EQ(loaded.resolution, Resolution::R480);
    EXPECT_EQ(loaded.preset, Preset::Slow);
    EXPECT_TRUE(loaded.darkModeEnabled);
    EXPECT_EQ(loaded.ffmpegProgram, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(loaded.ffprobeProgram, "/opt/ffmpeg/bin/ffprobe");
}

TEST_F(EncodeConfigStoreTest, ZeroFrameRateKeepsSourceRate)
{
    IniSettings settings(workDir.filePath("config.ini"));
    settings.Set("Compression/iFrameRate", 0);

    EXPECT_FALSE(loadEncodeConfig(settings).frameRate.has_value());
}

TEST_F(EncodeConfigStoreTest, InvalidValuesFallBackToDefaults)
{
    IniSettings settings(workDir.filePath("config.ini"));
    settings.Set("Compression/iTargetSizeMb", "lots");
    settings.Set("Compression/sEncoder", "tpu");
    settings.Set("Compression/sResolution", "4k");
    settings.Set("Compression/sPreset", "glacial");

    const EncodeConfig config = loadEncodeConfig(settings);

    EXPECT_EQ(config.targetSizeMb, 10u);
    EXPECT_EQ(config.encoder, EncoderChoice::Cpu);
    EXPECT_EQ(config.resolution, Resolution::Original);
    EXPECT_EQ(config.preset, Preset::Unspecified);
}

TEST_F(EncodeConfigStoreTest, MissingKeysComeFromDefaultsFile)
{
    const QString defaults = writeDefaults("[Compression]\niTargetSizeMb=50\nsPreset=fast\n");

    IniSettings settings(workDir.filePath("config.ini"), defaults);
    settings.Set("Compression/iTargetSizeMb", 8);

    const EncodeConfig config = loadEncodeConfig(settings);

    EXPECT_EQ(config.targetSizeMb, 8u);
    EXPECT_EQ(config.preset, Preset::Fast);
    EXPECT_EQ(settings.get("Compression/sPreset").toString(), "fast");
    EXPECT_TRUE(settings.get("Compression/sEncoder").isNull());
}

TEST(EncodeConfigTest, NamesConvertBothWays)
{
    EXPECT_EQ(toString(Resolution::R1080), "1080p");
    EXPECT_EQ(toString(Resolution::Original), "original");
    EXPECT_EQ(toString(Preset::Unspecified), "none");
    EXPECT_EQ(toString(EncoderChoice::Gpu), "gpu");

    EXPECT_EQ(resolutionFromString(" 720P "), Resolution::R720);
    EXPECT_EQ(presetFromString("VeryFast"), Preset::Veryfast);
    EXPECT_EQ(encoderFromString("CPU"), EncoderChoice::Cpu);
    EXPECT_FALSE(presetFromString("").has_value());

    const QStringList presets = presetNames();
    ASSERT_EQ(presets.size(), 10);
    EXPECT_EQ(presets.first(), "none");
    EXPECT_EQ(presets.last(), "veryslow");

    EXPECT_EQ(resolutionNames(), QStringList({ "original", "1080p", "720p", "480p" }));
    EXPECT_FALSE(heightFor(Resolution::Original).has_value());
}

TEST(EncodeConfigTest, NvencOnlyTakesItsOwnPresets)
{
    EXPECT_TRUE(nvencAcceptsPreset(Preset::Unspecified));
    EXPECT_TRUE(nvencAcceptsPreset(Preset::Medium));
    EXPECT_FALSE(nvencAcceptsPreset(Preset::Ultrafast));
    EXPECT_FALSE(nvencAcceptsPreset(Preset::Veryslow));
}
