#ifndef ENCODE_CONFIG_H
#define ENCODE_CONFIG_H

#include <QString>
#include <QStringList>
#include <optional>

using std::optional;

enum class EncoderChoice {
    Cpu,
    Gpu
};

enum class Resolution {
    Original,
    R1080,
    R720,
    R480
};

// https://trac.ffmpeg.org/wiki/Encode/H.264#Preset
enum class Preset {
    Unspecified,
    Ultrafast,
    Superfast,
    Veryfast,
    Faster,
    Fast,
    Medium,
    Slow,
    Slower,
    Veryslow
};

//!
//! \brief Snapshot of the compression settings, taken once when a job starts.
//!
struct EncodeConfig {
    quint32 targetSizeMb = 10;
    optional<quint32> frameRate;
    EncoderChoice encoder = EncoderChoice::Cpu;
    Resolution resolution = Resolution::Original;
    Preset preset = Preset::Unspecified;
    bool darkModeEnabled = false;
    QString ffmpegProgram = "ffmpeg";
    QString ffprobeProgram = "ffprobe";
};

optional<int> heightFor(Resolution resolution);

QString toString(EncoderChoice encoder);
QString toString(Resolution resolution);
QString toString(Preset preset);

optional<EncoderChoice> encoderFromString(const QString& name);
optional<Resolution> resolutionFromString(const QString& name);
optional<Preset> presetFromString(const QString& name);

//! h264_nvenc only understands a few of the libx264 preset names.
bool nvencAcceptsPreset(Preset preset);

//! Preset names in speed order, starting with "none".
QStringList presetNames();
QStringList resolutionNames();

#endif
