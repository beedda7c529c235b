#include "encode_config.hpp"

#include <array>

namespace
{
constexpr std::array presets {
    Preset::Unspecified, Preset::Ultrafast, Preset::Superfast, Preset::Veryfast, Preset::Faster,
    Preset::Fast,        Preset::Medium,    Preset::Slow,      Preset::Slower,   Preset::Veryslow,
};

constexpr std::array resolutions { Resolution::Original, Resolution::R1080, Resolution::R720, Resolution::R480 };
}

optional<int> heightFor(Resolution resolution)
{
    switch (resolution)
    {
    case Resolution::R1080:
        return 1080;
    case Resolution::R720:
        return 720;
    case Resolution::R480:
        return 480;
    case Resolution::Original:
        break;
    }

    return {};
}

QString toString(EncoderChoice encoder)
{
    return encoder == EncoderChoice::Gpu ? "gpu" : "cpu";
}

QString toString(Resolution resolution)
{
    const optional<int> height = heightFor(resolution);
    return height.has_value() ? QString("%1p").arg(*height) : "original";
}

QString toString(Preset preset)
{
    switch (preset)
    {
    case Preset::Ultrafast:
        return "ultrafast";
    case Preset::Superfast:
        return "superfast";
    case Preset::Veryfast:
        return "veryfast";
    case Preset::Faster:
        return "faster";
    case Preset::Fast:
        return "fast";
    case Preset::Medium:
        return "medium";
    case Preset::Slow:
        return "slow";
    case Preset::Slower:
        return "slower";
    case Preset::Veryslow:
        return "veryslow";
    case Preset::Unspecified:
        break;
    }

    return "none";
}

optional<EncoderChoice> encoderFromString(const QString& name)
{
    const QString normalized = name.trimmed().toLower();

    if (normalized == "cpu")
        return EncoderChoice::Cpu;

    if (normalized == "gpu")
        return EncoderChoice::Gpu;

    return {};
}

optional<Resolution> resolutionFromString(const QString& name)
{
    const QString normalized = name.trimmed().toLower();

    for (const Resolution resolution : resolutions)
    {
        if (toString(resolution) == normalized)
            return resolution;
    }

    return {};
}

optional<Preset> presetFromString(const QString& name)
{
    const QString normalized = name.trimmed().toLower();

    for (const Preset preset : presets)
    {
        if (toString(preset) == normalized)
            return preset;
    }

    return {};
}

bool nvencAcceptsPreset(Preset preset)
{
    switch (preset)
    {
    case Preset::Unspecified:
    case Preset::Fast:
    case Preset::Medium:
    case Preset::Slow:
        return true;
    default:
        return false;
    }
}

QStringList presetNames()
{
    QStringList names;
    for (const Preset preset : presets)
        names.append(toString(preset));

    return names;
}

QStringList resolutionNames()
{
    QStringList names;
    for (const Resolution resolution : resolutions)
        names.append(toString(resolution));

    return names;
}
