#include "formats/media_probe.hpp"

#include "utils/logging.hpp"

#include <QObject>
#include <QProcess>

MediaProbe::MediaProbe(QString program)
    : program(std::move(program)) { }

QStringList MediaProbe::arguments(const QString& path)
{
    return {
        "-v", "error",
        "-select_streams", "a:0",
        "-show_entries", "format=duration:stream=bit_rate",
        "-of", "default=noprint_wrappers=1:nokey=1",
        path
    };
}

ProbeResult MediaProbe::probe(const QString& path) const
{
    QProcess ffprobe;
    ffprobe.start(program, arguments(path));

    if (!ffprobe.waitForStarted()) {
        qCWarning(lcProbe) << "Could not start" << program << ffprobe.errorString();

        return EncodeError {
            EncodeError::ProbeUnavailable,
            QObject::tr("Could not start %1 to read media metadata.").arg(program),
            ffprobe.errorString()
        };
    }

    ffprobe.waitForFinished(-1);

    if (ffprobe.exitStatus() != QProcess::NormalExit || ffprobe.exitCode() != 0) {
        const QString errorOutput = QString::fromUtf8(ffprobe.readAllStandardError()).trimmed();
        qCWarning(lcProbe) << program << "failed on" << path << "with code" << ffprobe.exitCode();

        return EncodeError {
            EncodeError::ProbeFailed,
            QObject::tr("Could not retrieve media metadata for '%1'. Is the file corrupted?").arg(path),
            errorOutput
        };
    }

    return parse(ffprobe.readAllStandardOutput());
}

ProbeResult MediaProbe::parse(const QByteArray& output)
{
    const QStringList lines = QString::fromUtf8(output).split('\n', Qt::SkipEmptyParts);

    auto parseError = [&output](const QString& reason) {
        return EncodeError {
            EncodeError::ProbeParseError,
            reason,
            QObject::tr("Found metadata: %1").arg(QString::fromUtf8(output))
        };
    };

    if (lines.size() < 2)
        return parseError(QObject::tr("Media metadata is incomplete. Does the file have an audio stream?"));

    if (lines.size() > 2)
        return parseError(QObject::tr("Expected a bitrate and a duration, got %1 values.").arg(lines.size()));

    bool ok = false;
    const qint64 bitrate = lines.at(0).trimmed().toLongLong(&ok);
    if (!ok || bitrate < 0)
        return parseError(QObject::tr("Could not read the audio bitrate from '%1'.").arg(lines.at(0).trimmed()));

    const double duration = lines.at(1).trimmed().toDouble(&ok);
    if (!ok)
        return parseError(QObject::tr("Could not read the media duration from '%1'.").arg(lines.at(1).trimmed()));

    return SourceStats { .durationSeconds = duration, .audioBitrateBps = bitrate };
}
