#ifndef MEDIA_PROBE_H
#define MEDIA_PROBE_H

#include "encoder/encode_error.hpp"
#include "formats/source_stats.hpp"
#include "utils/either.hpp"

#include <QByteArray>
#include <QString>
#include <QStringList>

typedef Either<SourceStats, EncodeError> ProbeResult;

//!
//! \brief Reads the duration and first audio stream bitrate of a media file with ffprobe.
//! \details Blocks until ffprobe exits; meant to run off the GUI thread.
//!
class MediaProbe
{
public:
    explicit MediaProbe(QString program = "ffprobe");

    [[nodiscard]] ProbeResult probe(const QString& path) const;

    //! Parses exactly "<bitrate>\n<duration>\n" as printed with noprint_wrappers=1:nokey=1.
    [[nodiscard]] static ProbeResult parse(const QByteArray& output);

    [[nodiscard]] static QStringList arguments(const QString& path);

private:
    QString program;
};

#endif
