#ifndef ENCODE_ERROR_H
#define ENCODE_ERROR_H

#include <QString>

//!
//! \brief Describes why a job, or one step of it, could not complete.
//!
struct EncodeError {
    enum Kind {
        ProbeUnavailable,
        ProbeFailed,
        ProbeParseError,
        InvalidDuration,
        SpawnFailed,
        OutputSizeUnavailable,
        Cancelled
    };

    Kind kind;
    QString message;
    QString details = "";
};

#endif
