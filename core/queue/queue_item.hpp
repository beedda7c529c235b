#ifndef QUEUE_ITEM_H
#define QUEUE_ITEM_H

#include <QMetaType>
#include <QString>
#include <optional>

using std::optional;

enum class FileStatus {
    Waiting,
    Processing,
    Done
};

enum class JobOutcome {
    Pending,
    Succeeded,
    Failed
};

struct QueueItem {
    QString path;
    FileStatus status = FileStatus::Waiting;
    qint64 inputSizeBytes = 0;
    optional<qint64> outputSizeBytes;
    JobOutcome outcome = JobOutcome::Pending;
    optional<int> exitCode;
};

//!
//! \brief What a finished job reports back to the queue.
//! \details outputSizeBytes is empty when the encoder left no output file behind.
//!
struct JobResult {
    QString path;
    optional<qint64> outputSizeBytes;
    JobOutcome outcome = JobOutcome::Failed;
    optional<int> exitCode;
};

Q_DECLARE_METATYPE(JobResult)

#endif
