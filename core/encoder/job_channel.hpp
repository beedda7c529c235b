#ifndef JOB_CHANNEL_H
#define JOB_CHANNEL_H

#include "queue/queue_item.hpp"

#include <QMutex>
#include <QQueue>
#include <QString>
#include <QWaitCondition>
#include <variant>

struct LineSignal {
    QString text;
};

struct OutputSizeSignal {
    qint64 bytes;
};

struct DoneSignal {
    JobOutcome outcome;
    optional<int> exitCode;
};

typedef std::variant<LineSignal, OutputSizeSignal, DoneSignal> JobSignal;

//!
//! \brief Single-direction, FIFO hand-off of job signals from the encoding task to the relay task.
//!
class JobChannel
{
public:
    void send(JobSignal jobSignal);

    //! Blocks until a signal is available.
    [[nodiscard]] JobSignal receive();
    [[nodiscard]] optional<JobSignal> tryReceive();

private:
    QMutex mutex;
    QWaitCondition available;
    QQueue<JobSignal> pending;
};

#endif
