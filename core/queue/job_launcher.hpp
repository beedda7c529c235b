#ifndef JOB_LAUNCHER_H
#define JOB_LAUNCHER_H

#include "queue/queue_item.hpp"

#include <QObject>

//!
//! \brief Starts the work for a claimed queue item and reports when it is over.
//! \details Implementations must emit jobFinished exactly once per launch, failures included.
//!
class JobLauncher : public QObject
{
    Q_OBJECT

public:
    virtual void launch(const QueueItem& item) = 0;

    //! Aborts the running job, if any. It still reports jobFinished.
    virtual void cancel() = 0;

signals:
    void jobFinished(const JobResult& result);

    //! The worker program could not be started at all, which usually means it is not installed.
    void launchFailed(const QString& program, const QString& reason);
};

#endif
