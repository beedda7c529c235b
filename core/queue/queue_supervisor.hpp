#ifndef QUEUE_SUPERVISOR_H
#define QUEUE_SUPERVISOR_H

#include "queue/job_launcher.hpp"
#include "queue/queue_item.hpp"

#include <QList>
#include <QMutex>
#include <QObject>

//!
//! \brief Owns the job queue and makes sure only one job runs at a time.
//! \details Items are claimed in enqueue order. When a job finishes, the item is marked done and the next waiting
//! item is started automatically. All methods are thread-safe; the item lock is never held while launching.
//!
class QueueSupervisor final : public QObject
{
    Q_OBJECT

public:
    explicit QueueSupervisor(JobLauncher& launcher);

    void enqueue(const QString& path, qint64 inputSizeBytes);
    void enqueue(const QString& path);

    //! Marks the oldest waiting item as processing, unless a job is already running.
    [[nodiscard]] optional<QueueItem> claimNext();
    bool markDone(
        const QString& path,
        optional<qint64> outputSizeBytes,
        JobOutcome outcome = JobOutcome::Succeeded,
        optional<int> exitCode = {}
    );

    [[nodiscard]] bool isBusy() const;
    [[nodiscard]] bool hasWaiting() const;
    [[nodiscard]] QList<QueueItem> items() const;

    //! Returns whether a job completed since the last call, and resets the flag.
    bool takeStartNext();

    //! Claims and launches the next waiting item. Does nothing when busy or when nothing waits.
    bool startNext();

    //! Removes finished items. Returns how many were removed.
    int clearFinished();

public slots:
    void handleJobFinished(const JobResult& result);

signals:
    void itemsChanged();
    void busyChanged(bool busy);

private:
    JobLauncher& launcher;

    mutable QMutex mutex;
    QList<QueueItem> queue;
    bool busy = false;
    bool startNextRequested = false;
};

#endif
