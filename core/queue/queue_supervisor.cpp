#include "queue/queue_supervisor.hpp"

#include "utils/logging.hpp"

#include <QFileInfo>
#include <QMutexLocker>

#include <algorithm>
#include <utility>

QueueSupervisor::QueueSupervisor(JobLauncher& launcher)
    : launcher(launcher)
{
    qRegisterMetaType<JobResult>();
    connect(&launcher, &JobLauncher::jobFinished, this, &QueueSupervisor::handleJobFinished);
}

void QueueSupervisor::enqueue(const QString& path, qint64 inputSizeBytes)
{
    {
        QMutexLocker locker(&mutex);
        queue.append(QueueItem { .path = path, .inputSizeBytes = inputSizeBytes });
    }

    qCDebug(lcQueue) << "Enqueued" << path;
    emit itemsChanged();
}

void QueueSupervisor::enqueue(const QString& path)
{
    const QFileInfo info(path);
    enqueue(info.absoluteFilePath(), info.exists() ? info.size() : 0);
}

optional<QueueItem> QueueSupervisor::claimNext()
{
    optional<QueueItem> claimed;

    {
        QMutexLocker locker(&mutex);

        if (busy)
            return {};

        const auto next = std::find_if(queue.begin(), queue.end(), [](const QueueItem& item) {
            return item.status == FileStatus::Waiting;
        });

        if (next == queue.end())
            return {};

        next->status = FileStatus::Processing;
        busy = true;
        claimed = *next;
    }

    qCInfo(lcQueue) << "Processing" << claimed->path;
    emit busyChanged(true);
    emit itemsChanged();

    return claimed;
}

bool QueueSupervisor::markDone(const QString& path, optional<qint64> outputSizeBytes, JobOutcome outcome, optional<int> exitCode)
{
    {
        QMutexLocker locker(&mutex);

        // only a claimed item can finish, waiting duplicates of the path stay queued
        const auto item = std::find_if(queue.begin(), queue.end(), [&path](const QueueItem& item) {
            return item.path == path && item.status == FileStatus::Processing;
        });

        if (item == queue.end())
        {
            qCWarning(lcQueue) << "No processing item for finished job" << path;
            return false;
        }

        item->status = FileStatus::Done;
        item->outputSizeBytes = outputSizeBytes;
        item->outcome = outcome;
        item->exitCode = exitCode;

        busy = false;
        startNextRequested = true;
    }

    qCInfo(lcQueue) << "Finished" << path << (outcome == JobOutcome::Succeeded ? "successfully" : "with errors");
    emit busyChanged(isBusy());
    emit itemsChanged();

    return true;
}

bool QueueSupervisor::isBusy() const
{
    QMutexLocker locker(&mutex);
    return busy;
}

bool QueueSupervisor::hasWaiting() const
{
    QMutexLocker locker(&mutex);
    return std::any_of(queue.cbegin(), queue.cend(), [](const QueueItem& item) {
        return item.status == FileStatus::Waiting;
    });
}

QList<QueueItem> QueueSupervisor::items() const
{
    QMutexLocker locker(&mutex);
    return queue;
}

bool QueueSupervisor::takeStartNext()
{
    QMutexLocker locker(&mutex);
    return std::exchange(startNextRequested, false);
}

bool QueueSupervisor::startNext()
{
    const optional<QueueItem> item = claimNext();
    if (!item.has_value())
        return false;

    launcher.launch(*item);
    return true;
}

int QueueSupervisor::clearFinished()
{
    qsizetype removed = 0;

    {
        QMutexLocker locker(&mutex);
        removed = queue.removeIf([](const QueueItem& item) { return item.status == FileStatus::Done; });
    }

    if (removed > 0)
        emit itemsChanged();

    return static_cast<int>(removed);
}

void QueueSupervisor::handleJobFinished(const JobResult& result)
{
    markDone(result.path, result.outputSizeBytes, result.outcome, result.exitCode);

    if (takeStartNext())
        startNext();
}
