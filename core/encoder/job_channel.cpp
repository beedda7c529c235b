#include "job_channel.hpp"

#include <QMutexLocker>

void JobChannel::send(JobSignal jobSignal)
{
    QMutexLocker locker(&mutex);
    pending.enqueue(std::move(jobSignal));
    available.wakeOne();
}

JobSignal JobChannel::receive()
{
    QMutexLocker locker(&mutex);

    while (pending.isEmpty())
        available.wait(&mutex);

    return pending.dequeue();
}

optional<JobSignal> JobChannel::tryReceive()
{
    QMutexLocker locker(&mutex);

    if (pending.isEmpty())
        return {};

    return pending.dequeue();
}
