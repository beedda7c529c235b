#include "job_handle.hpp"

JobHandle::JobHandle(QString path)
    : m_path(std::move(path)) { }

void JobHandle::setExecution(QFuture<void> execution)
{
    m_execution = std::move(execution);
}

void JobHandle::setRelay(QFuture<void> relay)
{
    m_relay = std::move(relay);
}

void JobHandle::waitForExecution()
{
    m_execution.waitForFinished();
}

void JobHandle::waitForFinished()
{
    m_execution.waitForFinished();
    m_relay.waitForFinished();
}

bool JobHandle::isFinished() const
{
    return m_execution.isFinished() && m_relay.isFinished();
}
