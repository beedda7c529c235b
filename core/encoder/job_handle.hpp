#ifndef JOB_HANDLE_H
#define JOB_HANDLE_H

#include "job_channel.hpp"

#include <QFuture>
#include <atomic>

enum class JobState {
    Idle,
    Probing,
    Running,
    Finalizing,
    Completed
};

//!
//! \brief Owns the two tasks of one running job: the encoder task and the relay task.
//!
class JobHandle
{
public:
    explicit JobHandle(QString path);

    const QString& path() const { return m_path; }
    JobChannel& channel() { return m_channel; }

    //! Asks the encoder task to kill the process. Checked between reads of its output.
    void cancel() { m_cancelled = true; }
    bool isCancelled() const { return m_cancelled; }

    JobState state() const { return m_state; }
    void setState(JobState state) { m_state = state; }

    void setExecution(QFuture<void> execution);
    void setRelay(QFuture<void> relay);

    void waitForExecution();
    void waitForFinished();
    bool isFinished() const;

private:
    QString m_path;
    JobChannel m_channel;
    std::atomic_bool m_cancelled = false;
    std::atomic<JobState> m_state = JobState::Idle;

    QFuture<void> m_execution;
    QFuture<void> m_relay;
};

#endif
