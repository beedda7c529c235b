#ifndef JOB_RUNNER_H
#define JOB_RUNNER_H

#include "encode_config.hpp"
#include "encode_error.hpp"
#include "job_handle.hpp"
#include "log/log_sink.hpp"
#include "queue/job_launcher.hpp"
#include "settings/settings.hpp"

#include <QThreadPool>
#include <memory>

class QProcess;

//!
//! \brief Runs one queue item through probe, bitrate planning and ffmpeg.
//! \details Each launch starts two tasks: one executes the job and sends its signals over a JobChannel, the other
//! relays them into the LogSink and emits jobFinished once Done arrives. The configuration is read from the
//! settings when the job is launched and stays fixed for that job.
//!
class JobRunner final : public JobLauncher
{
    Q_OBJECT

public:
    JobRunner(std::shared_ptr<Settings> settings, LogSink& log);
    ~JobRunner() override;

    void launch(const QueueItem& item) override;
    void launch(const QueueItem& item, const EncodeConfig& config);

    //! Kills the running encoder, if any. The job still finishes, as failed.
    void cancel() override;

    //! Blocks until the current job, if any, has fully finished.
    void waitForCurrentJob();

    [[nodiscard]] std::shared_ptr<JobHandle> currentJob() const;

private:
    void execute(JobHandle& job, const EncodeConfig& config);
    void relay(JobHandle& job);

    void fail(JobHandle& job, const EncodeError& error) const;
    void streamOutput(QProcess& ffmpeg, JobHandle& job) const;

    std::shared_ptr<Settings> settings;
    LogSink& log;

    QThreadPool pool;
    std::shared_ptr<JobHandle> current;
};

#endif
