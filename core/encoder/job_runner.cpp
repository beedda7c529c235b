#include "job_runner.hpp"

#include "bitrate_planner.hpp"
#include "command_builder.hpp"
#include "formats/media_probe.hpp"
#include "settings/encode_config_store.hpp"
#include "utils/logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QtConcurrent/QtConcurrent>

namespace
{
constexpr int kReadPollMs = 100;

// ffmpeg redraws its progress line with '\r', so both terminators end a line
void forwardLines(QByteArray& pending, JobChannel& channel, bool flush)
{
    qsizetype start = 0;

    for (qsizetype i = 0; i < pending.size(); i++) {
        const char c = pending.at(i);
        if (c != '\n' && c != '\r')
            continue;

        const QByteArray line = pending.mid(start, i - start);
        if (!line.trimmed().isEmpty())
            channel.send(LineSignal { QString::fromUtf8(line) });

        start = i + 1;
    }

    pending.remove(0, start);

    if (flush && !pending.trimmed().isEmpty()) {
        channel.send(LineSignal { QString::fromUtf8(pending) });
        pending.clear();
    }
}
}

JobRunner::JobRunner(std::shared_ptr<Settings> settings, LogSink& log)
    : settings(std::move(settings))
    , log(log)
{
    // the encoder task and the relay task of a job, plus the tail of the previous job's relay
    pool.setMaxThreadCount(4);
}

JobRunner::~JobRunner()
{
    cancel();
    pool.waitForDone();
}

void JobRunner::launch(const QueueItem& item)
{
    launch(item, loadEncodeConfig(*settings));
}

void JobRunner::launch(const QueueItem& item, const EncodeConfig& config)
{
    auto job = std::make_shared<JobHandle>(item.path);
    current = job;

    qCInfo(lcRunner) << "Starting job for" << item.path << "targeting" << config.targetSizeMb << "MB";

    job->setExecution(QtConcurrent::run(&pool, [this, job, config] { execute(*job, config); }));
    job->setRelay(QtConcurrent::run(&pool, [this, job] { relay(*job); }));
}

void JobRunner::cancel()
{
    if (current)
        current->cancel();
}

void JobRunner::waitForCurrentJob()
{
    if (current)
        current->waitForFinished();
}

std::shared_ptr<JobHandle> JobRunner::currentJob() const
{
    return current;
}

void JobRunner::execute(JobHandle& job, const EncodeConfig& config)
{
    JobChannel& channel = job.channel();
    const QString& inputPath = job.path();

    job.setState(JobState::Probing);
    const ProbeResult stats = MediaProbe(config.ffprobeProgram).probe(inputPath);
    if (stats.isLeft()) {
        fail(job, stats.getLeft());
        return;
    }

    const auto planned = BitratePlanner::plan(
        config.targetSizeMb, stats.getRight().durationSeconds, stats.getRight().audioBitrateBps
    );
    if (planned.isLeft()) {
        fail(job, planned.getLeft());
        return;
    }

    const QString outputPath = CommandBuilder::outputPathFor(inputPath);
    const QStringList arguments = CommandBuilder::build(inputPath, outputPath, config, planned.getRight());

    channel.send(LineSignal { CommandBuilder::render(config.ffmpegProgram, arguments) });

    if (job.isCancelled()) {
        fail(job, EncodeError { EncodeError::Cancelled, tr("Encoding of '%1' was cancelled.").arg(inputPath) });
        return;
    }

    // a leftover from an earlier run would be reported as this job's output
    if (QFile::exists(outputPath) && !QFile::remove(outputPath)) {
        fail(job, EncodeError {
            EncodeError::SpawnFailed,
            tr("Could not replace the existing output '%1'.").arg(outputPath)
        });
        return;
    }

    QProcess ffmpeg;
    ffmpeg.setStandardOutputFile(QProcess::nullDevice());
    ffmpeg.setReadChannel(QProcess::StandardError);
    ffmpeg.start(config.ffmpegProgram, arguments);

    if (!ffmpeg.waitForStarted()) {
        qCCritical(lcRunner) << "Could not start" << config.ffmpegProgram << ffmpeg.errorString();
        emit launchFailed(config.ffmpegProgram, ffmpeg.errorString());

        fail(job, EncodeError {
            EncodeError::SpawnFailed,
            tr("Could not start %1.").arg(config.ffmpegProgram),
            ffmpeg.errorString()
        });
        return;
    }

    job.setState(JobState::Running);
    streamOutput(ffmpeg, job);
    job.setState(JobState::Finalizing);

    optional<int> exitCode;
    if (ffmpeg.exitStatus() == QProcess::NormalExit)
        exitCode = ffmpeg.exitCode();

    JobOutcome outcome = JobOutcome::Succeeded;

    if (job.isCancelled()) {
        outcome = JobOutcome::Failed;
        channel.send(LineSignal { tr("Encoding of '%1' was cancelled.").arg(inputPath) });
    } else if (!exitCode.has_value()) {
        outcome = JobOutcome::Failed;
        channel.send(LineSignal { tr("%1 crashed.").arg(config.ffmpegProgram) });
    } else if (*exitCode != 0) {
        outcome = JobOutcome::Failed;
        channel.send(LineSignal { tr("%1 exited with code %2.").arg(config.ffmpegProgram).arg(*exitCode) });
    }

    if (const QFileInfo output(outputPath); output.exists()) {
        channel.send(OutputSizeSignal { output.size() });
    } else {
        const EncodeError missing { EncodeError::OutputSizeUnavailable, tr("No output was written to '%1'.").arg(outputPath) };
        qCWarning(lcRunner) << missing.message;
        channel.send(LineSignal { missing.message });
    }

    job.setState(JobState::Completed);
    channel.send(DoneSignal { outcome, exitCode });
}

void JobRunner::streamOutput(QProcess& ffmpeg, JobHandle& job) const
{
    QByteArray pending;
    bool killed = false;

    while (ffmpeg.state() != QProcess::NotRunning) {
        if (job.isCancelled() && !killed) {
            qCInfo(lcRunner) << "Killing encoder for" << job.path();
            ffmpeg.kill();
            killed = true;
        }

        ffmpeg.waitForReadyRead(kReadPollMs);
        pending += ffmpeg.readAllStandardError();
        forwardLines(pending, job.channel(), false);
    }

    ffmpeg.waitForFinished(-1);
    pending += ffmpeg.readAllStandardError();
    forwardLines(pending, job.channel(), true);
}

void JobRunner::relay(JobHandle& job)
{
    JobResult result { .path = job.path() };

    for (;;) {
        const JobSignal next = job.channel().receive();

        if (const auto* line = std::get_if<LineSignal>(&next)) {
            log.append(line->text);
            continue;
        }

        if (const auto* size = std::get_if<OutputSizeSignal>(&next)) {
            result.outputSizeBytes = size->bytes;
            continue;
        }

        const auto& done = std::get<DoneSignal>(next);
        result.outcome = done.outcome;
        result.exitCode = done.exitCode;
        break;
    }

    // Done is the last thing the encoder task sends, make sure it has also returned
    job.waitForExecution();

    qCInfo(lcRunner) << "Job for" << result.path << "finished";
    emit jobFinished(result);
}

void JobRunner::fail(JobHandle& job, const EncodeError& error) const
{
    qCWarning(lcRunner) << error.message << error.details;

    JobChannel& channel = job.channel();
    job.setState(JobState::Completed);

    channel.send(LineSignal { error.message });
    if (!error.details.isEmpty())
        channel.send(LineSignal { error.details });

    channel.send(DoneSignal { JobOutcome::Failed, {} });
}
