#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "queue/job_launcher.hpp"

#include <QDir>
#include <QList>
#include <QString>
#include <functional>

//! Pumps the event loop until the condition holds or the timeout expires.
bool waitUntil(const std::function<bool()>& condition, int timeoutMs = 15000);

//! Writes an executable POSIX shell script into the directory and returns its path.
QString writeScript(const QDir& dir, const QString& name, const QString& body);

//! Writes a file of the given size and returns its path.
QString writeFile(const QDir& dir, const QString& name, qint64 size = 0);

//! Records launches and lets the test decide when jobs finish.
class FakeLauncher final : public JobLauncher
{
    Q_OBJECT

public:
    void launch(const QueueItem& item) override { launched.append(item); }
    void cancel() override { cancelCount++; }

    void finish(const QString& path, optional<qint64> outputSize, JobOutcome outcome = JobOutcome::Succeeded)
    {
        emit jobFinished(JobResult { .path = path, .outputSizeBytes = outputSize, .outcome = outcome, .exitCode = 0 });
    }

    QList<QueueItem> launched;
    int cancelCount = 0;
};

#endif
