#include "encoder/job_channel.hpp"
#include "encoder/job_handle.hpp"

#include <QtConcurrent/QtConcurrent>
#include <gtest/gtest.h>

TEST(JobChannelTest, DeliversSignalsInSendOrder)
{
    JobChannel channel;
    channel.send(LineSignal { "ffmpeg -i in.mkv" });
    channel.send(OutputSizeSignal { 2048 });
    channel.send(DoneSignal { JobOutcome::Succeeded, 0 });

    const JobSignal first = channel.receive();
    ASSERT_TRUE(std::holds_alternative<LineSignal>(first));
    EXPECT_EQ(std::get<LineSignal>(first).text, "ffmpeg -i in.mkv");

    const JobSignal second = channel.receive();
    ASSERT_TRUE(std::holds_alternative<OutputSizeSignal>(second));
    EXPECT_EQ(std::get<OutputSizeSignal>(second).bytes, 2048);

    const optional<JobSignal> third = channel.tryReceive();
    ASSERT_TRUE(third.has_value());
    EXPECT_TRUE(std::holds_alternative<DoneSignal>(*third));

    EXPECT_FALSE(channel.tryReceive().has_value());
}

TEST(JobChannelTest, ReceiveWaitsForSender)
{
    JobChannel channel;
    QThreadPool pool;

    QFuture<void> sender = QtConcurrent::run(&pool, [&channel] {
        QThread::msleep(50);
        for (int i = 0; i < 100; i++)
            channel.send(LineSignal { QString::number(i) });
        channel.send(DoneSignal { JobOutcome::Failed, {} });
    });

    int lines = 0;
    for (;;) {
        const JobSignal next = channel.receive();
        if (std::holds_alternative<DoneSignal>(next))
            break;

        EXPECT_EQ(std::get<LineSignal>(next).text, QString::number(lines));
        lines++;
    }

    sender.waitForFinished();
    EXPECT_EQ(lines, 100);
}

TEST(JobHandleTest, StartsIdleAndRecordsCancellation)
{
    JobHandle job("/v/clip.mkv");

    EXPECT_EQ(job.state(), JobState::Idle);
    EXPECT_FALSE(job.isCancelled());

    job.cancel();
    job.setState(JobState::Completed);

    EXPECT_TRUE(job.isCancelled());
    EXPECT_EQ(job.state(), JobState::Completed);
}
