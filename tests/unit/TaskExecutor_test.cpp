/**
 * (c) 2019 by Mega Limited, Wellsford, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the the rules set forth in the Terms of Service.
 *
 * The MEGA SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <megaflow/common/logger.h>
#include <megaflow/common/task_executor.h>

namespace mt {

using namespace megaflow;

namespace {

// Holds workers inside a task until released.
class Gate
{
    std::condition_variable mCV;
    std::mutex mMutex;
    bool mOpen = false;
    int mWaiting = 0;

public:
    void pass()
    {
        std::unique_lock<std::mutex> lock(mMutex);
        ++mWaiting;
        mCV.notify_all();
        mCV.wait(lock, [this]() { return mOpen; });
    }

    bool waitFor(int count)
    {
        std::unique_lock<std::mutex> lock(mMutex);
        return mCV.wait_for(lock, std::chrono::seconds(10), [&]() { return mWaiting >= count; });
    }

    void open()
    {
        std::lock_guard<std::mutex> guard(mMutex);
        mOpen = true;
        mCV.notify_all();
    }
};

common::Logger& testLogger()
{
    static common::Logger logger("TaskExecutorTest");
    return logger;
}

} // anonymous

TEST(TaskQueue, FirstInFirstOut)
{
    common::TaskQueue queue;
    std::vector<std::string> ran;

    for (const char* label : {"a", "b", "c"})
    {
        queue.queue(common::Task(label, [&ran](const common::Task& t) { ran.push_back(t.label()); }, testLogger()));
    }

    EXPECT_EQ(3u, queue.size());

    while (auto task = queue.dequeue())
    {
        EXPECT_TRUE(task.complete());
        EXPECT_FALSE(task.complete());
        EXPECT_FALSE(task.cancel());
        EXPECT_TRUE(task.completed());
        EXPECT_FALSE(task.cancelled());
    }

    EXPECT_TRUE(queue.empty());
    EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), ran);
}

TEST(TaskQueue, DestructionCancelsQueuedTasks)
{
    int cancelled = 0;
    common::Task done("done", [](const common::Task&) {}, testLogger());
    done.complete();

    {
        common::TaskQueue queue;
        queue.queue(common::Task("x", [&cancelled](const common::Task& t) { cancelled += t.cancelled(); }, testLogger()));
        queue.queue(common::Task("y", [&cancelled](const common::Task& t) { cancelled += t.cancelled(); }, testLogger()));

        // already ran, so not queued
        queue.queue(done);
        queue.queue(common::Task());
        EXPECT_EQ(2u, queue.size());
    }

    EXPECT_EQ(2, cancelled);
}

TEST(TaskQueue, ThrowingTaskIsContained)
{
    common::Task task("thrower", [](const common::Task&) { throw std::runtime_error("boom"); }, testLogger());

    EXPECT_TRUE(task.complete());
    EXPECT_TRUE(task.completed());
}

TEST(TaskExecutor, RejectsEmptyFunction)
{
    common::TaskExecutor executor(common::TaskExecutorFlags(), testLogger());

    EXPECT_THROW(executor.execute("empty", nullptr), std::runtime_error);
}

TEST(TaskExecutor, GrowsOnlyAsFarAsTheLimit)
{
    common::TaskExecutorFlags flags;
    flags.mMaxWorkers = 3;

    Gate gate;
    std::atomic<int> ran{0};
    std::vector<common::Task> tasks;

    {
        common::TaskExecutor executor(flags, testLogger());

        for (int i = 0; i < 5; ++i)
        {
            tasks.push_back(executor.execute("job" + std::to_string(i), [&](const common::Task& t) {
                if (!t.cancelled())
                {
                    gate.pass();
                    ++ran;
                }
            }));
        }

        ASSERT_TRUE(gate.waitFor(3));
        EXPECT_EQ(3u, executor.workers());

        gate.open();

        for (auto& task : tasks)
        {
            while (!task.completed())
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
    }

    EXPECT_EQ(5, ran.load());
}

TEST(TaskExecutor, ZeroWorkersMeansOne)
{
    common::TaskExecutorFlags flags;
    flags.mMaxWorkers = 0;

    std::atomic<bool> ran{false};

    {
        common::TaskExecutor executor(flags, testLogger());
        auto task = executor.execute("only", [&ran](const common::Task&) { ran = true; });

        while (!task.completed())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        EXPECT_EQ(1u, executor.workers());
    }

    EXPECT_TRUE(ran);
}

TEST(TaskExecutor, ShutdownCancelsWhatNeverStarted)
{
    common::TaskExecutorFlags flags;
    flags.mMaxWorkers = 1;

    Gate gate;
    std::atomic<int> completed{0};
    std::atomic<int> cancelled{0};

    auto body = [&](const common::Task& t) {
        if (t.cancelled())
        {
            ++cancelled;
            return;
        }
        gate.pass();
        ++completed;
    };

    std::thread opener;

    {
        common::TaskExecutor executor(flags, testLogger());

        executor.execute("running", body);
        executor.execute("queued1", body);
        executor.execute("queued2", body);

        ASSERT_TRUE(gate.waitFor(1));

        // let the running task finish once destruction is underway
        opener = std::thread([&gate]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            gate.open();
        });
    }

    opener.join();

    EXPECT_EQ(1, completed.load());
    EXPECT_EQ(2, cancelled.load());
}

} // mt
