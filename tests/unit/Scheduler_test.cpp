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
#include <future>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include <megaflow/scheduler.h>

using namespace megaflow;

namespace mt {

namespace {

std::unique_ptr<Scheduler> makeScheduler(size_t workers, unsigned budget)
{
    common::TaskExecutorFlags flags;
    flags.mMaxWorkers = workers;
    return std::make_unique<Scheduler>(std::make_unique<ConcurrencyBudget>(budget), flags);
}

Job job(const std::string& label, std::function<void()> body, unsigned weight = 1)
{
    Job j;
    j.label = label;
    j.weight = weight;
    j.run = [body](CancelToken&, TransferProgress& progress)
    {
        body();
        progress.total = 10;
        progress.done = 10;
        return TransferResult();
    };
    return j;
}

// tracks how many bodies run at once, and the weight they hold
class Gauge
{
public:
    std::function<void()> body(unsigned weight = 1)
    {
        return [this, weight]()
        {
            unsigned running = ++mRunning;
            unsigned held = mWeight += weight;

            raise(mMaxRunning, running);
            raise(mMaxWeight, held);

            std::this_thread::sleep_for(std::chrono::milliseconds(20));

            mWeight -= weight;
            --mRunning;
        };
    }

    unsigned maxRunning() const { return mMaxRunning; }
    unsigned maxWeight() const { return mMaxWeight; }

private:
    static void raise(std::atomic<unsigned>& peak, unsigned value)
    {
        unsigned current = peak;
        while (value > current && !peak.compare_exchange_weak(current, value)) { }
    }

    std::atomic<unsigned> mRunning{0};
    std::atomic<unsigned> mWeight{0};
    std::atomic<unsigned> mMaxRunning{0};
    std::atomic<unsigned> mMaxWeight{0};
};

} // namespace

TEST(ConcurrencyBudget, ClampsAndReleases)
{
    ConcurrencyBudget budget(0);
    EXPECT_EQ(1u, budget.capacity());

    ConcurrencyBudget b(4);
    EXPECT_TRUE(b.tryAcquire(3));
    EXPECT_FALSE(b.tryAcquire(2));
    EXPECT_TRUE(b.tryAcquire(1));
    EXPECT_EQ(4u, b.inUse());

    b.release(4);
    EXPECT_TRUE(b.tryAcquire(100));
    EXPECT_EQ(4u, b.inUse());

    b.release(100);
    EXPECT_EQ(0u, b.inUse());

    // more than is held: floor at zero
    b.release(2);
    EXPECT_EQ(0u, b.inUse());
}

TEST(Scheduler, RunsJobsInSubmissionOrder)
{
    auto scheduler = makeScheduler(1, 10);

    std::mutex m;
    std::vector<std::string> order;

    for (const char* label : {"a", "b", "c", "d", "e"})
    {
        std::string l = label;
        scheduler->submit(job(l, [&m, &order, l]()
        {
            std::lock_guard<std::mutex> g(m);
            order.push_back(l);
        }));
    }

    auto outcomes = scheduler->wait();

    EXPECT_EQ((std::vector<std::string>{"a", "b", "c", "d", "e"}), order);

    ASSERT_EQ(5u, outcomes.size());
    for (size_t i = 0; i < outcomes.size(); i++)
    {
        EXPECT_EQ(i + 1, outcomes[i].id);
        EXPECT_EQ(order[i], outcomes[i].label);
    }

    EXPECT_EQ(0, Scheduler::exitStatus(outcomes));

    auto progress = scheduler->progress();
    EXPECT_EQ(5u, progress.done);
    EXPECT_EQ(0u, progress.failed);
    EXPECT_EQ(50, progress.bytesDone);
    EXPECT_EQ(50, progress.bytesTotal);
}

TEST(Scheduler, NeverExceedsTheWorkerLimit)
{
    auto scheduler = makeScheduler(2, 100);
    Gauge gauge;

    for (int i = 0; i < 8; i++)
    {
        scheduler->submit(job("job", gauge.body()));
    }

    scheduler->wait();

    EXPECT_LE(gauge.maxRunning(), 2u);
    EXPECT_GE(gauge.maxRunning(), 1u);
}

TEST(Scheduler, NeverExceedsTheBudget)
{
    auto scheduler = makeScheduler(8, 5);
    Gauge gauge;

    for (unsigned i = 0; i < 12; i++)
    {
        unsigned weight = 1 + i % 3;
        scheduler->submit(job("job", gauge.body(weight), weight));
    }

    auto outcomes = scheduler->wait();

    EXPECT_LE(gauge.maxWeight(), 5u);
    EXPECT_EQ(0, Scheduler::exitStatus(outcomes));
    EXPECT_EQ(0u, scheduler->budget().inUse());
}

TEST(Scheduler, OversizedJobsStillRun)
{
    auto scheduler = makeScheduler(4, 2);
    std::atomic<bool> ran{false};

    scheduler->submit(job("huge", [&ran]() { ran = true; }, 50));

    auto outcomes = scheduler->wait();
    EXPECT_TRUE(ran);
    EXPECT_EQ(0, Scheduler::exitStatus(outcomes));
}

TEST(Scheduler, HeadOfQueueIsNeverOvertaken)
{
    auto scheduler = makeScheduler(4, 3);

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> firstStarted;
    std::atomic<bool> lightStarted{false};

    scheduler->submit(job("blocker", [&]()
    {
        firstStarted.set_value();
        released.wait();
    }, 2));

    firstStarted.get_future().wait();

    // needs the whole budget: waits for the blocker
    scheduler->submit(job("heavy", []() { }, 3));

    // would fit next to the blocker, but must not pass the heavy job
    scheduler->submit(job("light", [&lightStarted]() { lightStarted = true; }, 1));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto progress = scheduler->progress();
    EXPECT_EQ(1u, progress.running);
    EXPECT_EQ(2u, progress.queued);
    EXPECT_FALSE(lightStarted);

    release.set_value();

    auto outcomes = scheduler->wait();
    EXPECT_TRUE(lightStarted);
    EXPECT_EQ(0, Scheduler::exitStatus(outcomes));
}

TEST(Scheduler, PausesAndCancelsQueuedJobs)
{
    auto scheduler = makeScheduler(1, 10);

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<int> ran{0};

    JobId first = scheduler->submit(job("first", [&]() { released.wait(); ran++; }));
    JobId second = scheduler->submit(job("second", [&ran]() { ran++; }));
    JobId third = scheduler->submit(job("third", [&ran]() { ran++; }));
    JobId fourth = scheduler->submit(job("fourth", [&ran]() { ran++; }));

    EXPECT_TRUE(scheduler->pause(second));
    EXPECT_TRUE(scheduler->cancel(third));
    EXPECT_FALSE(scheduler->cancel(12345));

    release.set_value();

    auto outcomes = scheduler->wait();
    ASSERT_EQ(4u, outcomes.size());

    EXPECT_EQ(first, outcomes[0].id);
    EXPECT_EQ(API_OK, outcomes[0].result.error);
    EXPECT_EQ(TRANSFER_EPAUSED, outcomes[1].result.error);
    EXPECT_EQ(TRANSFER_ECANCELLED, outcomes[2].result.error);
    EXPECT_EQ(fourth, outcomes[3].id);
    EXPECT_EQ(API_OK, outcomes[3].result.error);

    EXPECT_EQ(2, ran);
    EXPECT_EQ(1, Scheduler::exitStatus(outcomes));
    EXPECT_EQ(2u, scheduler->progress().failed);
}

TEST(Scheduler, RunningJobsSeeTheirToken)
{
    auto scheduler = makeScheduler(2, 10);
    std::promise<void> started;

    Job j;
    j.label = "waiter";
    j.run = [&started](CancelToken& token, TransferProgress&)
    {
        started.set_value();

        while (token.waitFor(std::chrono::milliseconds(5))) { }

        TransferResult r;
        r.error = token.stopError();
        return r;
    };

    JobId id = scheduler->submit(std::move(j));
    started.get_future().wait();

    EXPECT_TRUE(scheduler->cancel(id));

    auto outcomes = scheduler->wait();
    ASSERT_EQ(1u, outcomes.size());
    EXPECT_EQ(TRANSFER_ECANCELLED, outcomes[0].result.error);
}

TEST(Scheduler, PauseAllStopsEverything)
{
    auto scheduler = makeScheduler(1, 10);
    std::promise<void> started;

    Job j;
    j.label = "waiter";
    j.run = [&started](CancelToken& token, TransferProgress&)
    {
        started.set_value();
        while (token.waitFor(std::chrono::milliseconds(5))) { }

        TransferResult r;
        r.error = token.stopError();
        return r;
    };

    scheduler->submit(std::move(j));
    scheduler->submit(job("queued", []() { }));
    started.get_future().wait();

    scheduler->pauseAll();

    auto outcomes = scheduler->wait();
    ASSERT_EQ(2u, outcomes.size());
    EXPECT_EQ(TRANSFER_EPAUSED, outcomes[0].result.error);
    EXPECT_EQ(TRANSFER_EPAUSED, outcomes[1].result.error);
}

TEST(Scheduler, FailuresAreCollectedNotThrown)
{
    auto scheduler = makeScheduler(2, 10);

    Job failing;
    failing.label = "failing";
    failing.run = [](CancelToken&, TransferProgress&)
    {
        TransferResult r;
        r.error = TRANSFER_EINTEGRITY;
        return r;
    };

    scheduler->submit(std::move(failing));
    scheduler->submit(job("throwing", []() { throw std::runtime_error("boom"); }));
    scheduler->submit(job("fine", []() { }));

    auto outcomes = scheduler->wait();
    ASSERT_EQ(3u, outcomes.size());
    EXPECT_EQ(TRANSFER_EINTEGRITY, outcomes[0].result.error);
    EXPECT_EQ(API_EINTERNAL, outcomes[1].result.error);
    EXPECT_EQ(API_OK, outcomes[2].result.error);
    EXPECT_EQ(1, Scheduler::exitStatus(outcomes));

    EXPECT_THROW(scheduler->submit(Job()), std::runtime_error);
}

TEST(Scheduler, DestructionCancelsOutstandingJobs)
{
    std::atomic<bool> stopped{false};
    std::promise<void> started;

    {
        auto scheduler = makeScheduler(1, 10);

        Job j;
        j.label = "endless";
        j.run = [&](CancelToken& token, TransferProgress&)
        {
            started.set_value();
            while (token.waitFor(std::chrono::milliseconds(5))) { }
            stopped = true;
            return TransferResult();
        };

        scheduler->submit(std::move(j));
        scheduler->submit(job("never", []() { ADD_FAILURE() << "queued job ran"; }));
        started.get_future().wait();
    }

    EXPECT_TRUE(stopped);
}

TEST(Scheduler, ExitStatusOfNothingIsSuccess)
{
    EXPECT_EQ(0, Scheduler::exitStatus({}));
}

} // mt
