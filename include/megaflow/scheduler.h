/**
 * @file megaflow/scheduler.h
 * @brief Queue of transfer jobs run on a bounded worker pool
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
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

#ifndef MEGAFLOW_SCHEDULER_H
#define MEGAFLOW_SCHEDULER_H 1

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

#include "common/logger.h"
#include "common/task_executor.h"
#include "concurrency_budget.h"
#include "transfer.h"

namespace megaflow {

typedef uint64_t JobId;

// a transfer waiting to run: what to do, how heavy it is, what to call it
struct MEGAFLOW_API Job
{
    string label;
    unsigned weight = 1;
    std::function<TransferResult(CancelToken&, TransferProgress&)> run;
};

typedef enum { JOB_QUEUED = 0, JOB_RUNNING, JOB_DONE } jobstate_t;

struct MEGAFLOW_API JobOutcome
{
    JobId id = 0;
    string label;
    TransferResult result;
};

struct MEGAFLOW_API SchedulerProgress
{
    m_off_t bytesDone = 0;
    m_off_t bytesTotal = 0;

    size_t queued = 0;
    size_t running = 0;
    size_t done = 0;
    size_t failed = 0;
};

/**
 * @brief Runs jobs in submission order within two limits.
 *
 * A job starts once its weight fits in the budget and fewer than
 * mMaxWorkers jobs are running. The head of the queue is never overtaken:
 * a heavy job blocks lighter ones behind it until it is admitted.
 */
class MEGAFLOW_API Scheduler
{
public:
    Scheduler(unique_ptr<ConcurrencyBudget> budget, const common::TaskExecutorFlags& flags);

    // cancels whatever is still queued or running and waits for it
    ~Scheduler();

    JobId submit(Job job);

    // false if the id is unknown
    bool pause(JobId id);
    bool cancel(JobId id);

    void pauseAll();
    void cancelAll();

    // blocks until every submitted job is done; outcomes in submission order
    vector<JobOutcome> wait();

    SchedulerProgress progress() const;

    const ConcurrencyBudget& budget() const { return *mBudget; }

    // 0 if every outcome succeeded, 1 otherwise
    static int exitStatus(const vector<JobOutcome>& outcomes);

private:
    struct Entry
    {
        JobId id = 0;
        Job job;
        unsigned weight = 1;
        CancelTokenPtr token;
        TransferProgress progress;
        jobstate_t state = JOB_QUEUED;
        TransferResult result;
    };

    // starts queued jobs while the limits allow; call with mMutex held
    void admit();

    void execute(Entry& entry, const common::Task& task);

    // finishes a queued job without running it; call with mMutex held
    void drop(Entry& entry, error reason);

    bool stop(JobId id, bool cancelling);

    mutable std::mutex mMutex;
    std::condition_variable mCV;

    unique_ptr<ConcurrencyBudget> mBudget;
    size_t mMaxRunning;

    map<JobId, unique_ptr<Entry>> mJobs;
    std::deque<JobId> mQueue;
    JobId mNextId = 1;
    size_t mRunning = 0;
    size_t mDone = 0;

    common::Logger mLogger;

    // last, so its workers are gone before the jobs they refer to
    common::TaskExecutor mExecutor;
};

} // namespace

#endif
