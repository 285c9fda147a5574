/**
 * @file scheduler.cpp
 * @brief Queue of transfer jobs run on a bounded worker pool
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the rules set forth in the Terms of Service.
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

#include <megaflow/common/logging.h>

#include "megaflow/scheduler.h"

namespace megaflow {

Scheduler::Scheduler(unique_ptr<ConcurrencyBudget> budget, const common::TaskExecutorFlags& flags)
    : mBudget(std::move(budget))
    , mMaxRunning(flags.mMaxWorkers ? flags.mMaxWorkers : 1)
    , mLogger("Scheduler")
    , mExecutor(flags, mLogger)
{
    if (!mBudget)
    {
        throw LogError1(mLogger, "Scheduler constructed without a budget");
    }
}

Scheduler::~Scheduler()
{
    cancelAll();
    wait();
}

JobId Scheduler::submit(Job job)
{
    if (!job.run)
    {
        throw LogError1(mLogger, "Job submitted without a function");
    }

    std::lock_guard<std::mutex> g(mMutex);

    JobId id = mNextId++;
    auto entry = std::make_unique<Entry>();
    entry->id = id;
    entry->job = std::move(job);
    entry->weight = mBudget->clamp(entry->job.weight);
    entry->token = std::make_shared<CancelToken>();

    LogDebugF(mLogger, "Queued job %llu (%s), weight %u",
              static_cast<unsigned long long>(id), entry->job.label.c_str(), entry->weight);

    mJobs.emplace(id, std::move(entry));
    mQueue.push_back(id);

    admit();

    return id;
}

void Scheduler::admit()
{
    while (!mQueue.empty() && mRunning < mMaxRunning)
    {
        Entry& entry = *mJobs[mQueue.front()];

        if (!mBudget->tryAcquire(entry.weight))
        {
            break;
        }

        mQueue.pop_front();
        entry.state = JOB_RUNNING;
        entry.progress.weight = entry.weight;
        mRunning++;

        LogDebugF(mLogger, "Starting job %llu (%s), budget %u/%u",
                  static_cast<unsigned long long>(entry.id), entry.job.label.c_str(),
                  mBudget->inUse(), mBudget->capacity());

        Entry* e = &entry;
        mExecutor.execute(entry.job.label, [this, e](const common::Task& task) { execute(*e, task); });
    }
}

void Scheduler::execute(Entry& entry, const common::Task& task)
{
    TransferResult result;

    if (task.cancelled())
    {
        result.error = TRANSFER_ECANCELLED;
    }
    else
    {
        try
        {
            result = entry.job.run(*entry.token, entry.progress);
        }
        catch (std::exception& e)
        {
            LogWarningF(mLogger, "Job %llu (%s) threw: %s",
                        static_cast<unsigned long long>(entry.id), entry.job.label.c_str(), e.what());
            result.error = API_EINTERNAL;
        }
    }

    std::lock_guard<std::mutex> g(mMutex);

    entry.result = std::move(result);
    entry.state = JOB_DONE;
    mRunning--;
    mDone++;
    mBudget->release(entry.weight);

    if (entry.result.error.ok())
    {
        LogInfoF(mLogger, "Job %llu (%s) finished",
                 static_cast<unsigned long long>(entry.id), entry.job.label.c_str());
    }
    else
    {
        LogInfoF(mLogger, "Job %llu (%s) ended: %s",
                 static_cast<unsigned long long>(entry.id), entry.job.label.c_str(),
                 errorstring(entry.result.error));
    }

    admit();
    mCV.notify_all();
}

void Scheduler::drop(Entry& entry, error reason)
{
    for (auto it = mQueue.begin(); it != mQueue.end(); ++it)
    {
        if (*it == entry.id)
        {
            mQueue.erase(it);
            break;
        }
    }

    entry.result.error = reason;
    entry.state = JOB_DONE;
    mDone++;

    LogInfoF(mLogger, "Job %llu (%s) dropped from the queue: %s",
             static_cast<unsigned long long>(entry.id), entry.job.label.c_str(), errorstring(reason));

    mCV.notify_all();
}

bool Scheduler::stop(JobId id, bool cancelling)
{
    std::lock_guard<std::mutex> g(mMutex);

    auto it = mJobs.find(id);
    if (it == mJobs.end())
    {
        return false;
    }

    Entry& entry = *it->second;

    if (cancelling)
    {
        entry.token->cancel();
    }
    else
    {
        entry.token->pause();
    }

    if (entry.state == JOB_QUEUED)
    {
        drop(entry, cancelling ? TRANSFER_ECANCELLED : TRANSFER_EPAUSED);

        // the head may have changed
        admit();
    }

    return true;
}

bool Scheduler::pause(JobId id)
{
    return stop(id, false);
}

bool Scheduler::cancel(JobId id)
{
    return stop(id, true);
}

void Scheduler::pauseAll()
{
    std::lock_guard<std::mutex> g(mMutex);

    // queued jobs first, or a finishing job would admit them
    while (!mQueue.empty())
    {
        Entry& entry = *mJobs[mQueue.front()];
        entry.token->pause();
        drop(entry, TRANSFER_EPAUSED);
    }

    for (auto& j : mJobs)
    {
        if (j.second->state == JOB_RUNNING)
        {
            j.second->token->pause();
        }
    }
}

void Scheduler::cancelAll()
{
    std::lock_guard<std::mutex> g(mMutex);

    // drop the queue first so nothing new gets admitted
    while (!mQueue.empty())
    {
        Entry& entry = *mJobs[mQueue.front()];
        entry.token->cancel();
        drop(entry, TRANSFER_ECANCELLED);
    }

    for (auto& j : mJobs)
    {
        if (j.second->state == JOB_RUNNING)
        {
            j.second->token->cancel();
        }
    }
}

vector<JobOutcome> Scheduler::wait()
{
    std::unique_lock<std::mutex> lock(mMutex);

    mCV.wait(lock, [this]() { return mDone == mJobs.size(); });

    vector<JobOutcome> outcomes;
    outcomes.reserve(mJobs.size());

    for (const auto& j : mJobs)
    {
        outcomes.push_back(JobOutcome{j.first, j.second->job.label, j.second->result});
    }

    return outcomes;
}

SchedulerProgress Scheduler::progress() const
{
    std::lock_guard<std::mutex> g(mMutex);
    SchedulerProgress p;

    for (const auto& j : mJobs)
    {
        const Entry& entry = *j.second;

        p.bytesDone += entry.progress.done;
        p.bytesTotal += entry.progress.total;

        switch (entry.state)
        {
            case JOB_QUEUED:
                p.queued++;
                break;

            case JOB_RUNNING:
                p.running++;
                break;

            case JOB_DONE:
                if (entry.result.error.ok())
                {
                    p.done++;
                }
                else
                {
                    p.failed++;
                }
                break;
        }
    }

    return p;
}

int Scheduler::exitStatus(const vector<JobOutcome>& outcomes)
{
    for (const auto& o : outcomes)
    {
        if (!o.result.error.ok())
        {
            return 1;
        }
    }

    return 0;
}

} // namespace
