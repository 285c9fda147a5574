#include <megaflow/common/logging.h>
#include <megaflow/common/task_executor.h>

namespace megaflow
{
namespace common
{

TaskExecutor::TaskExecutor(const TaskExecutorFlags& flags,
                           Logger& logger)
  : mCV()
  , mIdle(0u)
  , mLock()
  , mLogger(logger)
  , mMaxWorkers(flags.mMaxWorkers ? flags.mMaxWorkers : 1u)
  , mTaskQueue()
  , mTerminating(false)
  , mWorkers()
{
    LogDebugF(mLogger, "Executor constructed (max %zu workers)", mMaxWorkers);
}

TaskExecutor::~TaskExecutor()
{
    std::vector<std::thread> workers;

    {
        std::lock_guard<std::mutex> guard(mLock);

        mTerminating = true;

        workers.swap(mWorkers);
    }

    mCV.notify_all();

    // Workers finish the task in hand before they notice.
    for (auto& worker : workers)
        worker.join();

    std::unique_lock<std::mutex> lock(mLock);

    std::size_t cancelled = 0;

    while (auto task = mTaskQueue.dequeue())
    {
        lock.unlock();

        task.cancel();
        ++cancelled;

        lock.lock();
    }

    LogDebugF(mLogger,
              "Executor destroyed (%zu workers joined, %zu tasks cancelled)",
              workers.size(),
              cancelled);
}

Task TaskExecutor::execute(std::string label,
                           std::function<void(const Task&)> function)
{
    if (!function)
        throw LogError1(mLogger, "Cannot execute an empty task");

    Task task(std::move(label), std::move(function), mLogger);

    std::unique_lock<std::mutex> lock(mLock);

    if (mTerminating)
    {
        lock.unlock();

        task.cancel();

        return task;
    }

    mTaskQueue.queue(task);

    // Every idle worker already has a queued task waiting for it.
    if (mIdle < mTaskQueue.size() && mWorkers.size() < mMaxWorkers)
    {
        mWorkers.emplace_back(&TaskExecutor::loop, this);

        LogDebugF(mLogger,
                  "Started worker %zu of %zu for %s",
                  mWorkers.size(),
                  mMaxWorkers,
                  task.label().c_str());
    }

    lock.unlock();

    mCV.notify_one();

    return task;
}

std::size_t TaskExecutor::workers() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mWorkers.size();
}

void TaskExecutor::loop()
{
    std::unique_lock<std::mutex> lock(mLock);

    while (true)
    {
        ++mIdle;

        mCV.wait(lock, [this]() {
            return mTerminating || !mTaskQueue.empty();
        });

        --mIdle;

        if (mTerminating)
            break;

        auto task = mTaskQueue.dequeue();

        lock.unlock();

        task.complete();

        lock.lock();
    }

    LogDebug1(mLogger, "Worker stopped");
}

} // common
} // megaflow

