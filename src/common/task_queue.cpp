#include <atomic>

#include <megaflow/common/logging.h>
#include <megaflow/common/task_queue.h>

namespace megaflow
{
namespace common
{

class TaskContext
{
    std::string mLabel;

    std::function<void(const Task&)> mFunction;

    Logger& mLogger;

    // Set by whichever of complete() and cancel() gets here first.
    std::atomic<bool> mClaimed{false};

    std::atomic<bool> mCancelled{false};

public:
    TaskContext(std::string label,
                std::function<void(const Task&)> function,
                Logger& logger)
      : mLabel(std::move(label))
      , mFunction(std::move(function))
      , mLogger(logger)
    {
    }

    bool run(const Task& task, bool cancelling)
    {
        if (mClaimed.exchange(true))
            return false;

        mCancelled = cancelling;

        try
        {
            mFunction(task);
        }
        catch (std::exception& exception)
        {
            LogWarningF(mLogger,
                        "Task %s threw: %s",
                        mLabel.c_str(),
                        exception.what());
        }

        // Drop whatever the closure holds on to.
        mFunction = nullptr;

        return true;
    }

    bool cancelled() const
    {
        return mCancelled;
    }

    bool claimed() const
    {
        return mClaimed;
    }

    const std::string& label() const
    {
        return mLabel;
    }
}; // TaskContext

Task::Task(std::string label,
           std::function<void(const Task&)> function,
           Logger& logger)
  : mContext(std::make_shared<TaskContext>(std::move(label),
                                           std::move(function),
                                           logger))
{
}

Task::operator bool() const
{
    return !!mContext;
}

bool Task::operator!() const
{
    return !mContext;
}

bool Task::cancel()
{
    return mContext && mContext->run(*this, true);
}

bool Task::cancelled() const
{
    return mContext && mContext->cancelled();
}

bool Task::complete()
{
    return mContext && mContext->run(*this, false);
}

bool Task::completed() const
{
    return mContext && mContext->claimed();
}

const std::string& Task::label() const
{
    static const std::string unlabelled;

    return mContext ? mContext->label() : unlabelled;
}

TaskQueue::~TaskQueue()
{
    for (auto& task : mTasks)
        task.cancel();
}

Task TaskQueue::dequeue()
{
    if (mTasks.empty())
        return Task();

    Task task = std::move(mTasks.front());

    mTasks.pop_front();

    return task;
}

bool TaskQueue::empty() const
{
    return mTasks.empty();
}

Task TaskQueue::queue(Task task)
{
    if (task && !task.completed())
        mTasks.push_back(task);

    return task;
}

std::size_t TaskQueue::size() const
{
    return mTasks.size();
}

} // common
} // megaflow

