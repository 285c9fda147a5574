#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <megaflow/common/logger_forward.h>
#include <megaflow/common/task_executor_flags.h>
#include <megaflow/common/task_queue.h>

namespace megaflow
{
namespace common
{

// Runs tasks in queueing order on a pool that grows up to mMaxWorkers.
class TaskExecutor
{
    // Body of every worker thread.
    void loop();

    // Signalled when a task is queued or we're shutting down.
    std::condition_variable mCV;

    // How many workers are waiting for a task?
    std::size_t mIdle;

    // Serializes access to everything below.
    mutable std::mutex mLock;

    Logger& mLogger;

    const std::size_t mMaxWorkers;

    TaskQueue mTaskQueue;

    bool mTerminating;

    std::vector<std::thread> mWorkers;

public:
    TaskExecutor(const TaskExecutorFlags& flags, Logger& logger);

    TaskExecutor(const TaskExecutor& other) = delete;

    // Waits for running tasks, then cancels the ones still queued.
    ~TaskExecutor();

    TaskExecutor& operator=(const TaskExecutor& rhs) = delete;

    // Queue a task, starting a worker if none is free to take it.
    //
    // After shutdown has begun the task is cancelled instead.
    Task execute(std::string label, std::function<void(const Task&)> function);

    // How many workers have been started?
    std::size_t workers() const;
}; // TaskExecutor

} // common
} // megaflow

