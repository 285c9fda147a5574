#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>

#include <megaflow/common/logger_forward.h>
#include <megaflow/common/task_queue_forward.h>

namespace megaflow
{
namespace common
{

// A unit of work handed to a TaskExecutor.
//
// Copies share state: whichever of complete() or cancel() comes first runs
// the function, and the other becomes a no-op.
class Task
{
    friend class TaskQueue;

    TaskContextPtr mContext;

public:
    Task() = default;

    Task(std::string label,
         std::function<void(const Task&)> function,
         Logger& logger);

    explicit operator bool() const;

    bool operator!() const;

    // Run the function with cancelled() == true.
    bool cancel();

    bool cancelled() const;

    // Run the function.
    bool complete();

    // Has the function been claimed by complete() or cancel()?
    bool completed() const;

    // What the task was queued as, for logging.
    const std::string& label() const;
}; // Task

// Tasks in the order they were queued.
class TaskQueue
{
    std::deque<Task> mTasks;

public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue& other) = delete;

    // Cancels whatever is still queued.
    ~TaskQueue();

    TaskQueue& operator=(const TaskQueue& rhs) = delete;

    // Next task, or an empty one.
    Task dequeue();

    bool empty() const;

    // Tasks that already ran are not queued.
    Task queue(Task task);

    std::size_t size() const;
}; // TaskQueue

} // common
} // megaflow

