#pragma once

#include <cstddef>

#include <megaflow/common/task_executor_flags_forward.h>

namespace megaflow
{
namespace common
{

struct TaskExecutorFlags
{
    // Workers are started on demand, never more than this. Zero means one.
    std::size_t mMaxWorkers = 10;
}; // TaskExecutorFlags

} // common
} // megaflow

