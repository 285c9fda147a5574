#pragma once

#include <memory>

namespace megaflow
{
namespace common
{

class Task;
class TaskContext;
class TaskQueue;

using TaskContextPtr = std::shared_ptr<TaskContext>;

} // common
} // megaflow

