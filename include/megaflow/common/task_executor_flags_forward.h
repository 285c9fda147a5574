#pragma once

namespace megaflow
{
namespace common
{

struct TaskExecutorFlags;

} // common
} // megaflow

