#pragma once

namespace megaflow
{
namespace common
{

template<typename E, typename T>
class Expected;

} // common
} // megaflow

