#pragma once

namespace megaflow
{
namespace common
{

template<typename E>
class Unexpected;

} // common
} // megaflow

