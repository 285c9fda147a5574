#pragma once

#include <megaflow/common/expected_forward.h>

namespace megaflow
{

class Error;

namespace common
{

// Result of an operation that yields a T or fails with an Error.
template<typename T>
using ErrorOr = Expected<Error, T>;

} // common
} // megaflow

