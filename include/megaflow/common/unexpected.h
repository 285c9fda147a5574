#pragma once

#include <megaflow/common/unexpected_forward.h>

#include <type_traits>
#include <utility>

namespace megaflow
{
namespace common
{

// Marks a value as the error side of an Expected.
template<typename E>
class Unexpected
{
    E mError;

public:
    explicit Unexpected(E error):
        mError(std::move(error))
    {}

    const E& value() const&
    {
        return mError;
    }

    E&& value() &&
    {
        return std::move(mError);
    }
}; // Unexpected<E>

// return unexpected(Error(API_ENOENT));
template<typename E>
Unexpected<std::decay_t<E>> unexpected(E&& error)
{
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

} // common
} // megaflow

