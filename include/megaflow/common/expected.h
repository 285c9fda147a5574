#pragma once

#include <megaflow/common/expected_forward.h>
#include <megaflow/common/unexpected.h>

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

namespace megaflow
{
namespace common
{
namespace detail
{

template<typename U>
struct IsWrapper: std::false_type
{}; // IsWrapper<U>

template<typename F, typename U>
struct IsWrapper<Expected<F, U>>: std::true_type
{}; // IsWrapper<Expected<F, U>>

template<typename F>
struct IsWrapper<Unexpected<F>>: std::true_type
{}; // IsWrapper<Unexpected<F>>

} // detail

// Either a T or the E explaining why there is none.
//
// Tests true when it holds a value. Reading the side that isn't there is a
// programming error.
template<typename E, typename T>
class Expected
{
    template<typename U>
    static constexpr bool AcceptsValue =
        !detail::IsWrapper<std::decay_t<U>>::value
        && std::is_constructible<T, U>::value;

    std::variant<E, T> mValue;

public:
    template<typename F>
    Expected(Unexpected<F> error):
        mValue(std::in_place_index<0>, std::move(error).value())
    {}

    template<typename U, std::enable_if_t<AcceptsValue<U>>* = nullptr>
    Expected(U&& value):
        mValue(std::in_place_index<1>, std::forward<U>(value))
    {}

    explicit operator bool() const
    {
        return mValue.index() == 1;
    }

    bool operator!() const
    {
        return mValue.index() == 0;
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    T& operator*() &
    {
        return value();
    }

    const T& operator*() const&
    {
        return value();
    }

    T&& operator*() &&
    {
        return std::move(*this).value();
    }

    const E& error() const
    {
        assert(!*this);

        return std::get<0>(mValue);
    }

    T& value() &
    {
        assert(*this);

        return std::get<1>(mValue);
    }

    const T& value() const&
    {
        assert(*this);

        return std::get<1>(mValue);
    }

    T&& value() &&
    {
        assert(*this);

        return std::get<1>(std::move(mValue));
    }
}; // Expected<E, T>

} // common
} // megaflow

