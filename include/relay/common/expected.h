#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

namespace relay
{
namespace common
{

// Marks a value as an error so that it can initialize an Expected.
template<typename E>
struct Unexpected
{
    E mError;
}; // Unexpected<E>

template<typename E>
Unexpected<std::decay_t<E>> unexpected(E&& error)
{
    return {std::forward<E>(error)};
}

// Either a value of type T or an error of type E.
template<typename E, typename T>
class Expected
{
    static_assert(!std::is_same_v<E, T>,
                  "Errors and values must have distinct types");

    std::variant<T, E> mResult;

public:
    template<typename U,
             typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    Expected(U&& value)
      : mResult(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    template<typename F>
    Expected(Unexpected<F> error)
      : mResult(std::in_place_index<1>, std::move(error.mError))
    {
    }

    explicit operator bool() const
    {
        return mResult.index() == 0;
    }

    bool operator!() const
    {
        return mResult.index() != 0;
    }

    T& operator*()
    {
        return value();
    }

    const T& operator*() const
    {
        return value();
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    E& error()
    {
        assert(!*this);

        return std::get<1>(mResult);
    }

    const E& error() const
    {
        assert(!*this);

        return std::get<1>(mResult);
    }

    T& value()
    {
        assert(*this);

        return std::get<0>(mResult);
    }

    const T& value() const
    {
        assert(*this);

        return std::get<0>(mResult);
    }

    T valueOr(T defaultValue) const
    {
        if (*this)
            return value();

        return defaultValue;
    }
}; // Expected<E, T>

} // common
} // relay

