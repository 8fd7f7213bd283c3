#pragma once

#include <topo/core/debug.hpp>

#include <type_traits>

namespace topo
{
    template <typename T>
    constexpr T min(const T lhs, const T rhs) noexcept
    {
        return lhs < rhs ? lhs : rhs;
    }

    template <typename T, typename U>
        requires std::is_integral_v<T> && std::is_integral_v<U>
    constexpr T narrow_cast(U u) noexcept
    {
        const auto t = static_cast<T>(u);

        TOPO_ASSERT(static_cast<U>(t) == u, "A narrow cast failed");

        if constexpr (std::is_signed_v<T> != std::is_signed_v<U>)
        {
            TOPO_ASSERT((t < T{}) == (u < U{}), "A narrow cast failed");
        }

        return t;
    }
}
