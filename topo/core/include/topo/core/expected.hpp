#pragma once

#include <topo/core/debug.hpp>
#include <topo/core/types.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace topo
{
    // A tag that indicates failure, used as default error type for expected.
    struct unspecified_error_tag
    {
    };

    // A tag for success, useful as default value for expected, if we only care about success.
    struct success_tag
    {
    };

    /// @brief A simplified std::expected, holding either a value of type T or an error of type E.
    /// @remarks Unlike std::expected, an error is constructed implicitly from E, so T and E must be distinct types.
    template <typename T = success_tag, typename E = unspecified_error_tag>
    class [[nodiscard]] expected
    {
        static_assert(!std::is_same_v<std::remove_cv_t<T>, std::remove_cv_t<E>>,
            "Value and error types must be distinct");

    public:
        expected() = delete;

        expected(const expected& other) : m_hasValue{other.m_hasValue}
        {
            if (m_hasValue)
            {
                std::construct_at(&m_value, other.m_value);
            }
            else
            {
                std::construct_at(&m_error, other.m_error);
            }
        }

        expected(expected&& other) noexcept : m_hasValue{other.m_hasValue}
        {
            if (m_hasValue)
            {
                std::construct_at(&m_value, std::move(other.m_value));
            }
            else
            {
                std::construct_at(&m_error, std::move(other.m_error));
            }
        }

        template <typename U = T>
            requires(!std::is_same_v<std::decay_t<U>, expected> && !std::is_same_v<std::decay_t<U>, E> &&
                std::is_constructible_v<T, U &&>)
        expected(U&& value) : m_hasValue{true}
        {
            std::construct_at(&m_value, std::forward<U>(value));
        }

        expected(const E& error) : m_hasValue{false}
        {
            std::construct_at(&m_error, error);
        }

        expected(E&& error) : m_hasValue{false}
        {
            std::construct_at(&m_error, std::move(error));
        }

        ~expected()
        {
            reset();
        }

        expected& operator=(const expected& other)
        {
            if (this != &other)
            {
                reset();
                std::construct_at(this, other);
            }

            return *this;
        }

        expected& operator=(expected&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                std::construct_at(this, std::move(other));
            }

            return *this;
        }

    public:
        const T* operator->() const noexcept
        {
            TOPO_ASSERT(has_value());
            return &m_value;
        }

        T* operator->() noexcept
        {
            TOPO_ASSERT(has_value());
            return &m_value;
        }

        const T& operator*() const noexcept
        {
            TOPO_ASSERT(has_value());
            return m_value;
        }

        T& operator*() noexcept
        {
            TOPO_ASSERT(has_value());
            return m_value;
        }

        bool has_value() const noexcept
        {
            return m_hasValue;
        }

        explicit operator bool() const noexcept
        {
            return m_hasValue;
        }

        T& value() noexcept
        {
            return **this;
        }

        const T& value() const noexcept
        {
            return **this;
        }

        E& error() noexcept
        {
            TOPO_ASSERT(!has_value());
            return m_error;
        }

        const E& error() const noexcept
        {
            TOPO_ASSERT(!has_value());
            return m_error;
        }

        template <typename U>
        T value_or(U&& fallback) const
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(fallback));
        }

    private:
        void reset() noexcept
        {
            if (m_hasValue)
            {
                std::destroy_at(&m_value);
            }
            else
            {
                std::destroy_at(&m_error);
            }
        }

    private:
        bool m_hasValue;

        union {
            T m_value;
            E m_error;
        };
    };

    constexpr unspecified_error_tag unspecified_error{};
    constexpr success_tag no_error{};
}
