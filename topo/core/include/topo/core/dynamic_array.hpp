#pragma once

#include <topo/core/allocator.hpp>
#include <topo/core/debug.hpp>
#include <topo/core/panic.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace topo
{
    constexpr usize make_new_exponential_capacity(usize desired)
    {
        constexpr usize minReserve{16};
        return desired < minReserve ? minReserve : std::bit_ceil(desired);
    }

    /// @brief Contiguous growable array which takes its memory from an allocator.
    /// @remarks The allocator is fixed at construction and propagated on copy and move.
    template <typename T>
    class dynamic_array
    {
    public:
        using value_type = T;

        using pointer = T*;
        using const_pointer = const T*;

        using reference = T&;
        using const_reference = const T&;

        using size_type = usize;
        using difference_type = ptrdiff;

        using iterator = T*;
        using const_iterator = const T*;

    public:
        dynamic_array() : m_allocator{select_global_allocator<alignof(T)>()} {}

        explicit dynamic_array(allocator* allocator) : m_allocator{allocator} {}

        dynamic_array(usize count, allocator* allocator) : m_allocator{allocator}
        {
            resize(count);
        }

        dynamic_array(const dynamic_array& other) : m_allocator{other.m_allocator}
        {
            reserve(other.m_size);
            std::uninitialized_copy(other.begin(), other.end(), m_data);
            m_size = other.m_size;
        }

        dynamic_array(dynamic_array&& other) noexcept :
            m_allocator{other.m_allocator}, m_data{other.m_data}, m_size{other.m_size}, m_capacity{other.m_capacity}
        {
            other.m_data = nullptr;
            other.m_size = 0;
            other.m_capacity = 0;
        }

        dynamic_array& operator=(const dynamic_array& other)
        {
            if (this != &other)
            {
                clear();
                reserve(other.m_size);

                std::uninitialized_copy(other.begin(), other.end(), m_data);
                m_size = other.m_size;
            }

            return *this;
        }

        dynamic_array& operator=(dynamic_array&& other) noexcept
        {
            if (this == &other)
            {
                return *this;
            }

            clear();

            if (m_allocator == other.m_allocator)
            {
                swap(other);
            }
            else
            {
                reserve(other.m_size);

                std::uninitialized_move(other.begin(), other.end(), m_data);
                m_size = other.m_size;

                other.clear();
            }

            return *this;
        }

        ~dynamic_array()
        {
            clear();
            free_storage();
        }

        void clear() noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
            {
                std::destroy(m_data, m_data + m_size);
            }

            m_size = 0;
        }

        void reserve(usize capacity)
        {
            if (capacity > m_capacity)
            {
                grow_capacity(capacity);
            }
        }

        void reserve_exponential(usize capacity)
        {
            if (capacity > m_capacity)
            {
                grow_capacity(make_new_exponential_capacity(capacity));
            }
        }

        void resize(usize newSize)
        {
            if (newSize > m_size)
            {
                reserve(newSize);
                std::uninitialized_value_construct(m_data + m_size, m_data + newSize);
            }
            else if constexpr (!std::is_trivially_destructible_v<T>)
            {
                std::destroy(m_data + newSize, m_data + m_size);
            }

            m_size = newSize;
        }

        void resize(usize newSize, const T& value)
        {
            if (newSize > m_size)
            {
                reserve(newSize);
                std::uninitialized_fill(m_data + m_size, m_data + newSize, value);
            }
            else if constexpr (!std::is_trivially_destructible_v<T>)
            {
                std::destroy(m_data + newSize, m_data + m_size);
            }

            m_size = newSize;
        }

        T& push_back(const T& e)
        {
            return emplace_back(e);
        }

        T& push_back(T&& e)
        {
            return emplace_back(std::move(e));
        }

        template <typename... Args>
        T& emplace_back(Args&&... args)
        {
            reserve_exponential(m_size + 1);
            auto* const r = new (m_data + m_size) T(std::forward<Args>(args)...);
            ++m_size;
            return *r;
        }

        void pop_back()
        {
            TOPO_ASSERT(m_size > 0);

            if constexpr (!std::is_trivially_destructible_v<T>)
            {
                back().~T();
            }

            --m_size;
        }

        T& front()
        {
            TOPO_ASSERT(m_size > 0);
            return *m_data;
        }

        const T& front() const
        {
            TOPO_ASSERT(m_size > 0);
            return *m_data;
        }

        T& back()
        {
            TOPO_ASSERT(m_size > 0);
            return m_data[m_size - 1];
        }

        const T& back() const
        {
            TOPO_ASSERT(m_size > 0);
            return m_data[m_size - 1];
        }

        void swap(dynamic_array& other) noexcept
        {
            TOPO_ASSERT(m_allocator == other.m_allocator, "Swapping is only possible if the allocator is the same");

            std::swap(m_data, other.m_data);
            std::swap(m_size, other.m_size);
            std::swap(m_capacity, other.m_capacity);
        }

        void shrink_to_fit()
        {
            if (m_size == m_capacity)
            {
                return;
            }

            if (m_size == 0)
            {
                free_storage();
                return;
            }

            dynamic_array tmp{m_allocator};
            tmp.reserve(m_size);

            std::uninitialized_move(begin(), end(), tmp.m_data);
            tmp.m_size = m_size;

            swap(tmp);
        }

        T& operator[](usize i)
        {
            TOPO_ASSERT(i < m_size);
            return m_data[i];
        }

        const T& operator[](usize i) const
        {
            TOPO_ASSERT(i < m_size);
            return m_data[i];
        }

        T* data() noexcept
        {
            return m_data;
        }

        const T* data() const noexcept
        {
            return m_data;
        }

        T* begin() noexcept
        {
            return m_data;
        }

        T* end() noexcept
        {
            return m_data + m_size;
        }

        const T* begin() const noexcept
        {
            return m_data;
        }

        const T* end() const noexcept
        {
            return m_data + m_size;
        }

        const T* cbegin() const noexcept
        {
            return m_data;
        }

        const T* cend() const noexcept
        {
            return m_data + m_size;
        }

        usize size() const noexcept
        {
            return m_size;
        }

        usize capacity() const noexcept
        {
            return m_capacity;
        }

        bool empty() const noexcept
        {
            return m_size == 0;
        }

        allocator* get_allocator() const noexcept
        {
            return m_allocator;
        }

        bool operator==(const dynamic_array& other) const noexcept
        {
            return std::equal(begin(), end(), other.begin(), other.end());
        }

        template <typename Other>
        bool operator==(const Other& other) const noexcept
        {
            return std::equal(begin(), end(), std::begin(other), std::end(other));
        }

    private:
        void grow_capacity(usize newCapacity)
        {
            byte* const newData = m_allocator->allocate(newCapacity * sizeof(T), alignof(T));
            TOPO_VERIFY(newData, "Out of memory");

            T* const newElements = reinterpret_cast<T*>(newData);

            if (m_size != 0)
            {
                std::uninitialized_move(begin(), end(), newElements);
                std::destroy(begin(), end());
            }

            if (m_data)
            {
                m_allocator->deallocate(reinterpret_cast<byte*>(m_data), m_capacity * sizeof(T), alignof(T));
            }

            m_data = newElements;
            m_capacity = newCapacity;
        }

        void free_storage() noexcept
        {
            TOPO_ASSERT(m_size == 0);

            if (m_data)
            {
                m_allocator->deallocate(reinterpret_cast<byte*>(m_data), m_capacity * sizeof(T), alignof(T));
            }

            m_data = nullptr;
            m_capacity = 0;
        }

    private:
        allocator* m_allocator{};
        T* m_data{};
        usize m_size{};
        usize m_capacity{};
    };
}
