#pragma once

/// @file fixed_vector.hpp
/// @brief Fixed-capacity inline vector

#include "fwd.hpp"
#include <array>
#include <cstddef>
#include <utility>

namespace tether_core {

/// Vector with inline storage for at most N elements. Never allocates.
/// T must be default constructible.
template<typename T, std::size_t N>
class FixedVector {
public:
    using value_type = T;
    using iterator = T*;
    using const_iterator = const T*;

    FixedVector() = default;

    /// Append if there is room. Returns false when full.
    [[nodiscard]] bool try_push(T value) {
        if (m_size == N) {
            return false;
        }
        m_data[m_size++] = std::move(value);
        return true;
    }

    void clear() noexcept { m_size = 0; }

    [[nodiscard]] std::size_t size() const noexcept { return m_size; }
    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N; }
    [[nodiscard]] bool empty() const noexcept { return m_size == 0; }
    [[nodiscard]] bool full() const noexcept { return m_size == N; }

    [[nodiscard]] T& operator[](std::size_t i) { return m_data[i]; }
    [[nodiscard]] const T& operator[](std::size_t i) const { return m_data[i]; }

    [[nodiscard]] iterator begin() noexcept { return m_data.data(); }
    [[nodiscard]] iterator end() noexcept { return m_data.data() + m_size; }
    [[nodiscard]] const_iterator begin() const noexcept { return m_data.data(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_data.data() + m_size; }

private:
    std::array<T, N> m_data{};
    std::size_t m_size = 0;
};

} // namespace tether_core
