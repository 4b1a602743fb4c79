#pragma once

#include <cstddef>
#include <cstdint>

#include "atomics/Config.hpp"

namespace atomrt::atomics {

__extension__ typedef unsigned __int128 uint128_t;

/**
 * @brief Value type carried by each width class.
 */
template <std::size_t Width>
struct WidthTraits;

template <> struct WidthTraits<1> { using type = std::uint8_t; };
template <> struct WidthTraits<2> { using type = std::uint16_t; };
template <> struct WidthTraits<4> { using type = std::uint32_t; };
template <> struct WidthTraits<8> { using type = std::uint64_t; };
template <> struct WidthTraits<16> { using type = uint128_t; };

template <std::size_t Width>
using width_value_t = typename WidthTraits<Width>::type;

/**
 * @brief Baseline policy: no width is treated as lock-free, every operation
 * goes through the lock table.
 */
struct NoLockFree {
    static constexpr const char* name = "fallback";

    template <std::size_t Width>
    static constexpr bool isLockFree() noexcept {
        return false;
    }
};

/**
 * @brief Widths the compiler can always access lock-free on this target use
 * the hardware instructions directly.
 */
struct NativeLockFree {
    static constexpr const char* name = "native";

    template <std::size_t Width>
    static constexpr bool isLockFree() noexcept {
        return __atomic_always_lock_free(Width, 0);
    }
};

#if ATOMRT_NATIVE_FAST_PATH
using DefaultLockFreePolicy = NativeLockFree;
#else
using DefaultLockFreePolicy = NoLockFree;
#endif

template <typename Policy = DefaultLockFreePolicy>
[[nodiscard]] constexpr bool isLockFree(std::size_t width) noexcept {
    switch (width) {
    case 1: return Policy::template isLockFree<1>();
    case 2: return Policy::template isLockFree<2>();
    case 4: return Policy::template isLockFree<4>();
    case 8: return Policy::template isLockFree<8>();
    case 16: return Policy::template isLockFree<16>();
    default: return false;
    }
}

}
