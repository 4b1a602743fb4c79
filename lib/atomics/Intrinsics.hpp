#pragma once

#include <cstddef>
#include <cstdint>

#include "atomics/LockFree.hpp"

/**
 * C ABI entry points for compiled code.
 *
 * One set per width class N in {1, 2, 4, 8, 16}. The order arguments are C11
 * memory_order codes 0-5; any other code aborts the process.
 *
 *   atomrt_load_N(ptr, order) -> value
 *   atomrt_store_N(ptr, value, order)
 *   atomrt_compare_exchange_N(ptr, expected, desired, success, failure) -> 0 | 1
 *   atomrt_exchange_N(ptr, value, order) -> previous value
 *   atomrt_fetch_{add,sub,and,or,xor}_N(ptr, value, order) -> previous value
 */

#define ATOMRT_DECLARE_WIDTH(N, T)                                                          \
    T atomrt_load_##N(const T* ptr, int order) noexcept;                                    \
    void atomrt_store_##N(T* ptr, T value, int order) noexcept;                             \
    int atomrt_compare_exchange_##N(T* ptr, T* expected, T desired,                         \
                                    int success, int failure) noexcept;                     \
    T atomrt_exchange_##N(T* ptr, T value, int order) noexcept;                             \
    T atomrt_fetch_add_##N(T* ptr, T value, int order) noexcept;                            \
    T atomrt_fetch_sub_##N(T* ptr, T value, int order) noexcept;                            \
    T atomrt_fetch_and_##N(T* ptr, T value, int order) noexcept;                            \
    T atomrt_fetch_or_##N(T* ptr, T value, int order) noexcept;                             \
    T atomrt_fetch_xor_##N(T* ptr, T value, int order) noexcept;

extern "C" {

ATOMRT_DECLARE_WIDTH(1, std::uint8_t)
ATOMRT_DECLARE_WIDTH(2, std::uint16_t)
ATOMRT_DECLARE_WIDTH(4, std::uint32_t)
ATOMRT_DECLARE_WIDTH(8, std::uint64_t)
ATOMRT_DECLARE_WIDTH(16, atomrt::atomics::uint128_t)

int atomrt_is_lock_free(std::size_t size) noexcept;

void atomrt_load(std::size_t size, const void* src, void* dst, int order) noexcept;
void atomrt_store(std::size_t size, void* dst, const void* src, int order) noexcept;
void atomrt_exchange(std::size_t size, void* ptr, const void* val, void* ret, int order) noexcept;
int atomrt_compare_exchange(std::size_t size, void* ptr, void* expected, const void* desired,
                            int success, int failure) noexcept;

}

#undef ATOMRT_DECLARE_WIDTH
