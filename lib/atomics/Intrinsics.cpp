#include "Intrinsics.hpp"

#include "atomics/AtomicOps.hpp"
#include "atomics/GenericOps.hpp"
#include "atomics/Ordering.hpp"

using atomrt::atomics::AtomicOps;
using atomrt::atomics::RmwOp;
using atomrt::atomics::toOrdering;

#define ATOMRT_DEFINE_RMW(NAME, OP, N, T)                                                   \
    T atomrt_##NAME##_##N(T* ptr, T value, int order) noexcept {                            \
        return AtomicOps<N>::rmw<RmwOp::OP>(ptr, value, toOrdering(order));                 \
    }

#define ATOMRT_DEFINE_WIDTH(N, T)                                                           \
    T atomrt_load_##N(const T* ptr, int order) noexcept {                                   \
        return AtomicOps<N>::load(ptr, toOrdering(order));                                  \
    }                                                                                       \
                                                                                            \
    void atomrt_store_##N(T* ptr, T value, int order) noexcept {                            \
        AtomicOps<N>::store(ptr, value, toOrdering(order));                                 \
    }                                                                                       \
                                                                                            \
    int atomrt_compare_exchange_##N(T* ptr, T* expected, T desired,                         \
                                    int success, int failure) noexcept {                    \
        return AtomicOps<N>::compareExchange(ptr, expected, desired,                        \
                                             toOrdering(success),                           \
                                             toOrdering(failure)) ? 1 : 0;                  \
    }                                                                                       \
                                                                                            \
    ATOMRT_DEFINE_RMW(exchange, Exchange, N, T)                                             \
    ATOMRT_DEFINE_RMW(fetch_add, Add, N, T)                                                 \
    ATOMRT_DEFINE_RMW(fetch_sub, Sub, N, T)                                                 \
    ATOMRT_DEFINE_RMW(fetch_and, And, N, T)                                                 \
    ATOMRT_DEFINE_RMW(fetch_or, Or, N, T)                                                   \
    ATOMRT_DEFINE_RMW(fetch_xor, Xor, N, T)

extern "C" {

ATOMRT_DEFINE_WIDTH(1, std::uint8_t)
ATOMRT_DEFINE_WIDTH(2, std::uint16_t)
ATOMRT_DEFINE_WIDTH(4, std::uint32_t)
ATOMRT_DEFINE_WIDTH(8, std::uint64_t)
ATOMRT_DEFINE_WIDTH(16, atomrt::atomics::uint128_t)

int atomrt_is_lock_free(std::size_t size) noexcept {
    return atomrt::atomics::isLockFree(size) ? 1 : 0;
}

void atomrt_load(std::size_t size, const void* src, void* dst, int order) noexcept {
    atomrt::atomics::generic::load(size, src, dst, toOrdering(order));
}

void atomrt_store(std::size_t size, void* dst, const void* src, int order) noexcept {
    atomrt::atomics::generic::store(size, dst, src, toOrdering(order));
}

void atomrt_exchange(std::size_t size, void* ptr, const void* val, void* ret, int order) noexcept {
    atomrt::atomics::generic::exchange(size, ptr, val, ret, toOrdering(order));
}

int atomrt_compare_exchange(std::size_t size, void* ptr, void* expected, const void* desired,
                            int success, int failure) noexcept {
    return atomrt::atomics::generic::compareExchange(size, ptr, expected, desired,
                                                    toOrdering(success),
                                                    toOrdering(failure)) ? 1 : 0;
}

}
