#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <type_traits>

#include "atomics/LockFree.hpp"
#include "atomics/LockTable.hpp"
#include "atomics/Ordering.hpp"

namespace atomrt::atomics {

enum class RmwOp {
    Exchange,
    Add,
    Sub,
    And,
    Or,
    Xor
};

namespace detail {

template <int Model>
using model = std::integral_constant<int, Model>;

template <RmwOp>
inline constexpr bool unsupported_rmw_v = false;

// The dispatchers below hand the callback a compile-time memory model, and
// only ever one the corresponding builtin accepts.

template <typename F>
decltype(auto) dispatchLoad(Ordering order, F&& f) {
    switch (loadOrdering(order)) {
    case Ordering::Acquire: return f(model<__ATOMIC_ACQUIRE>{});
    case Ordering::SeqCst: return f(model<__ATOMIC_SEQ_CST>{});
    default: return f(model<__ATOMIC_RELAXED>{});
    }
}

template <typename F>
decltype(auto) dispatchStore(Ordering order, F&& f) {
    switch (storeOrdering(order)) {
    case Ordering::Release: return f(model<__ATOMIC_RELEASE>{});
    case Ordering::SeqCst: return f(model<__ATOMIC_SEQ_CST>{});
    default: return f(model<__ATOMIC_RELAXED>{});
    }
}

template <typename F>
decltype(auto) dispatchRmw(Ordering order, F&& f) {
    switch (order) {
    case Ordering::Acquire: return f(model<__ATOMIC_ACQUIRE>{});
    case Ordering::Release: return f(model<__ATOMIC_RELEASE>{});
    case Ordering::AcqRel: return f(model<__ATOMIC_ACQ_REL>{});
    case Ordering::SeqCst: return f(model<__ATOMIC_SEQ_CST>{});
    default: return f(model<__ATOMIC_RELAXED>{});
    }
}

template <typename F>
decltype(auto) dispatchCompareExchange(Ordering success, Ordering failure, F&& f) {
    const auto fail = failureOrdering(success, failure);

    switch (success) {
    case Ordering::Acquire:
        if (fail == Ordering::Acquire)
            return f(model<__ATOMIC_ACQUIRE>{}, model<__ATOMIC_ACQUIRE>{});
        return f(model<__ATOMIC_ACQUIRE>{}, model<__ATOMIC_RELAXED>{});
    case Ordering::Release:
        return f(model<__ATOMIC_RELEASE>{}, model<__ATOMIC_RELAXED>{});
    case Ordering::AcqRel:
        if (fail == Ordering::Acquire)
            return f(model<__ATOMIC_ACQ_REL>{}, model<__ATOMIC_ACQUIRE>{});
        return f(model<__ATOMIC_ACQ_REL>{}, model<__ATOMIC_RELAXED>{});
    case Ordering::SeqCst:
        if (fail == Ordering::SeqCst)
            return f(model<__ATOMIC_SEQ_CST>{}, model<__ATOMIC_SEQ_CST>{});
        if (fail == Ordering::Acquire)
            return f(model<__ATOMIC_SEQ_CST>{}, model<__ATOMIC_ACQUIRE>{});
        return f(model<__ATOMIC_SEQ_CST>{}, model<__ATOMIC_RELAXED>{});
    default:
        return f(model<__ATOMIC_RELAXED>{}, model<__ATOMIC_RELAXED>{});
    }
}

template <RmwOp Op, int Model, typename T>
[[nodiscard]] inline T nativeRmw(T* ptr, T val) noexcept {
    if constexpr (Op == RmwOp::Exchange)
        return __atomic_exchange_n(ptr, val, Model);
    else if constexpr (Op == RmwOp::Add)
        return __atomic_fetch_add(ptr, val, Model);
    else if constexpr (Op == RmwOp::Sub)
        return __atomic_fetch_sub(ptr, val, Model);
    else if constexpr (Op == RmwOp::And)
        return __atomic_fetch_and(ptr, val, Model);
    else if constexpr (Op == RmwOp::Or)
        return __atomic_fetch_or(ptr, val, Model);
    else if constexpr (Op == RmwOp::Xor)
        return __atomic_fetch_xor(ptr, val, Model);
    else
        static_assert(unsupported_rmw_v<Op>, "Unsupported read-modify-write operation");
}

/**
 * @brief New value stored by a read-modify-write, with wraparound arithmetic.
 */
template <RmwOp Op, typename T>
[[nodiscard]] constexpr T applyRmw(T prev, T val) noexcept {
    if constexpr (Op == RmwOp::Exchange)
        return val;
    else if constexpr (Op == RmwOp::Add)
        return static_cast<T>(prev + val);
    else if constexpr (Op == RmwOp::Sub)
        return static_cast<T>(prev - val);
    else if constexpr (Op == RmwOp::And)
        return static_cast<T>(prev & val);
    else if constexpr (Op == RmwOp::Or)
        return static_cast<T>(prev | val);
    else if constexpr (Op == RmwOp::Xor)
        return static_cast<T>(prev ^ val);
    else
        static_assert(unsupported_rmw_v<Op>, "Unsupported read-modify-write operation");
}

}

/**
 * @brief Atomic operations on a value of one width class.
 *
 * Widths the policy reports lock-free use the hardware instructions with the
 * requested ordering. Every other width serializes on the lock table slot of
 * the target address; such operations behave at least as strongly as SeqCst
 * among themselves, whatever ordering was requested.
 */
template <std::size_t Width, typename LockFreePolicy = DefaultLockFreePolicy>
class AtomicOps final {
public:
    using value_type = width_value_t<Width>;
    using policy_type = LockFreePolicy;

    static constexpr std::size_t width_value = Width;

    static_assert(sizeof(value_type) == Width, "Width class and value type disagree");

    AtomicOps() = delete;

    [[nodiscard]] static constexpr bool isLockFree() noexcept {
        return LockFreePolicy::template isLockFree<Width>();
    }

    [[nodiscard]] static value_type load(const value_type* ptr, Ordering order) noexcept {
        if constexpr (isLockFree()) {
            return detail::dispatchLoad(order, [ptr](auto m) {
                return __atomic_load_n(ptr, decltype(m)::value);
            });
        }
        else {
            std::lock_guard guard(LockTable::forPtr(ptr));

            return *ptr;
        }
    }

    static void store(value_type* ptr, value_type value, Ordering order) noexcept {
        if constexpr (isLockFree()) {
            detail::dispatchStore(order, [ptr, value](auto m) {
                __atomic_store_n(ptr, value, decltype(m)::value);
            });
        }
        else {
            std::lock_guard guard(LockTable::forPtr(ptr));

            *ptr = value;
        }
    }

    /**
     * @brief Strong compare-and-swap.
     *
     * On success *ptr becomes desired and *expected is left alone. On failure
     * *ptr is left alone and *expected receives the value observed at ptr.
     */
    [[nodiscard]] static bool compareExchange(value_type* ptr,
                                              value_type* expected,
                                              value_type desired,
                                              Ordering success,
                                              Ordering failure) noexcept {
        if constexpr (isLockFree()) {
            return detail::dispatchCompareExchange(success, failure, [=](auto s, auto f) {
                return __atomic_compare_exchange_n(ptr, expected, desired, false,
                                                   decltype(s)::value, decltype(f)::value);
            });
        }
        else {
            std::lock_guard guard(LockTable::forPtr(ptr));

            if (*ptr == *expected) {
                *ptr = desired;

                return true;
            }

            *expected = *ptr;

            return false;
        }
    }

    /**
     * @brief Read-modify-write, returns the value held before the operation.
     */
    template <RmwOp Op>
    [[nodiscard]] static value_type rmw(value_type* ptr, value_type val, Ordering order) noexcept {
        if constexpr (isLockFree()) {
            return detail::dispatchRmw(order, [ptr, val](auto m) {
                return detail::nativeRmw<Op, decltype(m)::value>(ptr, val);
            });
        }
        else {
            std::lock_guard guard(LockTable::forPtr(ptr));

            const auto prev = *ptr;

            *ptr = detail::applyRmw<Op>(prev, val);

            return prev;
        }
    }
};

}
