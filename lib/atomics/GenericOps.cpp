#include "GenericOps.hpp"

#include <cstddef>
#include <cstring>
#include <mutex>
#include <type_traits>

#include "atomics/AtomicOps.hpp"

namespace atomrt::atomics::generic {

namespace {

template <std::size_t Width>
using width = std::integral_constant<std::size_t, Width>;

[[nodiscard]] bool isAligned(const void* ptr, std::size_t alignment) noexcept {
    return reinterpret_cast<std::uintptr_t>(ptr) % alignment == 0;
}

/**
 * @brief Invokes f with the width class of size if ptr is aligned to it.
 * @return false if the value has to be handled byte-wise under a lock
 */
template <typename F>
[[nodiscard]] bool withWidth(std::size_t size, const void* ptr, F&& f) {
    if (!isAligned(ptr, size == 0 ? 1 : size))
        return false;

    switch (size) {
    case 1: f(width<1>{}); return true;
    case 2: f(width<2>{}); return true;
    case 4: f(width<4>{}); return true;
    case 8: f(width<8>{}); return true;
    case 16: f(width<16>{}); return true;
    default: return false;
    }
}

}

void load(std::size_t size, const void* src, void* dst, Ordering order) noexcept {
    const auto routed = withWidth(size, src, [=](auto w) {
        using ops = AtomicOps<decltype(w)::value>;

        const auto value = ops::load(static_cast<const typename ops::value_type*>(src), order);

        std::memcpy(dst, &value, sizeof(value));
    });

    if (routed)
        return;

    std::lock_guard guard(LockTable::forPtr(src));

    std::memcpy(dst, src, size);
}

void store(std::size_t size, void* dst, const void* src, Ordering order) noexcept {
    const auto routed = withWidth(size, dst, [=](auto w) {
        using ops = AtomicOps<decltype(w)::value>;

        typename ops::value_type value;
        std::memcpy(&value, src, sizeof(value));

        ops::store(static_cast<typename ops::value_type*>(dst), value, order);
    });

    if (routed)
        return;

    std::lock_guard guard(LockTable::forPtr(dst));

    std::memcpy(dst, src, size);
}

void exchange(std::size_t size, void* ptr, const void* val, void* ret, Ordering order) noexcept {
    const auto routed = withWidth(size, ptr, [=](auto w) {
        using ops = AtomicOps<decltype(w)::value>;

        typename ops::value_type value;
        std::memcpy(&value, val, sizeof(value));

        const auto prev = ops::template rmw<RmwOp::Exchange>(static_cast<typename ops::value_type*>(ptr),
                                                             value,
                                                             order);

        std::memcpy(ret, &prev, sizeof(prev));
    });

    if (routed)
        return;

    std::lock_guard guard(LockTable::forPtr(ptr));

    std::memcpy(ret, ptr, size);
    std::memcpy(ptr, val, size);
}

bool compareExchange(std::size_t size,
                     void* ptr,
                     void* expected,
                     const void* desired,
                     Ordering success,
                     Ordering failure) noexcept {
    bool exchanged = false;

    const auto routed = withWidth(size, ptr, [&](auto w) {
        using ops = AtomicOps<decltype(w)::value>;

        // expected and desired may be unaligned
        typename ops::value_type current;
        typename ops::value_type value;
        std::memcpy(&current, expected, sizeof(current));
        std::memcpy(&value, desired, sizeof(value));

        exchanged = ops::compareExchange(static_cast<typename ops::value_type*>(ptr),
                                         &current,
                                         value,
                                         success,
                                         failure);

        if (!exchanged)
            std::memcpy(expected, &current, sizeof(current));
    });

    if (routed)
        return exchanged;

    std::lock_guard guard(LockTable::forPtr(ptr));

    if (std::memcmp(ptr, expected, size) == 0) {
        std::memcpy(ptr, desired, size);

        return true;
    }

    std::memcpy(expected, ptr, size);

    return false;
}

}
