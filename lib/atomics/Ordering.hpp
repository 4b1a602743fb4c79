#pragma once

#include <tuple>

#include "util/Status.hpp"

namespace atomrt::atomics {

/**
 * @brief Memory ordering requested by a caller.
 *
 * The numeric values are the external order codes (C11 memory_order
 * numbering) and must never be permuted.
 */
enum class Ordering: int {
    Relaxed = 0,
    Monotonic = 1,
    Acquire = 2,
    Release = 3,
    AcqRel = 4,
    SeqCst = 5
};

/**
 * @brief Maps an external order code to an Ordering.
 *
 * A code outside [0,5] means the caller is broken: the violation is logged
 * and the process aborts.
 */
[[nodiscard]] Ordering toOrdering(int code) noexcept;

/**
 * @brief Checked counterpart of toOrdering() for untrusted codes.
 */
[[nodiscard]] std::tuple<util::Status, Ordering> tryToOrdering(int code) noexcept;

[[nodiscard]] const char* toString(Ordering order) noexcept;

// Orderings valid for a single kind of access, as C11 requires them.

[[nodiscard]] constexpr Ordering loadOrdering(Ordering order) noexcept {
    switch (order) {
    case Ordering::Release: return Ordering::Relaxed;
    case Ordering::AcqRel: return Ordering::Acquire;
    default: return order;
    }
}

[[nodiscard]] constexpr Ordering storeOrdering(Ordering order) noexcept {
    switch (order) {
    case Ordering::Acquire: return Ordering::Relaxed;
    case Ordering::AcqRel: return Ordering::Release;
    default: return order;
    }
}

/**
 * @brief Failure ordering of a compare-exchange: no release component and
 * never stronger than the success ordering.
 */
[[nodiscard]] constexpr Ordering failureOrdering(Ordering success, Ordering failure) noexcept {
    const auto bounded = loadOrdering(failure);

    switch (loadOrdering(success)) {
    case Ordering::Relaxed:
    case Ordering::Monotonic:
        return Ordering::Relaxed;
    case Ordering::Acquire:
        return bounded == Ordering::SeqCst ? Ordering::Acquire : bounded;
    default:
        return bounded;
    }
}

}
