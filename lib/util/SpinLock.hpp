#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "util/Backoff.hpp"

namespace atomrt::util {

/**
 * @brief Two-state test-and-set lock.
 *
 * Not reentrant. lock() spins until the CAS succeeds; with NoBackoff it is
 * potentially unbounded under contention. Unlocking a lock the caller does
 * not hold is undefined.
 */
template <typename BackoffStrategy = NoBackoff>
class SpinLock final {
public:
    enum class State: std::uint8_t {
        Unlocked,
        Locked
    };

    using backoff_type = BackoffStrategy;

    static_assert(std::atomic<State>::is_always_lock_free, "SpinLock state must be lock-free");

    constexpr SpinLock() noexcept = default;

    SpinLock(const SpinLock&) = delete;
    SpinLock& operator=(const SpinLock&) = delete;

    void lock() noexcept {
        auto expected{State::Unlocked};
        std::size_t step{0};

        while (!state_.compare_exchange_weak(expected,
                                             State::Locked,
                                             std::memory_order_acquire,
                                             std::memory_order_relaxed)) {
            BackoffStrategy::backoff(++step);

            expected = State::Unlocked;
        }
    }

    [[nodiscard]] bool try_lock() noexcept {
        auto expected{State::Unlocked};

        return state_.compare_exchange_strong(expected,
                                              State::Locked,
                                              std::memory_order_acquire,
                                              std::memory_order_relaxed);
    }

    void unlock() noexcept {
        state_.store(State::Unlocked, std::memory_order_release);
    }

    // diagnostics only, the answer may be stale by the time it is returned
    [[nodiscard]] bool isLocked() const noexcept {
        return state_.load(std::memory_order_relaxed) == State::Locked;
    }

private:
    std::atomic<State> state_{State::Unlocked};
};

}
