#pragma once

#include <cstddef>
#include <thread>

namespace atomrt::util {

/**
 * @brief Pure spin, no yield or sleep between attempts.
 */
struct NoBackoff {
    static constexpr const char* name = "none";

    static void backoff([[maybe_unused]] std::size_t step) noexcept {}
};

template <std::size_t Steps = 10000>
struct FixedStepBackoff {
    static_assert(Steps > 0, "Backoff step should be > 0");

    static constexpr const char* name = "yield";

    static void backoff(std::size_t step) noexcept {
        if (step % Steps == 0)
            std::this_thread::yield();
    }
};

}
