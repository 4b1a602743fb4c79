#pragma once

#include <cstddef>
#include <cstdint>

#include "util/Backoff.hpp"

// Build-time knobs, normally passed down from CMake.

#ifndef ATOMRT_LOCK_TABLE_BITS
#define ATOMRT_LOCK_TABLE_BITS 10
#endif

#ifndef ATOMRT_SPIN_YIELD_STEPS
#define ATOMRT_SPIN_YIELD_STEPS 0
#endif

#ifndef ATOMRT_NATIVE_FAST_PATH
#define ATOMRT_NATIVE_FAST_PATH 0
#endif

namespace atomrt::atomics::config {

constexpr std::size_t LOCK_TABLE_BITS = ATOMRT_LOCK_TABLE_BITS;
constexpr std::size_t SPIN_YIELD_STEPS = ATOMRT_SPIN_YIELD_STEPS;
constexpr bool NATIVE_FAST_PATH = ATOMRT_NATIVE_FAST_PATH != 0;

static_assert(LOCK_TABLE_BITS > 0 && LOCK_TABLE_BITS < 24, "Lock table bits out of range");

namespace detail {

template <std::size_t Steps>
struct SpinBackoff {
    using type = util::FixedStepBackoff<Steps>;
};

template <>
struct SpinBackoff<0> {
    using type = util::NoBackoff;
};

}

using spin_backoff_type = typename detail::SpinBackoff<SPIN_YIELD_STEPS>::type;

}
