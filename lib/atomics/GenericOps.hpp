#pragma once

#include <cstddef>
#include <cstdint>

#include "atomics/Ordering.hpp"

namespace atomrt::atomics::generic {

// Byte-wise atomic operations for values of any size. A size that matches a
// width class at an address aligned to it goes through AtomicOps, so both
// kinds of access to one object agree on how it is protected. Any other value
// is guarded by the lock of its base address.

void load(std::size_t size, const void* src, void* dst, Ordering order) noexcept;

void store(std::size_t size, void* dst, const void* src, Ordering order) noexcept;

void exchange(std::size_t size, void* ptr, const void* val, void* ret, Ordering order) noexcept;

[[nodiscard]] bool compareExchange(std::size_t size,
                                   void* ptr,
                                   void* expected,
                                   const void* desired,
                                   Ordering success,
                                   Ordering failure) noexcept;

}
