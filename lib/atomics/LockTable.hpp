#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "atomics/Config.hpp"
#include "util/SpinLock.hpp"

namespace atomrt::atomics {

/**
 * @brief Process-wide table of spin locks shared by all fallback operations.
 *
 * An address selects its lock through indexFor(). The four low address bits
 * are dropped so every byte of a value up to 16 bytes wide maps to one lock,
 * then bits 20 and up are folded into the selector to spread fields of
 * unrelated objects. The table is constant-initialized and never destroyed.
 */
class LockTable final {
public:
    using lock_type = util::SpinLock<config::spin_backoff_type>;

    static constexpr std::size_t size_value = std::size_t{1} << config::LOCK_TABLE_BITS;
    static constexpr std::size_t mask_value = size_value - 1;

    static_assert((size_value & mask_value) == 0, "Lock table size should be a power of two");

    LockTable() = delete;
    ~LockTable() = delete;
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;

    [[nodiscard]] static constexpr std::size_t size() noexcept {
        return size_value;
    }

    [[nodiscard]] static constexpr std::size_t indexFor(std::uintptr_t address) noexcept {
        std::uintptr_t hash = address >> 4;

        const auto low = hash & mask_value;

        hash >>= 16;
        hash ^= low;

        return static_cast<std::size_t>(hash & mask_value);
    }

    [[nodiscard]] static std::size_t indexFor(const volatile void* ptr) noexcept {
        return indexFor(reinterpret_cast<std::uintptr_t>(ptr));
    }

    [[nodiscard]] static lock_type& forPtr(const volatile void* ptr) noexcept;

private:
    static std::array<lock_type, size_value> locks_;
};

}
