#include "LockTable.hpp"

namespace atomrt::atomics {

std::array<LockTable::lock_type, LockTable::size_value> LockTable::locks_{};

LockTable::lock_type& LockTable::forPtr(const volatile void* ptr) noexcept {
    return locks_[indexFor(ptr)];
}

}
