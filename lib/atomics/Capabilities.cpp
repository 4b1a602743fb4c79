#include "Capabilities.hpp"

#include <array>
#include <cstddef>

#include "atomics/LockFree.hpp"
#include "atomics/LockTable.hpp"
#include "atomics/Ordering.hpp"
#include "util/Log.hpp"

namespace {
    constexpr const char* TAG = "atomrt";

    constexpr std::array<std::size_t, 5> WIDTHS{1, 2, 4, 8, 16};
}

namespace atomrt::atomics {

using namespace atomrt::util;

void logCapabilities() {
    Log::i(TAG, "lock table slots: ", LockTable::size());
    Log::i(TAG, "spin backoff: ", LockTable::lock_type::backoff_type::name);
    Log::i(TAG, "lock-free policy: ", DefaultLockFreePolicy::name);

    for (const auto w : WIDTHS)
        Log::i(TAG, "width ", w, "lock-free: ", isLockFree(w));

    // what the fast path issues for each external order code
    for (int code = static_cast<int>(Ordering::Relaxed); code <= static_cast<int>(Ordering::SeqCst); ++code) {
        const auto order = static_cast<Ordering>(code);

        Log::i(TAG, "order ", code, toString(order),
               " load: ", toString(loadOrdering(order)),
               " store: ", toString(storeOrdering(order)),
               " cas failure: ", toString(failureOrdering(order, order)));
    }
}

}
