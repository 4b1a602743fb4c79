#include "Ordering.hpp"

#include <cstdlib>

#include "util/Log.hpp"

namespace {
    constexpr const char* TAG = "Ordering";

    constexpr int MIN_CODE = static_cast<int>(atomrt::atomics::Ordering::Relaxed);
    constexpr int MAX_CODE = static_cast<int>(atomrt::atomics::Ordering::SeqCst);
}

namespace atomrt::atomics {

using namespace atomrt::util;

Ordering toOrdering(int code) noexcept {
    if (code < MIN_CODE || code > MAX_CODE) {
        Log::e(TAG, "Memory order code out of range: ", code);

        std::abort();
    }

    return static_cast<Ordering>(code);
}

std::tuple<Status, Ordering> tryToOrdering(int code) noexcept {
    if (code < MIN_CODE || code > MAX_CODE)
        return {Status::InvalidArgument("Order code out of range"), Ordering::SeqCst};

    return {Status::Ok(), static_cast<Ordering>(code)};
}

const char* toString(Ordering order) noexcept {
    switch (order) {
    case Ordering::Relaxed: return "Relaxed";
    case Ordering::Monotonic: return "Monotonic";
    case Ordering::Acquire: return "Acquire";
    case Ordering::Release: return "Release";
    case Ordering::AcqRel: return "AcqRel";
    case Ordering::SeqCst: return "SeqCst";
    }

    return "Unknown";
}

}
