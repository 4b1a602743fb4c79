#include <atomic>
#include <limits>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <atomics/AtomicOps.hpp>
#include <atomics/LockTable.hpp>

using namespace atomrt::atomics;

namespace {

template <std::size_t Width, typename Policy>
struct Case {
    using ops = AtomicOps<Width, Policy>;
    using value_type = typename ops::value_type;
};

/**
 * @brief Result of Op applied in isolation, computed by the hardware where
 * std::atomic supports the width.
 */
template <RmwOp Op, typename T>
std::pair<T, T> shadowRmw(T initial, T val) {
    if constexpr (sizeof(T) <= sizeof(std::uint64_t)) {
        std::atomic<T> shadow{initial};
        T prev;

        if constexpr (Op == RmwOp::Exchange)
            prev = shadow.exchange(val, std::memory_order_relaxed);
        else if constexpr (Op == RmwOp::Add)
            prev = shadow.fetch_add(val, std::memory_order_relaxed);
        else if constexpr (Op == RmwOp::Sub)
            prev = shadow.fetch_sub(val, std::memory_order_relaxed);
        else if constexpr (Op == RmwOp::And)
            prev = shadow.fetch_and(val, std::memory_order_relaxed);
        else if constexpr (Op == RmwOp::Or)
            prev = shadow.fetch_or(val, std::memory_order_relaxed);
        else
            prev = shadow.fetch_xor(val, std::memory_order_relaxed);

        return {prev, shadow.load()};
    }
    else {
        T next;

        if constexpr (Op == RmwOp::Exchange)
            next = val;
        else if constexpr (Op == RmwOp::Add)
            next = initial + val;
        else if constexpr (Op == RmwOp::Sub)
            next = initial - val;
        else if constexpr (Op == RmwOp::And)
            next = initial & val;
        else if constexpr (Op == RmwOp::Or)
            next = initial | val;
        else
            next = initial ^ val;

        return {initial, next};
    }
}

template <typename T>
std::vector<std::pair<T, T>> operandPairs() {
    constexpr auto max = std::numeric_limits<T>::max();

    return {
        {T(128), T(42)},
        {T(0), T(1)},
        {max, T(1)},
        {T(max / 3), T(max / 5)},
        {T(0xA5), T(0x5A)},
        {max, max}
    };
}

template <RmwOp Op, typename C>
void checkAgainstShadow() {
    using value_type = typename C::value_type;

    for (auto [initial, val] : operandPairs<value_type>()) {
        const auto [expectedPrev, expectedNext] = shadowRmw<Op>(initial, val);

        for (int code = 0; code < 6; ++code) {
            value_type actual = initial;

            ASSERT_TRUE(C::ops::template rmw<Op>(&actual, val, toOrdering(code)) == expectedPrev);
            ASSERT_TRUE(actual == expectedNext);
        }
    }
}

}

template <typename C>
class AtomicOpsTest : public ::testing::Test {};

using Cases = ::testing::Types<Case<1, NoLockFree>,
                               Case<2, NoLockFree>,
                               Case<4, NoLockFree>,
                               Case<8, NoLockFree>,
                               Case<16, NoLockFree>,
                               Case<1, NativeLockFree>,
                               Case<2, NativeLockFree>,
                               Case<4, NativeLockFree>,
                               Case<8, NativeLockFree>,
                               Case<16, NativeLockFree>>;

TYPED_TEST_SUITE(AtomicOpsTest, Cases);

TYPED_TEST(AtomicOpsTest, CompareExchangeSucceeds) {
    using ops = typename TypeParam::ops;
    using value_type = typename TypeParam::value_type;

    value_type dst = 128;
    value_type expected = 128;

    ASSERT_TRUE(ops::compareExchange(&dst, &expected, 42, toOrdering(1), toOrdering(1)));
    ASSERT_TRUE(dst == 42);
    ASSERT_TRUE(expected == 128);
}

TYPED_TEST(AtomicOpsTest, CompareExchangeFailsAndRefreshesExpected) {
    using ops = typename TypeParam::ops;
    using value_type = typename TypeParam::value_type;

    value_type dst = 128;
    value_type expected = 5;

    ASSERT_FALSE(ops::compareExchange(&dst, &expected, 42, toOrdering(1), toOrdering(1)));
    ASSERT_TRUE(dst == 128);
    ASSERT_TRUE(expected == 128);

    // the refreshed value makes the retry succeed
    ASSERT_TRUE(ops::compareExchange(&dst, &expected, 42, toOrdering(1), toOrdering(1)));
    ASSERT_TRUE(dst == 42);
}

TYPED_TEST(AtomicOpsTest, CompareExchangeEveryOrderingPair) {
    using ops = typename TypeParam::ops;
    using value_type = typename TypeParam::value_type;

    for (int success = 0; success < 6; ++success) {
        for (int failure = 0; failure < 6; ++failure) {
            value_type dst = 7;
            value_type expected = 7;

            ASSERT_TRUE(ops::compareExchange(&dst, &expected, 9, toOrdering(success), toOrdering(failure)));
            ASSERT_TRUE(dst == 9);

            ASSERT_FALSE(ops::compareExchange(&dst, &expected, 11, toOrdering(success), toOrdering(failure)));
            ASSERT_TRUE(dst == 9);
            ASSERT_TRUE(expected == 9);
        }
    }
}

TYPED_TEST(AtomicOpsTest, AddReturnsPreviousValue) {
    using ops = typename TypeParam::ops;
    using value_type = typename TypeParam::value_type;

    value_type dst = 128;

    ASSERT_TRUE(ops::template rmw<RmwOp::Add>(&dst, 42, toOrdering(1)) == 128);
    ASSERT_TRUE(dst == 170);
}

TYPED_TEST(AtomicOpsTest, LoadStoreEveryOrdering) {
    using ops = typename TypeParam::ops;
    using value_type = typename TypeParam::value_type;

    value_type cell = 0;

    for (int code = 0; code < 6; ++code) {
        const auto value = static_cast<value_type>(std::numeric_limits<value_type>::max() - code);

        ops::store(&cell, value, toOrdering(code));

        ASSERT_TRUE(cell == value);
        ASSERT_TRUE(ops::load(&cell, toOrdering(code)) == value);
    }
}

TYPED_TEST(AtomicOpsTest, RmwMatchesShadow) {
    checkAgainstShadow<RmwOp::Exchange, TypeParam>();
    checkAgainstShadow<RmwOp::Add, TypeParam>();
    checkAgainstShadow<RmwOp::Sub, TypeParam>();
    checkAgainstShadow<RmwOp::And, TypeParam>();
    checkAgainstShadow<RmwOp::Or, TypeParam>();
    checkAgainstShadow<RmwOp::Xor, TypeParam>();
}

TYPED_TEST(AtomicOpsTest, FallbackReleasesItsLock) {
    using ops = typename TypeParam::ops;
    using value_type = typename TypeParam::value_type;

    value_type cell = 1;
    value_type expected = 2;

    (void)ops::load(&cell, Ordering::SeqCst);
    ops::store(&cell, 3, Ordering::SeqCst);
    (void)ops::compareExchange(&cell, &expected, 4, Ordering::SeqCst, Ordering::SeqCst);
    (void)ops::template rmw<RmwOp::Xor>(&cell, 1, Ordering::SeqCst);

    ASSERT_FALSE(LockTable::forPtr(&cell).isLocked());
}

TEST(LockFreeTest, BaselinePolicyIsNeverLockFree) {
    for (auto width : {1u, 2u, 4u, 8u, 16u})
        ASSERT_FALSE(isLockFree<NoLockFree>(width));

    static_assert(!AtomicOps<16, NoLockFree>::isLockFree());
    static_assert(!AtomicOps<1, NoLockFree>::isLockFree());
}

TEST(LockFreeTest, UnknownWidthsAreNotLockFree) {
    for (auto width : {0u, 3u, 5u, 12u, 24u, 32u}) {
        ASSERT_FALSE(isLockFree<NoLockFree>(width));
        ASSERT_FALSE(isLockFree<NativeLockFree>(width));
    }
}

TEST(LockFreeTest, NativePolicyFollowsTheCompiler) {
    ASSERT_EQ(isLockFree<NativeLockFree>(1), __atomic_always_lock_free(1, 0));
    ASSERT_EQ(isLockFree<NativeLockFree>(4), __atomic_always_lock_free(4, 0));
    ASSERT_EQ(isLockFree<NativeLockFree>(8), __atomic_always_lock_free(8, 0));
    ASSERT_EQ(isLockFree<NativeLockFree>(16), __atomic_always_lock_free(16, 0));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
