#include <gtest/gtest.h>

#include <scottqueue/lockfree_queue.hpp>

#include "queue_suite.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

namespace {

struct LockFreeFamily {
    template <class T, class A = std::allocator<T>>
    using queue = scottqueue::LockFreeQueue<T, A>;
};

using scottqueue_test::AllocatorStats;
using scottqueue_test::TestAllocator;

struct ThrowingAssign {
    static std::atomic<bool> armed;

    explicit ThrowingAssign(int v = 0) : value(v) {}
    ThrowingAssign(ThrowingAssign&&) = default;

    ThrowingAssign& operator=(ThrowingAssign&& other) {
        if (armed.load(std::memory_order_relaxed)) {
            throw std::runtime_error("ThrowingAssign armed");
        }
        value = other.value;
        return *this;
    }

    int value;
};

std::atomic<bool> ThrowingAssign::armed{false};

}  // namespace

namespace scottqueue_test {
INSTANTIATE_TYPED_TEST_SUITE_P(LockFree, QueueSuite, LockFreeFamily);
}  // namespace scottqueue_test

TEST(LockFreeQueueTest, DequeuedSentinelsWaitForReclamation) {
    AllocatorStats stats;
    using Alloc = TestAllocator<std::uint64_t>;
    const Alloc alloc(&stats);
    scottqueue::LockFreeQueue<std::uint64_t, Alloc> q(alloc);

    for (std::uint64_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(q.enqueue(i));
    }
    for (std::uint64_t i = 0; i < 10; ++i) {
        ASSERT_EQ(q.try_dequeue(), std::optional<std::uint64_t>(i));
    }

    // Ten old sentinels are retired, none freed yet.
    EXPECT_EQ(q.reclaimer().pending_count(), 10u);
    EXPECT_EQ(stats.live(), 11u);

    for (int i = 0; i < 3; ++i) {
        q.reclaimer().try_reclaim();
    }
    EXPECT_EQ(q.reclaimer().pending_count(), 0u);
    EXPECT_EQ(q.reclaimer().reclaimed_count(), 10u);
    EXPECT_EQ(stats.live(), 1u);
}

TEST(LockFreeQueueTest, ReclaimThresholdBoundsPendingNodes) {
    constexpr std::size_t kThreshold = 8;
    AllocatorStats stats;
    using Alloc = TestAllocator<std::uint64_t>;
    const Alloc alloc(&stats);
    scottqueue::LockFreeQueue<std::uint64_t, Alloc> q(alloc, kThreshold);
    EXPECT_EQ(q.reclaimer().reclaim_threshold(), kThreshold);

    for (std::uint64_t i = 0; i < 1000; ++i) {
        ASSERT_TRUE(q.enqueue(i));
        ASSERT_EQ(q.try_dequeue(), std::optional<std::uint64_t>(i));
        ASSERT_LE(q.reclaimer().pending_count(), 3 * kThreshold);
    }
    EXPECT_GT(q.reclaimer().reclaimed_count(), 0u);
    EXPECT_LE(stats.live(), 1 + 3 * kThreshold);
}

TEST(LockFreeQueueTest, PinnedBystanderDelaysFreeButNotProgress) {
    AllocatorStats stats;
    using Alloc = TestAllocator<std::uint64_t>;
    const Alloc alloc(&stats);
    scottqueue::LockFreeQueue<std::uint64_t, Alloc> q(alloc, 4);

    std::atomic<bool> pinned{false};
    std::atomic<bool> can_exit{false};
    std::thread bystander([&]() {
        scottqueue::EpochGuard guard(q.reclaimer());
        pinned.store(true, std::memory_order_release);
        while (!can_exit.load(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
    });
    while (!pinned.load(std::memory_order_acquire)) {
        std::this_thread::yield();
    }

    // Every operation still completes; nothing can be freed while the bystander is pinned.
    for (std::uint64_t i = 0; i < 100; ++i) {
        ASSERT_TRUE(q.enqueue(i));
    }
    for (std::uint64_t i = 0; i < 100; ++i) {
        ASSERT_EQ(q.try_dequeue(), std::optional<std::uint64_t>(i));
    }
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(stats.deallocations.load(), 0u);
    EXPECT_EQ(q.reclaimer().pending_count(), 100u);

    can_exit.store(true, std::memory_order_release);
    bystander.join();

    for (int i = 0; i < 3; ++i) {
        q.reclaimer().try_reclaim();
    }
    EXPECT_EQ(q.reclaimer().pending_count(), 0u);
    EXPECT_EQ(stats.live(), 1u);
}

TEST(LockFreeQueueTest, WorkerThreadsReleaseRegistrationOnExit) {
    scottqueue::LockFreeQueue<std::uint64_t> q;

    for (int round = 0; round < 4; ++round) {
        std::thread worker([&]() {
            for (std::uint64_t i = 0; i < 100; ++i) {
                ASSERT_TRUE(q.enqueue(i));
                ASSERT_TRUE(q.try_dequeue().has_value());
            }
        });
        worker.join();
        EXPECT_EQ(q.reclaimer().registered_threads(), 0u);
    }
}

TEST(LockFreeQueueTest, ThrowingMoveAssignmentStillReclaimsOldSentinel) {
    AllocatorStats stats;
    using Alloc = TestAllocator<ThrowingAssign>;
    {
        const Alloc alloc(&stats);
        scottqueue::LockFreeQueue<ThrowingAssign, Alloc> q(alloc);
        ASSERT_TRUE(q.emplace(7));

        ThrowingAssign out;
        ThrowingAssign::armed.store(true);
        EXPECT_THROW(q.dequeue(out), std::runtime_error);
        ThrowingAssign::armed.store(false);

        // The element was unlinked before the assignment; its old sentinel went to the reclaimer.
        EXPECT_TRUE(q.empty());
        EXPECT_EQ(q.reclaimer().pending_count(), 1u);

        for (int i = 0; i < 3; ++i) {
            q.reclaimer().try_reclaim();
        }
        EXPECT_EQ(stats.live(), 1u);
    }
    EXPECT_EQ(stats.live(), 0u);
}

TEST(LockFreeQueueTest, TryDequeueNeverAssignsIntoCallerStorage) {
    scottqueue::LockFreeQueue<ThrowingAssign> q;
    ASSERT_TRUE(q.emplace(7));

    ThrowingAssign::armed.store(true);
    std::optional<ThrowingAssign> v = q.try_dequeue();
    ThrowingAssign::armed.store(false);

    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->value, 7);
    EXPECT_TRUE(q.empty());
}

TEST(LockFreeQueueTest, ReclaimThresholdOfOneFreesFromDequeuePath) {
    // Every pass runs from the dequeue path itself through the hooked retire.
    AllocatorStats stats;
    using Alloc = TestAllocator<std::uint64_t>;
    {
        const Alloc alloc(&stats);
        scottqueue::LockFreeQueue<std::uint64_t, Alloc> q(alloc, 1);

        for (std::uint64_t i = 0; i < 256; ++i) {
            ASSERT_TRUE(q.enqueue(i));
        }
        for (std::uint64_t i = 0; i < 256; ++i) {
            ASSERT_EQ(q.try_dequeue(), std::optional<std::uint64_t>(i));
        }
        EXPECT_LE(q.reclaimer().pending_count(), 3u);
        EXPECT_EQ(q.reclaimer().reclaimed_count() + q.reclaimer().pending_count(), 256u);
        EXPECT_EQ(stats.live(), 1 + q.reclaimer().pending_count());
    }
    EXPECT_EQ(stats.live(), 0u);
}
