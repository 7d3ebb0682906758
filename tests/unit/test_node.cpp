#include <gtest/gtest.h>

#include <scottqueue/detail/node_allocator.hpp>
#include <scottqueue/node.hpp>
#include <support/test_allocator.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using scottqueue_test::AllocatorStats;
using scottqueue_test::TestAllocator;
using scottqueue_test::ThrowOnConstruct;

TEST(Node, DefaultConstructedIsSentinel) {
    scottqueue::Node<int> node;
    EXPECT_TRUE(node.is_sentinel());
    EXPECT_EQ(node.next.load(), nullptr);
}

TEST(Node, InPlaceConstructionHoldsValue) {
    scottqueue::Node<std::string> node(std::in_place, 3, 'x');
    ASSERT_FALSE(node.is_sentinel());
    EXPECT_EQ(*node.value, "xxx");
    EXPECT_EQ(node.next.load(), nullptr);
}

TEST(Node, ClearingValueTurnsNodeIntoSentinel) {
    scottqueue::Node<std::unique_ptr<int>> node(std::in_place, std::make_unique<int>(7));
    std::unique_ptr<int> taken = std::move(*node.value);
    node.value.reset();
    EXPECT_TRUE(node.is_sentinel());
    EXPECT_EQ(*taken, 7);
}

TEST(NodeAllocator, CreateAndDestroyBalance) {
    AllocatorStats stats;
    scottqueue::detail::NodeAllocator<int, TestAllocator<int>> nodes{TestAllocator<int>(&stats)};

    auto* sentinel = nodes.create();
    auto* node = nodes.create(std::in_place, 5);
    EXPECT_TRUE(sentinel->is_sentinel());
    EXPECT_EQ(*node->value, 5);
    EXPECT_EQ(stats.live(), 2u);

    nodes.destroy(node);
    nodes.destroy(sentinel);
    EXPECT_EQ(stats.live(), 0u);
}

TEST(NodeAllocator, TryCreateReportsAllocationFailure) {
    AllocatorStats stats;
    scottqueue::detail::NodeAllocator<int, TestAllocator<int>> nodes{TestAllocator<int>(&stats)};

    stats.fail.store(true);
    EXPECT_EQ(nodes.try_create(std::in_place, 1), nullptr);
    EXPECT_THROW(nodes.create(std::in_place, 1), std::bad_alloc);
    EXPECT_EQ(stats.failures.load(), 2u);
    EXPECT_EQ(stats.live(), 0u);
}

TEST(NodeAllocator, ConstructorExceptionReleasesStorage) {
    AllocatorStats stats;
    scottqueue::detail::NodeAllocator<ThrowOnConstruct, TestAllocator<ThrowOnConstruct>> nodes{
        TestAllocator<ThrowOnConstruct>(&stats)};

    ThrowOnConstruct::armed.store(true);
    EXPECT_THROW(nodes.try_create(std::in_place, 1), std::runtime_error);
    ThrowOnConstruct::armed.store(false);

    EXPECT_EQ(stats.allocations.load(), 1u);
    EXPECT_EQ(stats.live(), 0u);
}

TEST(NodeAllocator, DestroyChainFreesEveryLinkedNode) {
    AllocatorStats stats;
    scottqueue::detail::NodeAllocator<int, TestAllocator<int>> nodes{TestAllocator<int>(&stats)};

    auto* first = nodes.create();
    auto* cur = first;
    for (int i = 0; i < 10; ++i) {
        auto* next = nodes.create(std::in_place, i);
        cur->next.store(next);
        cur = next;
    }
    EXPECT_EQ(stats.live(), 11u);

    nodes.destroy_chain(first);
    EXPECT_EQ(stats.live(), 0u);
}
