/**
 * @file node.hpp
 * @brief Singly-linked list cell shared by both queue variants.
 * @author scottqueue contributors
 * @version 0.1.0
 */

#ifndef SCOTTQUEUE_NODE_HPP_
#define SCOTTQUEUE_NODE_HPP_

#include <scottqueue/ebr.hpp>

#include <atomic>
#include <optional>
#include <utility>

namespace scottqueue {

/**
 * @struct Node
 * @brief List cell holding an optional value and an atomic link to its successor.
 *
 * A node without a value is a sentinel. Each queue starts with one sentinel; a successful dequeue
 * clears the value of the node it consumes, turning that node into the new sentinel.
 *
 * Ownership: a linked node is referenced by exactly one predecessor. Once unlinked it belongs to
 * the owning queue's reclamation policy (immediate free for @ref TwoLockQueue, deferred free for
 * @ref LockFreeQueue). The @ref RetireHook base is the intrusive link the lock-free variant hands
 * to its @ref EBRManager, so retiring a node never allocates.
 *
 * @tparam T Value type.
 */
template <class T>
struct Node : RetireHook {
    /** @brief Payload; empty for the sentinel. */
    std::optional<T> value;
    /** @brief Successor, or nullptr for the last node. Written only through atomic operations. */
    std::atomic<Node*> next;

    /** @brief Construct a sentinel node. */
    Node() : value(), next(nullptr) {}

    /** @brief Construct a node holding a value built from @p args. */
    template <class... Args>
    explicit Node(std::in_place_t, Args&&... args)
        : value(std::in_place, std::forward<Args>(args)...), next(nullptr) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /** @brief True if the node carries no value. */
    bool is_sentinel() const noexcept { return !value.has_value(); }
};

}  // namespace scottqueue

#endif  // SCOTTQUEUE_NODE_HPP_
