/**
 * @file two_lock_queue.hpp
 * @brief Michael-Scott two-lock MPMC queue.
 * @author scottqueue contributors
 * @version 0.1.0
 *
 * The queue keeps a singly-linked list with a permanent sentinel at the head. One mutex guards the
 * head end and another guards the tail end, so an enqueue and a dequeue never wait for each
 * other; only operations on the same end are serialized.
 */

#ifndef SCOTTQUEUE_TWO_LOCK_QUEUE_HPP_
#define SCOTTQUEUE_TWO_LOCK_QUEUE_HPP_

#include <scottqueue/config.hpp>
#include <scottqueue/detail/node_allocator.hpp>
#include <scottqueue/node.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <utility>

namespace scottqueue {

/**
 * @class TwoLockQueue
 * @brief Unbounded blocking MPMC FIFO queue with separate head and tail locks.
 *
 * - enqueue links a new node after the tail under the tail lock and linearizes when it updates
 *   the tail pointer.
 * - dequeue advances the head under the head lock and linearizes when it updates the head
 *   pointer. The consumed node becomes the new sentinel; the old sentinel is freed immediately.
 *
 * An empty dequeue returns at once; operations block only while waiting for their own lock.
 *
 * @tparam T Value type stored in the queue. Must be move-constructible.
 * @tparam Allocator Allocator rebound to the node type. Must be safe to use from several threads
 *         at once (enqueue allocates under the tail lock while dequeue frees outside the head lock).
 *
 * Thread-safety: all public methods except construction and destruction are safe for concurrent
 * multi-producer and multi-consumer use.
 *
 * Complexity: O(1) per operation, plus lock contention.
 *
 * Example:
 * @code
 * scottqueue::TwoLockQueue<int> q;
 * q.enqueue(1);
 * int v = 0;
 * if (q.dequeue(v)) {
 *     // v == 1
 * }
 * @endcode
 */
template <class T, class Allocator = std::allocator<T>>
class TwoLockQueue {
    using node_type = Node<T>;

   public:
    /** @brief Value type stored in the queue. */
    using value_type = T;
    /** @brief Allocator type supplied by the user (rebound internally to the node type). */
    using allocator_type = Allocator;

    /**
     * @brief Construct an empty queue containing only the sentinel.
     * @throws std::bad_alloc If allocating the sentinel fails.
     */
    TwoLockQueue() : TwoLockQueue(Allocator()) {}

    /**
     * @brief Construct an empty queue that allocates nodes from @p alloc.
     * @throws std::bad_alloc If allocating the sentinel fails.
     */
    explicit TwoLockQueue(const Allocator& alloc) : nodes_(alloc), head_(nullptr), tail_(nullptr) {
        node_type* sentinel = nodes_.create();
        head_ = sentinel;
        tail_ = sentinel;
    }

    /**
     * @brief Construct a queue holding the elements of [first, last) in iteration order.
     * @throws std::bad_alloc If any node allocation fails.
     */
    template <class InputIt>
    TwoLockQueue(InputIt first, InputIt last, const Allocator& alloc = Allocator())
        : TwoLockQueue(alloc) {
        for (; first != last; ++first) {
            if (!emplace(*first)) {
                throw std::bad_alloc();
            }
        }
    }

    /**
     * @brief Construct a queue holding @p values in list order.
     * @throws std::bad_alloc If any node allocation fails.
     */
    TwoLockQueue(std::initializer_list<T> values, const Allocator& alloc = Allocator())
        : TwoLockQueue(values.begin(), values.end(), alloc) {}

    /** @brief Destroy the queue and free all remaining nodes (must not race with other threads). */
    ~TwoLockQueue() { nodes_.destroy_chain(head_); }

    TwoLockQueue(const TwoLockQueue&) = delete;
    TwoLockQueue& operator=(const TwoLockQueue&) = delete;
    TwoLockQueue(TwoLockQueue&&) = delete;
    TwoLockQueue& operator=(TwoLockQueue&&) = delete;

    /**
     * @brief Enqueue a value by copying.
     * @return true on success; false if the node could not be allocated (queue unchanged).
     */
    bool enqueue(const T& value) { return emplace(value); }

    /**
     * @brief Enqueue a value by moving.
     * @return true on success; false if the node could not be allocated (queue unchanged).
     */
    bool enqueue(T&& value) { return emplace(std::move(value)); }

    /**
     * @brief Construct a value in place at the tail.
     * @return true on success; false on std::bad_alloc while creating the node (queue unchanged).
     *
     * @throws Any other exception thrown by T's constructor (queue unchanged).
     */
    template <class... Args>
    bool emplace(Args&&... args) {
        node_type* node = nodes_.try_create(std::in_place, std::forward<Args>(args)...);
        if (node == nullptr) {
            return false;
        }

        std::lock_guard<std::mutex> lock(tail_mutex_);
        tail_->next.store(node, std::memory_order_release);
        tail_ = node;
        return true;
    }

    /**
     * @brief Dequeue a value.
     * @param[out] out Receives the dequeued value (untouched if the queue is empty).
     * @return true if an element was dequeued; false if the queue was empty.
     */
    bool dequeue(T& out) {
        return pop_front([&out](T& value) { out = std::move(value); });
    }

    /**
     * @brief Dequeue a value.
     * @return The dequeued value, or std::nullopt if the queue was empty.
     */
    std::optional<T> try_dequeue() {
        std::optional<T> result;
        (void)pop_front([&result](T& value) { result.emplace(std::move(value)); });
        return result;
    }

    /**
     * @brief Dequeue into @p out until the queue is observed empty.
     * @return Number of values written.
     */
    template <class OutputIt>
    std::size_t drain(OutputIt out) {
        std::size_t count = 0;
        while (std::optional<T> value = try_dequeue()) {
            *out = std::move(*value);
            ++out;
            ++count;
        }
        return count;
    }

    /** @brief True if no element was available at the instant of the check. */
    bool empty() const {
        std::lock_guard<std::mutex> lock(head_mutex_);
        return head_->next.load(std::memory_order_acquire) == nullptr;
    }

    /** @brief Size of one node allocation in bytes. */
    static constexpr std::size_t node_size_bytes() noexcept { return sizeof(node_type); }

   private:
    // Hands the front value to `consume` under the head lock, then frees the old sentinel. If
    // `consume` throws, the queue is unchanged.
    template <class Consume>
    bool pop_front(Consume&& consume) {
        node_type* old_head = nullptr;
        {
            std::lock_guard<std::mutex> lock(head_mutex_);
            old_head = head_;
            node_type* new_head = old_head->next.load(std::memory_order_acquire);
            if (new_head == nullptr) {
                return false;
            }
            consume(*new_head->value);
            new_head->value.reset();
            head_ = new_head;
        }
        nodes_.destroy(old_head);
        return true;
    }

    detail::NodeAllocator<T, Allocator> nodes_;

    alignas(kCacheLineSize) mutable std::mutex head_mutex_;
    node_type* head_;

    alignas(kCacheLineSize) std::mutex tail_mutex_;
    node_type* tail_;
};

extern template class TwoLockQueue<std::uint64_t>;
extern template class TwoLockQueue<std::uint32_t>;

}  // namespace scottqueue

#endif  // SCOTTQUEUE_TWO_LOCK_QUEUE_HPP_
