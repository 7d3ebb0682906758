/**
 * @file lockfree_queue.hpp
 * @brief Michael-Scott non-blocking MPMC queue with epoch-based node reclamation.
 * @author scottqueue contributors
 * @version 0.1.0
 *
 * Head and tail are atomic pointers into a singly-linked list that always starts with a sentinel.
 * Enqueue links a node with a CAS on the last node's `next` and then swings the tail; any thread
 * that finds the tail lagging swings it forward itself, so no thread waits for another. Dequeued
 * sentinels are retired into an EBRManager and freed only once no thread can still hold them.
 */

#ifndef SCOTTQUEUE_LOCKFREE_QUEUE_HPP_
#define SCOTTQUEUE_LOCKFREE_QUEUE_HPP_

#include <scottqueue/config.hpp>
#include <scottqueue/detail/likely.hpp>
#include <scottqueue/detail/node_allocator.hpp>
#include <scottqueue/ebr.hpp>
#include <scottqueue/node.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <new>
#include <optional>
#include <utility>

namespace scottqueue {

/**
 * @class LockFreeQueue
 * @brief Unbounded lock-free MPMC FIFO queue (Michael & Scott, 1996).
 *
 * Linearization points:
 * - enqueue: the successful CAS of the last node's `next` from nullptr to the new node.
 * - successful dequeue: the successful CAS of `head` to `head->next`.
 * - empty dequeue: the load of `head->next` that returned nullptr while head == tail.
 *
 * Every operation runs inside an @ref EpochGuard on the queue's own @ref EBRManager, so a node
 * loaded from `head`, `tail` or a `next` link stays allocated until the operation finishes. This
 * rules out both use-after-free and the ABA case where a CAS succeeds against a recycled address.
 *
 * The value of a dequeued node is moved out only by the thread whose head CAS succeeded; losing
 * threads never read it. The node is pinned by the winner's guard, so a concurrent dequeuer that
 * immediately retires it cannot free it underneath the move. Retiring goes through the node's
 * intrusive @ref RetireHook and never allocates, so a dequeue that passed its head CAS always
 * delivers its value.
 *
 * @tparam T Value type stored in the queue. Must be move-constructible; moving it should not throw
 *         (a throwing move after the head CAS loses that element).
 * @tparam Allocator Allocator rebound to the node type; must be safe to use from several threads
 *         at once.
 *
 * Thread-safety: all public methods except construction and destruction are safe for concurrent
 * multi-producer and multi-consumer use. No method ever blocks on another thread.
 *
 * Complexity: O(1) expected per operation; CAS retries are bounded by the number of contenders.
 *
 * Example:
 * @code
 * scottqueue::LockFreeQueue<std::uint64_t> q;
 * q.enqueue(1);
 * if (auto v = q.try_dequeue()) {
 *     // *v == 1
 * }
 * @endcode
 */
template <class T, class Allocator = std::allocator<T>>
class LockFreeQueue {
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
    LockFreeQueue() : LockFreeQueue(Allocator()) {}

    /**
     * @brief Construct an empty queue with a custom allocator and reclamation threshold.
     * @param alloc Node allocator.
     * @param reclaim_threshold Retired-node count that triggers a reclamation pass.
     * @throws std::bad_alloc If allocating the sentinel fails.
     */
    explicit LockFreeQueue(const Allocator& alloc,
                           std::size_t reclaim_threshold = config::kDefaultReclaimThreshold)
        : nodes_(alloc), ebr_(reclaim_threshold), head_(nullptr), tail_(nullptr) {
        node_type* sentinel = nodes_.create();
        head_.store(sentinel, std::memory_order_relaxed);
        tail_.store(sentinel, std::memory_order_relaxed);
    }

    /**
     * @brief Construct a queue holding the elements of [first, last) in iteration order.
     * @throws std::bad_alloc If any node allocation fails.
     */
    template <class InputIt>
    LockFreeQueue(InputIt first, InputIt last, const Allocator& alloc = Allocator())
        : LockFreeQueue(alloc) {
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
    LockFreeQueue(std::initializer_list<T> values, const Allocator& alloc = Allocator())
        : LockFreeQueue(values.begin(), values.end(), alloc) {}

    /**
     * @brief Destroy the queue, freeing linked nodes and every node still awaiting reclamation.
     *
     * @note Callers must ensure no other thread is accessing the queue during destruction.
     */
    ~LockFreeQueue() { nodes_.destroy_chain(head_.load(std::memory_order_relaxed)); }

    LockFreeQueue(const LockFreeQueue&) = delete;
    LockFreeQueue& operator=(const LockFreeQueue&) = delete;
    LockFreeQueue(LockFreeQueue&&) = delete;
    LockFreeQueue& operator=(LockFreeQueue&&) = delete;

    /**
     * @brief Enqueue a value by copying.
     * @return true on success; false if the node could not be allocated (queue unchanged).
     * @throws std::bad_alloc If first-time registration of the calling thread fails.
     */
    bool enqueue(const T& value) { return emplace(value); }

    /**
     * @brief Enqueue a value by moving.
     * @return true on success; false if the node could not be allocated (queue unchanged).
     * @throws std::bad_alloc If first-time registration of the calling thread fails.
     */
    bool enqueue(T&& value) { return emplace(std::move(value)); }

    /**
     * @brief Construct a value in place at the tail.
     * @return true on success; false on std::bad_alloc while creating the node (queue unchanged).
     *
     * @throws std::bad_alloc If first-time registration of the calling thread fails.
     * @throws Any other exception thrown by T's constructor (queue unchanged).
     */
    template <class... Args>
    bool emplace(Args&&... args) {
        EpochGuard guard(ebr_);

        node_type* node = nodes_.try_create(std::in_place, std::forward<Args>(args)...);
        if (node == nullptr) {
            return false;
        }

        while (true) {
            node_type* tail = tail_.load(std::memory_order_acquire);
            node_type* next = tail->next.load(std::memory_order_acquire);

            if (SCOTTQUEUE_UNLIKELY(tail != tail_.load(std::memory_order_acquire))) {
                continue;
            }

            if (next != nullptr) {
                // Another enqueue linked its node but has not swung the tail yet.
                (void)tail_.compare_exchange_weak(tail, next, std::memory_order_release,
                                                  std::memory_order_relaxed);
                continue;
            }

            if (tail->next.compare_exchange_weak(next, node, std::memory_order_release,
                                                 std::memory_order_relaxed)) {
                // Best effort; a lagging tail is fixed by whichever thread sees it next.
                (void)tail_.compare_exchange_strong(tail, node, std::memory_order_release,
                                                    std::memory_order_relaxed);
                return true;
            }
        }
    }

    /**
     * @brief Dequeue a value.
     * @param[out] out Receives the dequeued value (untouched if the queue is empty).
     * @return true if an element was dequeued; false if the queue was empty.
     *
     * The element is unlinked before it is assigned to @p out. If T's move assignment throws,
     * the exception propagates and that element is gone; its node is still reclaimed. Prefer
     * @ref try_dequeue for types whose move assignment can throw.
     *
     * @throws std::bad_alloc If first-time registration of the calling thread fails.
     */
    bool dequeue(T& out) {
        std::optional<T> value = pop_front();
        if (!value) {
            return false;
        }
        out = std::move(*value);
        return true;
    }

    /**
     * @brief Dequeue a value.
     * @return The dequeued value, or std::nullopt if the queue was empty.
     * @throws std::bad_alloc If first-time registration of the calling thread fails.
     */
    std::optional<T> try_dequeue() { return pop_front(); }

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
    bool empty() {
        EpochGuard guard(ebr_);
        node_type* head = head_.load(std::memory_order_acquire);
        return head->next.load(std::memory_order_acquire) == nullptr;
    }

    /** @brief The reclamation manager owning this queue's retired nodes. */
    EBRManager& reclaimer() noexcept { return ebr_; }

    /** @brief Size of one node allocation in bytes. */
    static constexpr std::size_t node_size_bytes() noexcept { return sizeof(node_type); }

   private:
    std::optional<T> pop_front() {
        EpochGuard guard(ebr_);

        while (true) {
            node_type* head = head_.load(std::memory_order_acquire);
            node_type* tail = tail_.load(std::memory_order_acquire);
            node_type* next = head->next.load(std::memory_order_acquire);

            if (SCOTTQUEUE_UNLIKELY(head != head_.load(std::memory_order_acquire))) {
                continue;
            }

            if (head == tail) {
                if (next == nullptr) {
                    return std::nullopt;  // Empty.
                }
                // Tail lags behind an enqueue that already linked its node.
                (void)tail_.compare_exchange_weak(tail, next, std::memory_order_release,
                                                  std::memory_order_relaxed);
                continue;
            }

            if (head_.compare_exchange_weak(head, next, std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
                // The old sentinel is handed over before any user code runs, so a throwing move
                // of T cannot strand it. `next` stays pinned by the guard.
                retire(head);
                std::optional<T> value(std::move(next->value));
                next->value.reset();
                return value;
            }
        }
    }

    void retire(node_type* node) noexcept {
        node->reclaim = &LockFreeQueue::reclaim_node;
        node->context = this;
        ebr_.retire(static_cast<RetireHook*>(node));
    }

    static void reclaim_node(RetireHook* hook, void* context) noexcept {
        auto* self = static_cast<LockFreeQueue*>(context);
        self->nodes_.destroy(static_cast<node_type*>(hook));
    }

    // Declared before ebr_: the manager's destructor frees pending nodes through it.
    detail::NodeAllocator<T, Allocator> nodes_;
    EBRManager ebr_;

    alignas(kCacheLineSize) std::atomic<node_type*> head_;
    alignas(kCacheLineSize) std::atomic<node_type*> tail_;
};

extern template class LockFreeQueue<std::uint64_t>;
extern template class LockFreeQueue<std::uint32_t>;

}  // namespace scottqueue

#endif  // SCOTTQUEUE_LOCKFREE_QUEUE_HPP_
