/**
 * @file ebr.hpp
 * @brief Epoch-Based Reclamation (EBR) for nodes unlinked from lock-free structures.
 * @author scottqueue contributors
 * @version 0.1.0
 *
 * Threads bracket every access to shared nodes with a critical section that pins the global epoch.
 * A retired node is stamped with the epoch current at retirement and is freed only once the global
 * epoch has advanced two steps beyond the stamp, i.e. after every thread that could have loaded a
 * pointer to it has left its critical section.
 */

#ifndef SCOTTQUEUE_EBR_HPP_
#define SCOTTQUEUE_EBR_HPP_

#include <scottqueue/config.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace scottqueue {

namespace detail {
struct EpochSlot;
}  // namespace detail

/**
 * @struct RetireHook
 * @brief Intrusive link embedded in objects retired through @ref EBRManager::retire(RetireHook*).
 *
 * The manager chains pending hooks through `retired_next`, so retiring a hooked object never
 * allocates. `reclaim` is called exactly once with `context` when the object is safe to free.
 */
struct RetireHook {
    using ReclaimFn = void (*)(RetireHook* hook, void* context) noexcept;

    RetireHook* retired_next{nullptr};
    ReclaimFn reclaim{nullptr};
    void* context{nullptr};
};

/**
 * @class EBRManager
 * @brief Epoch-Based Reclamation manager for safe deferred freeing.
 *
 * This implementation uses a 3-generation retired list strategy:
 * - Nodes retired in epoch E are stored in retired_[E % 3]
 * - Nodes can be safely reclaimed once global_epoch >= E + 2
 *
 * Threads register lazily on their first @ref enter_critical. Each registration occupies one
 * epoch slot owned by the manager; a slot is released when its thread exits (or when the thread
 * binds more managers than its cache holds) and is reused by the next registering thread.
 *
 * Thread-safety: All public methods are thread-safe. Each thread that accesses an EBR-protected
 * data structure brackets the access with @ref enter_critical and @ref exit_critical (or uses
 * @ref EpochGuard). Critical sections nest on the same thread.
 *
 * Complexity:
 * - @ref enter_critical / @ref exit_critical - O(1) once the thread is registered
 * - @ref retire - amortized O(1), plus an occasional @ref try_reclaim
 * - @ref try_reclaim - O(S + R) for S registered slots and R pending nodes
 *
 * Example:
 * @code
 * scottqueue::EBRManager ebr;
 * {
 *     scottqueue::EpochGuard g(ebr);
 *     // ... load and dereference shared pointers ...
 *     ebr.retire(unlinked_node);
 * }
 * @endcode
 */
class EBRManager {
   public:
    /**
     * @brief Construct an EBR manager.
     * @param reclaim_threshold Pending-node count that triggers a reclamation pass from
     *        @ref retire. Zero is treated as one.
     */
    explicit EBRManager(std::size_t reclaim_threshold = config::kDefaultReclaimThreshold);

    /**
     * @brief Destroy the manager, freeing every pending node.
     *
     * @note No thread may be inside a critical section of this manager during destruction.
     */
    ~EBRManager();

    EBRManager(const EBRManager&) = delete;
    EBRManager& operator=(const EBRManager&) = delete;
    EBRManager(EBRManager&&) = delete;
    EBRManager& operator=(EBRManager&&) = delete;

    /**
     * @brief Enter a critical section, pinning the current global epoch.
     *
     * Pointers loaded from the protected structure after this call stay valid until the matching
     * @ref exit_critical.
     *
     * @throws std::bad_alloc If first-time registration of the calling thread fails to allocate.
     */
    void enter_critical();

    /**
     * @brief Exit a critical section. Pairs with enter_critical().
     */
    void exit_critical() noexcept;

    /**
     * @brief Retire a node for later reclamation.
     *
     * The caller must not touch @p ptr after this call.
     *
     * @param ptr Pointer to retire (ignored if nullptr).
     * @param deleter Function that frees @p ptr once it is safe.
     *
     * @throws std::bad_alloc If internal bookkeeping storage grows and allocation fails. The node
     *         is not retired in that case and still belongs to the caller.
     */
    void retire(void* ptr, std::function<void(void*)> deleter);

    /**
     * @brief Retire a node using default delete.
     *
     * @tparam T Type of the pointer
     * @param ptr Pointer to retire
     *
     * @throws std::bad_alloc If internal bookkeeping storage grows and allocation fails.
     */
    template <typename T>
    void retire(T* ptr) {
        retire(static_cast<void*>(ptr), [](void* p) { delete static_cast<T*>(p); });
    }

    /**
     * @brief Retire an object through its embedded hook.
     *
     * Never allocates and never throws. `hook->reclaim` and `hook->context` must be set by the
     * caller; the manager owns `hook->retired_next` until the object is reclaimed. A reclamation
     * pass triggered from here frees only hooked objects.
     *
     * @param hook Hook of the object to retire (ignored if nullptr).
     */
    void retire(RetireHook* hook) noexcept;

    /**
     * @brief Advance the epoch if possible and free nodes that are safe to delete.
     *
     * The global epoch moves forward by at most one step per call, and only when every thread
     * inside a critical section has observed the current epoch.
     *
     * @return Number of nodes freed by this call.
     *
     * @throws std::bad_alloc If collecting deleter-based nodes cannot allocate. Nothing is freed
     *         or detached in that case.
     */
    std::size_t try_reclaim();

    /** @brief Current global epoch. */
    std::uint64_t current_epoch() const noexcept;

    /** @brief True if there are nodes waiting to be reclaimed. */
    bool has_pending() const noexcept;

    /** @brief Number of nodes waiting to be reclaimed. */
    std::size_t pending_count() const noexcept;

    /** @brief Total number of nodes freed by @ref try_reclaim over the manager's lifetime. */
    std::size_t reclaimed_count() const noexcept;

    /** @brief Number of epoch slots currently bound to a live thread. */
    std::size_t registered_threads() const noexcept;

    /** @brief Pending-node count that triggers reclamation from @ref retire. */
    std::size_t reclaim_threshold() const noexcept { return reclaim_threshold_; }

   private:
    struct RetiredNode {
        void* ptr;
        std::function<void(void*)> deleter;
        std::uint64_t epoch;
    };

    static constexpr std::size_t kNumGenerations = 3;

    const std::uint64_t id_;
    const std::size_t reclaim_threshold_;

    alignas(kCacheLineSize) std::atomic<std::uint64_t> global_epoch_{0};
    alignas(kCacheLineSize) std::atomic<std::size_t> reclaimed_{0};

    mutable std::mutex retired_mutex_;
    std::vector<RetiredNode> retired_[kNumGenerations];
    RetireHook* retired_hooks_[kNumGenerations] = {nullptr, nullptr, nullptr};
    std::size_t pending_{0};
    std::size_t next_reclaim_at_;

    mutable std::mutex slots_mutex_;
    std::vector<std::shared_ptr<detail::EpochSlot>> slots_;

    detail::EpochSlot* acquire_slot();
    bool can_advance_epoch(std::uint64_t current) const;
    void advance_epoch();
    RetireHook* detach_safe_hooks(std::uint64_t safe_epoch) noexcept;
    static std::size_t reclaim_hooks(RetireHook* first) noexcept;
    std::size_t try_reclaim_hooks() noexcept;
};

/**
 * @class EpochGuard
 * @brief RAII guard for EBR critical sections.
 *
 * Calls enter_critical() on construction and exit_critical() on destruction. This is the
 * "protect" half of the reclamation contract: every pointer loaded while the guard is live is
 * protected until the guard goes out of scope.
 *
 * Usage:
 * @code
 * EBRManager& ebr = ...;
 * {
 *     EpochGuard guard(ebr);
 *     // Access shared data structure safely
 * } // exit_critical() called automatically
 * @endcode
 */
class EpochGuard {
   public:
    /**
     * @brief Construct an EpochGuard and enter critical section
     *
     * @param ebr Reference to the EBR manager
     * @throws std::bad_alloc If first-time thread registration fails.
     */
    explicit EpochGuard(EBRManager& ebr) : ebr_(ebr) { ebr_.enter_critical(); }

    /** @brief Destroy the EpochGuard and exit critical section */
    ~EpochGuard() noexcept { ebr_.exit_critical(); }

    EpochGuard(const EpochGuard&) = delete;
    EpochGuard& operator=(const EpochGuard&) = delete;
    EpochGuard(EpochGuard&&) = delete;
    EpochGuard& operator=(EpochGuard&&) = delete;

   private:
    EBRManager& ebr_;
};

}  // namespace scottqueue

#endif  // SCOTTQUEUE_EBR_HPP_
