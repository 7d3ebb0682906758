#include <scottqueue/ebr.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace scottqueue {

namespace detail {

// One registered thread's view of a manager's epoch. `epoch` and `in_use` are read by reclaiming
// threads; `nesting` is touched only by the owning thread.
struct EpochSlot {
    static constexpr std::uint64_t kQuiescent = std::numeric_limits<std::uint64_t>::max();

    std::atomic<std::uint64_t> epoch{kQuiescent};
    std::atomic<bool> in_use{false};
    std::size_t nesting{0};
};

}  // namespace detail

namespace {

std::atomic<std::uint64_t> g_next_manager_id{1};

// Per-thread (manager id -> slot) bindings. Ids are never reused, so a binding that outlived its
// manager can never match again and is only dropped on eviction or thread exit. The cache holds
// shared ownership of each slot, so releasing a slot never touches a destroyed manager.
class ThreadSlotCache {
   public:
    ThreadSlotCache() { entries_.reserve(config::kThreadCacheSize); }

    ~ThreadSlotCache() {
        for (auto& entry : entries_) {
            release(entry);
        }
    }

    ThreadSlotCache(const ThreadSlotCache&) = delete;
    ThreadSlotCache& operator=(const ThreadSlotCache&) = delete;

    detail::EpochSlot* find(std::uint64_t owner) const noexcept {
        for (const auto& entry : entries_) {
            if (entry.owner == owner) {
                return entry.slot.get();
            }
        }
        return nullptr;
    }

    void bind(std::uint64_t owner, std::shared_ptr<detail::EpochSlot> slot) {
        if (entries_.size() < config::kThreadCacheSize) {
            entries_.push_back(Entry{owner, std::move(slot)});
            return;
        }

        // Round-robin eviction, skipping slots pinned by an enclosing critical section.
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            Entry& victim = entries_[(next_victim_ + i) % entries_.size()];
            if (victim.slot->nesting == 0) {
                next_victim_ = (next_victim_ + i + 1) % entries_.size();
                release(victim);
                victim = Entry{owner, std::move(slot)};
                return;
            }
        }
        entries_.push_back(Entry{owner, std::move(slot)});
    }

   private:
    struct Entry {
        std::uint64_t owner;
        std::shared_ptr<detail::EpochSlot> slot;
    };

    static void release(Entry& entry) noexcept {
        if (entry.slot) {
            entry.slot->nesting = 0;
            entry.slot->epoch.store(detail::EpochSlot::kQuiescent, std::memory_order_release);
            entry.slot->in_use.store(false, std::memory_order_release);
            entry.slot.reset();
        }
        entry.owner = 0;
    }

    std::vector<Entry> entries_;
    std::size_t next_victim_{0};
};

ThreadSlotCache& thread_slot_cache() {
    thread_local ThreadSlotCache cache;
    return cache;
}

}  // namespace

EBRManager::EBRManager(std::size_t reclaim_threshold)
    : id_(g_next_manager_id.fetch_add(1, std::memory_order_relaxed)),
      reclaim_threshold_(std::max<std::size_t>(1, reclaim_threshold)),
      next_reclaim_at_(reclaim_threshold_) {}

EBRManager::~EBRManager() {
    std::size_t freed = 0;
    for (std::size_t i = 0; i < kNumGenerations; ++i) {
        for (auto& node : retired_[i]) {
            node.deleter(node.ptr);
            ++freed;
        }
        retired_[i].clear();
        freed += reclaim_hooks(std::exchange(retired_hooks_[i], nullptr));
    }
    pending_ = 0;
    reclaimed_.fetch_add(freed, std::memory_order_relaxed);

    // Slots still bound in other threads' caches stay alive through their shared_ptr and are
    // released when those threads exit.
    std::lock_guard<std::mutex> lock(slots_mutex_);
    slots_.clear();
}

detail::EpochSlot* EBRManager::acquire_slot() {
    ThreadSlotCache& cache = thread_slot_cache();
    if (detail::EpochSlot* slot = cache.find(id_)) {
        return slot;
    }

    std::shared_ptr<detail::EpochSlot> slot;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto& candidate : slots_) {
            bool expected = false;
            if (candidate->in_use.compare_exchange_strong(expected, true,
                                                          std::memory_order_acq_rel)) {
                slot = candidate;
                break;
            }
        }
        if (!slot) {
            auto fresh = std::make_shared<detail::EpochSlot>();
            fresh->in_use.store(true, std::memory_order_relaxed);
            slots_.push_back(fresh);
            slot = std::move(fresh);
        }
    }

    detail::EpochSlot* raw = slot.get();
    try {
        cache.bind(id_, std::move(slot));
    } catch (...) {
        raw->in_use.store(false, std::memory_order_release);
        throw;
    }
    return raw;
}

void EBRManager::enter_critical() {
    detail::EpochSlot* slot = acquire_slot();
    if (slot->nesting++ != 0) {
        return;
    }
    const std::uint64_t epoch = global_epoch_.load(std::memory_order_relaxed);
    slot->epoch.store(epoch, std::memory_order_relaxed);
    // Publish the pin before any protected pointer is loaded; pairs with the fence in
    // try_reclaim().
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

void EBRManager::exit_critical() noexcept {
    detail::EpochSlot* slot = thread_slot_cache().find(id_);
    if (slot == nullptr || slot->nesting == 0) {
        return;
    }
    if (--slot->nesting == 0) {
        slot->epoch.store(detail::EpochSlot::kQuiescent, std::memory_order_release);
    }
}

void EBRManager::retire(void* ptr, std::function<void(void*)> deleter) {
    if (ptr == nullptr) {
        return;
    }

    // Stamp after the unlink is globally visible; pairs with the fence in try_reclaim().
    std::atomic_thread_fence(std::memory_order_seq_cst);
    const std::uint64_t epoch = global_epoch_.load(std::memory_order_relaxed);
    const std::size_t gen_idx = epoch % kNumGenerations;

    bool reclaim_now = false;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired_[gen_idx].push_back(RetiredNode{ptr, std::move(deleter), epoch});
        ++pending_;
        if (pending_ >= next_reclaim_at_) {
            next_reclaim_at_ = pending_ + reclaim_threshold_;
            reclaim_now = true;
        }
    }

    if (reclaim_now) {
        (void)try_reclaim();
    }
}

void EBRManager::retire(RetireHook* hook) noexcept {
    if (hook == nullptr) {
        return;
    }

    std::atomic_thread_fence(std::memory_order_seq_cst);
    const std::uint64_t epoch = global_epoch_.load(std::memory_order_relaxed);

    bool reclaim_now = false;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        RetireHook*& head = retired_hooks_[epoch % kNumGenerations];
        hook->retired_next = head;
        head = hook;
        ++pending_;
        if (pending_ >= next_reclaim_at_) {
            next_reclaim_at_ = pending_ + reclaim_threshold_;
            reclaim_now = true;
        }
    }

    if (reclaim_now) {
        (void)try_reclaim_hooks();
    }
}

bool EBRManager::can_advance_epoch(std::uint64_t current) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (const auto& slot : slots_) {
        const std::uint64_t pinned = slot->epoch.load(std::memory_order_acquire);
        if (pinned != detail::EpochSlot::kQuiescent && pinned != current) {
            return false;
        }
    }
    return true;
}

void EBRManager::advance_epoch() {
    std::atomic_thread_fence(std::memory_order_seq_cst);

    std::uint64_t current = global_epoch_.load(std::memory_order_acquire);
    if (can_advance_epoch(current)) {
        // A failed CAS means another reclaimer advanced it; either way it moved by one.
        (void)global_epoch_.compare_exchange_strong(current, current + 1,
                                                    std::memory_order_acq_rel,
                                                    std::memory_order_acquire);
    }
}

// Caller holds retired_mutex_. The epoch is read under the lock, so every hook already queued
// carries a stamp <= that epoch and the generation congruent to epoch - 2 holds nothing newer.
RetireHook* EBRManager::detach_safe_hooks(std::uint64_t safe_epoch) noexcept {
    RetireHook* first = std::exchange(retired_hooks_[safe_epoch % kNumGenerations], nullptr);
    for (RetireHook* hook = first; hook != nullptr; hook = hook->retired_next) {
        --pending_;
    }
    return first;
}

std::size_t EBRManager::reclaim_hooks(RetireHook* first) noexcept {
    std::size_t freed = 0;
    while (first != nullptr) {
        RetireHook* next = first->retired_next;
        first->reclaim(first, first->context);
        first = next;
        ++freed;
    }
    return freed;
}

std::size_t EBRManager::try_reclaim_hooks() noexcept {
    advance_epoch();

    RetireHook* hooks = nullptr;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        const std::uint64_t current = global_epoch_.load(std::memory_order_acquire);
        if (current < 2) {
            return 0;
        }
        hooks = detach_safe_hooks(current - 2);
        next_reclaim_at_ = pending_ + reclaim_threshold_;
    }

    const std::size_t freed = reclaim_hooks(hooks);
    reclaimed_.fetch_add(freed, std::memory_order_relaxed);
    return freed;
}

std::size_t EBRManager::try_reclaim() {
    advance_epoch();

    std::vector<RetiredNode> to_delete;
    RetireHook* hooks = nullptr;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        const std::uint64_t current = global_epoch_.load(std::memory_order_acquire);
        if (current < 2) {
            return 0;
        }
        const std::uint64_t safe_epoch = current - 2;

        const auto is_safe = [safe_epoch](const RetiredNode& node) {
            return node.epoch <= safe_epoch;
        };
        std::size_t safe_count = 0;
        for (const auto& generation : retired_) {
            safe_count += static_cast<std::size_t>(
                std::count_if(generation.begin(), generation.end(), is_safe));
        }
        if (safe_count != 0) {
            // Reserve before moving anything so an allocation failure leaves the lists untouched.
            to_delete.reserve(safe_count);

            for (std::size_t i = 0; i < kNumGenerations; ++i) {
                auto& generation = retired_[i];
                const auto split = std::stable_partition(
                    generation.begin(), generation.end(),
                    [safe_epoch](const RetiredNode& node) { return node.epoch > safe_epoch; });
                std::move(split, generation.end(), std::back_inserter(to_delete));
                generation.erase(split, generation.end());
            }
            pending_ -= to_delete.size();
        }

        hooks = detach_safe_hooks(safe_epoch);
        next_reclaim_at_ = pending_ + reclaim_threshold_;
    }

    for (auto& node : to_delete) {
        node.deleter(node.ptr);
    }
    const std::size_t freed = to_delete.size() + reclaim_hooks(hooks);

    reclaimed_.fetch_add(freed, std::memory_order_relaxed);
    return freed;
}

std::uint64_t EBRManager::current_epoch() const noexcept {
    return global_epoch_.load(std::memory_order_acquire);
}

bool EBRManager::has_pending() const noexcept { return pending_count() != 0; }

std::size_t EBRManager::pending_count() const noexcept {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    return pending_;
}

std::size_t EBRManager::reclaimed_count() const noexcept {
    return reclaimed_.load(std::memory_order_relaxed);
}

std::size_t EBRManager::registered_threads() const noexcept {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return static_cast<std::size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const auto& slot) {
            return slot->in_use.load(std::memory_order_acquire);
        }));
}

}  // namespace scottqueue
