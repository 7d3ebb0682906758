#include <scottqueue/lockfree_queue.hpp>
#include <scottqueue/two_lock_queue.hpp>

#include <benchmark/benchmark.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace {

constexpr std::size_t kOpsPerThread = 1'000'000;

class CyclicBarrier {
   public:
    explicit CyclicBarrier(std::size_t parties) : parties_(parties) {}

    void arrive_and_wait() {
        std::unique_lock<std::mutex> lock(mu_);
        const std::size_t gen = generation_;
        if (++arrived_ == parties_) {
            arrived_ = 0;
            ++generation_;
            cv_.notify_all();
            return;
        }
        cv_.wait(lock, [&] { return generation_ != gen; });
    }

   private:
    std::size_t parties_;
    std::size_t arrived_{0};
    std::size_t generation_{0};
    std::mutex mu_;
    std::condition_variable cv_;
};

void add_rate_counters(benchmark::State& state, int producers, int consumers) {
    state.counters["producers"] =
        benchmark::Counter(static_cast<double>(producers), benchmark::Counter::kAvgThreads);
    state.counters["consumers"] =
        benchmark::Counter(static_cast<double>(consumers), benchmark::Counter::kAvgThreads);
    state.counters["Mops"] = benchmark::Counter(
        static_cast<double>(kOpsPerThread) * static_cast<double>(state.threads()) / 1e6,
        benchmark::Counter::kIsRate);
}

// Single thread: enqueue a batch, then dequeue it again.
template <class Queue>
void BM_EnqueueDequeueBatch(benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    Queue q;
    std::uint64_t out = 0;

    for (auto _ : state) {
        for (std::size_t i = 0; i < batch; ++i) {
            (void)q.enqueue(static_cast<std::uint64_t>(i));
        }
        for (std::size_t i = 0; i < batch; ++i) {
            (void)q.dequeue(out);
            benchmark::DoNotOptimize(out);
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) *
                            static_cast<std::int64_t>(batch) * 2);
}

// Half the threads produce kOpsPerThread values each, the other half consume the same amount.
template <class Queue>
void BM_ProducerConsumerPairs(benchmark::State& state) {
    using Value = std::uint64_t;

    const int threads = static_cast<int>(state.threads());
    const int producers = threads / 2;
    add_rate_counters(state, producers, threads - producers);

    struct Context {
        explicit Context(int parties)
            : q(std::make_unique<Queue>()),
              start(static_cast<std::size_t>(parties)),
              finish(static_cast<std::size_t>(parties)) {}

        std::unique_ptr<Queue> q;
        CyclicBarrier start;
        CyclicBarrier finish;
    };

    static std::atomic<Context*> g_ctx{nullptr};

    if (state.thread_index() == 0) {
        g_ctx.store(new Context(threads), std::memory_order_release);
    }

    Context* ctx = nullptr;
    while ((ctx = g_ctx.load(std::memory_order_acquire)) == nullptr) {
        std::this_thread::yield();
    }

    for (auto _ : state) {
        ctx->start.arrive_and_wait();

        if (state.thread_index() < producers) {
            const Value base = static_cast<Value>(state.thread_index()) << 32;
            for (std::size_t i = 0; i < kOpsPerThread; ++i) {
                (void)ctx->q->enqueue(base + i);
            }
        } else {
            std::size_t done = 0;
            Value out{};
            while (done < kOpsPerThread) {
                if (!ctx->q->dequeue(out)) {
                    continue;
                }
                benchmark::DoNotOptimize(out);
                ++done;
            }
        }

        ctx->finish.arrive_and_wait();
    }

    ctx->finish.arrive_and_wait();
    if (state.thread_index() == 0) {
        delete ctx;
        g_ctx.store(nullptr, std::memory_order_release);
    }
}

using TwoLock = scottqueue::TwoLockQueue<std::uint64_t>;
using LockFree = scottqueue::LockFreeQueue<std::uint64_t>;

}  // namespace

BENCHMARK_TEMPLATE(BM_EnqueueDequeueBatch, TwoLock)->Arg(64)->Arg(4096);
BENCHMARK_TEMPLATE(BM_EnqueueDequeueBatch, LockFree)->Arg(64)->Arg(4096);

BENCHMARK_TEMPLATE(BM_ProducerConsumerPairs, TwoLock)
    ->ThreadRange(2, 16)
    ->Iterations(1)
    ->UseRealTime();
BENCHMARK_TEMPLATE(BM_ProducerConsumerPairs, LockFree)
    ->ThreadRange(2, 16)
    ->Iterations(1)
    ->UseRealTime();
