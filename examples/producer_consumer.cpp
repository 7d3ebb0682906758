#include <scottqueue/lockfree_queue.hpp>
#include <scottqueue/two_lock_queue.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Options {
    std::size_t producers = 4;
    std::size_t consumers = 4;
    std::size_t items_per_producer = 200000;
    std::string queue = "lockfree";
};

// Work item handed from producers to consumers. A null payload tells a consumer to stop.
struct Job {
    std::uint64_t id;
    std::uint64_t payload;
};
using JobPtr = std::unique_ptr<Job>;

void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  --producers=<N>           Producer threads (default: 4)\n"
              << "  --consumers=<N>           Consumer threads (default: 4)\n"
              << "  --items-per-producer=<N>  Items per producer (default: 200000)\n"
              << "  --queue=<lockfree|twolock> Queue variant (default: lockfree)\n"
              << "  --help                    Show help\n";
}

bool parse_size(const std::string& s, std::size_t& out) {
    unsigned long long v = 0;
    const char* end = s.data() + s.size();
    const auto res = std::from_chars(s.data(), end, v, 10);
    if (res.ec != std::errc() || res.ptr != end) {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

bool parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            print_help(argv[0]);
            return false;
        }
        const auto eq = a.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
        const std::string key = a.substr(0, eq);
        const std::string val = a.substr(eq + 1);

        bool ok = true;
        if (key == "--producers") {
            ok = parse_size(val, opt.producers);
        } else if (key == "--consumers") {
            ok = parse_size(val, opt.consumers);
        } else if (key == "--items-per-producer") {
            ok = parse_size(val, opt.items_per_producer);
        } else if (key == "--queue") {
            opt.queue = val;
            ok = (val == "lockfree" || val == "twolock");
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
        if (!ok) {
            std::cerr << "Invalid value for " << key << ": " << val << "\n";
            return false;
        }
    }

    if (opt.producers == 0 || opt.consumers == 0 || opt.items_per_producer == 0) {
        std::cerr << "Invalid: producers/consumers/items-per-producer must be > 0\n";
        return false;
    }
    return true;
}

template <class Queue>
void enqueue_or_retry(Queue& q, JobPtr job) {
    while (!q.enqueue(std::move(job))) {
        // Allocation failure leaves `job` untouched; back off and retry.
        std::this_thread::yield();
    }
}

template <class Queue>
int run(const Options& opt) {
    const std::size_t total_items = opt.producers * opt.items_per_producer;
    Queue q;

    std::atomic<std::size_t> ready{0};
    std::atomic<bool> start{false};
    std::atomic<std::size_t> consumed{0};
    std::atomic<std::uint64_t> checksum{0};

    std::vector<std::thread> producer_threads;
    std::vector<std::thread> consumer_threads;
    producer_threads.reserve(opt.producers);
    consumer_threads.reserve(opt.consumers);

    auto wait_for_start = [&]() {
        ready.fetch_add(1, std::memory_order_release);
        while (!start.load(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
    };

    for (std::size_t c = 0; c < opt.consumers; ++c) {
        consumer_threads.emplace_back([&] {
            wait_for_start();

            std::uint64_t local_checksum = 0;
            std::size_t local_consumed = 0;
            JobPtr job;
            for (;;) {
                if (!q.dequeue(job)) {
                    std::this_thread::yield();
                    continue;
                }
                if (!job) {
                    break;
                }
                local_checksum += job->payload;
                ++local_consumed;
            }

            consumed.fetch_add(local_consumed, std::memory_order_relaxed);
            checksum.fetch_add(local_checksum, std::memory_order_relaxed);
        });
    }

    for (std::size_t p = 0; p < opt.producers; ++p) {
        producer_threads.emplace_back([&, p] {
            wait_for_start();

            const std::uint64_t base_id = static_cast<std::uint64_t>(p * opt.items_per_producer);
            for (std::size_t i = 0; i < opt.items_per_producer; ++i) {
                const std::uint64_t id = base_id + i;
                enqueue_or_retry(q, std::make_unique<Job>(Job{id, id * 3 + 1}));
            }
        });
    }

    while (ready.load(std::memory_order_acquire) != opt.producers + opt.consumers) {
        std::this_thread::yield();
    }

    const auto t0 = std::chrono::steady_clock::now();
    start.store(true, std::memory_order_release);

    for (auto& t : producer_threads) {
        t.join();
    }
    // Stop markers go in after every real job, so consumers see them last.
    for (std::size_t i = 0; i < opt.consumers; ++i) {
        enqueue_or_retry(q, JobPtr());
    }
    for (auto& t : consumer_threads) {
        t.join();
    }
    const auto t1 = std::chrono::steady_clock::now();
    const std::chrono::duration<double> dt = t1 - t0;

    std::uint64_t expected = 0;
    for (std::uint64_t id = 0; id < total_items; ++id) {
        expected += id * 3 + 1;
    }

    const std::size_t consumed_n = consumed.load(std::memory_order_relaxed);
    const std::uint64_t checksum_n = checksum.load(std::memory_order_relaxed);
    std::cout << "Consumed: " << consumed_n << "\n"
              << "Elapsed: " << dt.count() << " s\n"
              << "Throughput: " << (static_cast<double>(consumed_n) / dt.count() / 1e6)
              << " Mitems/s\n"
              << "Checksum: " << checksum_n << " (expected " << expected << ")\n";

    if (consumed_n != total_items || checksum_n != expected || !q.empty()) {
        std::cerr << "ERROR: jobs lost or duplicated\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        return 0;
    }

    std::cout << "scottqueue examples - producer/consumer (MPMC, move-only jobs)\n"
              << "Queue: " << opt.queue << "\n"
              << "Producers: " << opt.producers << "\n"
              << "Consumers: " << opt.consumers << "\n"
              << "Items per producer: " << opt.items_per_producer << "\n\n";

    if (opt.queue == "twolock") {
        return run<scottqueue::TwoLockQueue<JobPtr>>(opt);
    }
    return run<scottqueue::LockFreeQueue<JobPtr>>(opt);
}
