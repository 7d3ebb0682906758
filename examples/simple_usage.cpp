#include <scottqueue/scottqueue.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

int main() {
    std::cout << "scottqueue examples - simple usage (single-thread)\n\n";

    // -----------------------------------------------------------------------------
    // 1) LockFreeQueue: non-blocking, dequeued nodes reclaimed through EBR
    // -----------------------------------------------------------------------------
    {
        scottqueue::LockFreeQueue<std::uint64_t> q;

        std::cout << "[LockFreeQueue] enqueue 1..5\n";
        for (std::uint64_t v = 1; v <= 5; ++v) {
            if (!q.enqueue(v)) {
                std::cerr << "ERROR: [LockFreeQueue] enqueue failed for value " << v << "\n";
                return 1;
            }
        }

        std::cout << "[LockFreeQueue] dequeue until empty:\n";
        while (auto v = q.try_dequeue()) {
            std::cout << "  got " << *v << "\n";
        }

        // Old sentinels wait for a grace period before they are freed.
        std::cout << "[LockFreeQueue] retired nodes pending: " << q.reclaimer().pending_count()
                  << "\n";
        for (int i = 0; i < 3; ++i) {
            (void)q.reclaimer().try_reclaim();
        }
        std::cout << "[LockFreeQueue] after reclamation: " << q.reclaimer().pending_count()
                  << " pending, " << q.reclaimer().reclaimed_count() << " freed\n\n";
    }

    // -----------------------------------------------------------------------------
    // 2) TwoLockQueue: separate head and tail locks, move-only values
    // -----------------------------------------------------------------------------
    {
        scottqueue::TwoLockQueue<std::unique_ptr<std::string>> q;

        std::cout << "[TwoLockQueue] enqueue three owned strings\n";
        for (const char* word : {"alpha", "beta", "gamma"}) {
            if (!q.enqueue(std::make_unique<std::string>(word))) {
                std::cerr << "ERROR: [TwoLockQueue] enqueue failed\n";
                return 1;
            }
        }

        std::cout << "[TwoLockQueue] dequeue until empty (bool):\n";
        std::unique_ptr<std::string> out;
        while (q.dequeue(out)) {
            std::cout << "  got " << *out << "\n";
        }
        std::cout << "\n";
    }

    // -----------------------------------------------------------------------------
    // 3) Building from a range and draining into a container
    // -----------------------------------------------------------------------------
    {
        const std::vector<int> input{10, 20, 30, 40};
        scottqueue::TwoLockQueue<int> q(input.begin(), input.end());
        (void)q.enqueue(50);

        std::vector<int> output;
        const std::size_t n = q.drain(std::back_inserter(output));
        std::cout << "[TwoLockQueue] drained " << n << " values:";
        for (int v : output) {
            std::cout << " " << v;
        }
        std::cout << "\n\n";
    }

    std::cout << "Done.\n";
    return 0;
}
