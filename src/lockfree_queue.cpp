#include <scottqueue/lockfree_queue.hpp>

#include <cstdint>

namespace scottqueue {

template class LockFreeQueue<std::uint64_t>;
template class LockFreeQueue<std::uint32_t>;

}  // namespace scottqueue
