#include <scottqueue/two_lock_queue.hpp>

#include <cstdint>

namespace scottqueue {

template class TwoLockQueue<std::uint64_t>;
template class TwoLockQueue<std::uint32_t>;

}  // namespace scottqueue
