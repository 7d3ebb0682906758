#pragma once

#include <scottqueue/node.hpp>

#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace scottqueue::detail {

// Allocates and constructs Node<T> through the user allocator rebound to the node type.
// Construction and allocation are one step: if the node constructor throws, the raw storage is
// released before the exception propagates.
template <class T, class Allocator>
class NodeAllocator {
   public:
    using node_type = Node<T>;
    using allocator_type =
        typename std::allocator_traits<Allocator>::template rebind_alloc<node_type>;
    using traits = std::allocator_traits<allocator_type>;

    static_assert(std::is_same<typename traits::pointer, node_type*>::value,
                  "node allocator must use raw pointers");

    explicit NodeAllocator(const Allocator& alloc) : alloc_(alloc) {}

    template <class... Args>
    node_type* create(Args&&... args) {
        node_type* node = traits::allocate(alloc_, 1);
        try {
            traits::construct(alloc_, node, std::forward<Args>(args)...);
        } catch (...) {
            traits::deallocate(alloc_, node, 1);
            throw;
        }
        return node;
    }

    // nullptr on std::bad_alloc; other exceptions propagate.
    template <class... Args>
    node_type* try_create(Args&&... args) {
        try {
            return create(std::forward<Args>(args)...);
        } catch (const std::bad_alloc&) {
            return nullptr;
        }
    }

    void destroy(node_type* node) noexcept {
        if (node == nullptr) {
            return;
        }
        traits::destroy(alloc_, node);
        traits::deallocate(alloc_, node, 1);
    }

    // Frees `first` and every node reachable through `next`.
    void destroy_chain(node_type* first) noexcept {
        node_type* cur = first;
        while (cur != nullptr) {
            node_type* next = cur->next.load(std::memory_order_relaxed);
            destroy(cur);
            cur = next;
        }
    }

   private:
    allocator_type alloc_;
};

}  // namespace scottqueue::detail
