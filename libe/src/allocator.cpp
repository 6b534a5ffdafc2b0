#include <libe/allocator.hpp>

namespace elib {

    void* Allocator::allocate(std::size_t bytes, std::size_t alignment)
    {
        return do_allocate(bytes, alignment);
    }

    void Allocator::deallocate(void* p, std::size_t bytes, std::size_t alignment)
    {
        if (p == nullptr) {
            return;
        }
        do_deallocate(p, bytes, alignment);
    }

    bool Allocator::owns(void* p) const
    {
        return do_owns(p);
    }

} // namespace elib
