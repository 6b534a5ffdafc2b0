#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>
#include "error.hpp"

namespace elib {
    struct AllocatorErrorCategory : ErrorCategory {};
    inline constexpr auto allocatorErrorCategory = AllocatorErrorCategory{{"allocator"}};

    inline constexpr auto OutOfMemoryError = Error{-1, &allocatorErrorCategory, "out of memory"};

    // Allocation interface usable without exceptions: failure is a nullptr result.
    // Implementations override the do_ hooks, callers only see the public wrappers.
    class Allocator {
    public:
        [[nodiscard]] void* allocate(std::size_t bytes, std::size_t alignment = alignof(std::max_align_t));

        // Releasing nullptr does nothing.
        void deallocate(void* p, std::size_t bytes, std::size_t alignment = alignof(std::max_align_t));

        // Whether p lies in memory this allocator hands out.
        bool owns(void* p) const;

    private:
        virtual void* do_allocate(std::size_t bytes, std::size_t alignment) = 0;

        virtual void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) = 0;

        virtual bool do_owns(void* p) const = 0;
    };

    template <typename T>
    concept IsAllocator = std::is_base_of_v<Allocator, T>;

    // Allocate storage for a T and construct it in place. Returns nullptr if the allocator is out of memory.
    template <typename T, IsAllocator Alloc, class... Args>
    T* constructRaw(Alloc& allocator, Args&&... args) {
        auto storage = allocator.allocate(sizeof(T), alignof(T));
        if (storage == nullptr) {
            return nullptr;
        }
        return ::new (storage) T(std::forward<Args>(args)...);
    }
}
