#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <libe/allocator.hpp>
#include <libe/error.hpp>
#include <libe/intrusive/slist.hpp>
#include "paging.hpp"

struct HeapErrorCategory : elib::ErrorCategory {};
inline constexpr auto heapErrorCategory = HeapErrorCategory{{"heap"}};

inline constexpr auto HeapExhausted = elib::Error(-1, &heapErrorCategory, "heap exhausted");

// First-fit allocator over a reserved virtual range that is backed page by page on demand.
// Free blocks live inside the heap memory, sorted by address and coalesced on release.
class KernelHeap : public elib::Allocator {
public:
    static constexpr auto BlockGranularity = std::size_t(16);

    static std::expected<KernelHeap, elib::Error>
    make(PageMapper& pageMapper, VirtualAddress start, std::size_t reservedSize, std::size_t initialSize);

    KernelHeap(PageMapper& pageMapper, VirtualAddress start, std::size_t reservedSize);

    KernelHeap(KernelHeap&& other);

    KernelHeap(const KernelHeap&) = delete;

    KernelHeap& operator=(const KernelHeap&) = delete;

    std::expected<void*, elib::Error> tryAllocate(std::size_t bytes, std::size_t alignment);

    void release(void* p, std::size_t bytes);

    // Back at least `bytes` more of the reserved range with frames.
    std::optional<elib::Error> grow(std::size_t bytes);

    // Bytes on the free list plus the part of the range not mapped yet.
    std::size_t freeBytes() const;

    std::size_t mappedBytes() const;

    std::size_t freeBlockCount() const;

private:
    struct FreeBlock : elib::intrusive::SListNode<FreeBlock> {
        std::size_t size;

        std::uintptr_t startAddress() const {
            return reinterpret_cast<std::uintptr_t>(this);
        }

        std::uintptr_t endAddress() const {
            return startAddress() + size;
        }
    };

    static_assert(sizeof(FreeBlock) <= BlockGranularity);

    static std::size_t blockSize(std::size_t bytes);

    void* takeFirstFit(std::size_t size, std::size_t alignment);

    std::size_t growthFor(std::size_t size, std::size_t alignment) const;

    void* do_allocate(std::size_t bytes, std::size_t alignment) final;

    void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) final;

    bool do_owns(void* p) const final;

    PageMapper*                         pageMapper;
    std::uintptr_t                      start;
    std::size_t                         reservedSize;
    std::size_t                         mapped;
    elib::intrusive::SList<FreeBlock>   freeBlocks;
};
