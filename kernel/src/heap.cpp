#include "kernel/heap.hpp"
#include <algorithm>

std::expected<KernelHeap, elib::Error>
KernelHeap::make(PageMapper& pageMapper, VirtualAddress start, std::size_t reservedSize, std::size_t initialSize)
{
    if (!start.pageAligned()) {
        return std::unexpected(UnalignedAddress);
    }

    auto heap = KernelHeap(pageMapper, start, reservedSize);
    if (auto error = heap.grow(initialSize)) {
        return std::unexpected(*error);
    }
    return heap;
}

KernelHeap::KernelHeap(PageMapper& pageMapper, VirtualAddress start, std::size_t reservedSize) :
    pageMapper(&pageMapper), start(start), reservedSize(reservedSize & ~(FrameSize - 1)), mapped(0)
{}

KernelHeap::KernelHeap(KernelHeap&& other) :
    pageMapper(other.pageMapper),
    start(other.start),
    reservedSize(other.reservedSize),
    mapped(other.mapped),
    freeBlocks(std::move(other.freeBlocks))
{
    other.reservedSize = 0;
    other.mapped       = 0;
}

std::expected<void*, elib::Error> KernelHeap::tryAllocate(std::size_t bytes, std::size_t alignment)
{
    if (alignment == 0 || (alignment & (alignment - 1)) != 0) {
        return std::unexpected(elib::InvalidArgument);
    }
    if (bytes > reservedSize) {
        return std::unexpected(HeapExhausted);
    }

    auto size = blockSize(bytes);
    alignment = std::max(alignment, BlockGranularity);
    while (true) {
        if (auto p = takeFirstFit(size, alignment)) {
            return p;
        }
        if (mapped == reservedSize) {
            return std::unexpected(HeapExhausted);
        }
        if (grow(growthFor(size, alignment))) {
            // Physical memory ran out; whatever got mapped may still be enough.
            if (auto p = takeFirstFit(size, alignment)) {
                return p;
            }
            return std::unexpected(HeapExhausted);
        }
    }
}

void KernelHeap::release(void* p, std::size_t bytes)
{
    if (p == nullptr) {
        return;
    }

    auto address = reinterpret_cast<std::uintptr_t>(p);
    auto size    = blockSize(bytes);

    FreeBlock* previous = nullptr;
    for (auto block = freeBlocks.front(); block != nullptr && block->startAddress() < address; block = block->next) {
        previous = block;
    }

    auto node  = ::new (p) FreeBlock{};
    node->size = size;
    freeBlocks.insertAfter(previous, *node);

    auto next = node->next;
    if (next != nullptr && node->endAddress() == next->startAddress()) {
        node->size += next->size;
        freeBlocks.eraseAfter(node);
    }
    if (previous != nullptr && previous->endAddress() == node->startAddress()) {
        previous->size += node->size;
        freeBlocks.eraseAfter(previous);
    }
}

std::optional<elib::Error> KernelHeap::grow(std::size_t bytes)
{
    auto pages     = (bytes + FrameSize - 1) / FrameSize;
    auto remaining = (reservedSize - mapped) / FrameSize;
    if (pages == 0) {
        return {};
    }
    if (remaining == 0) {
        return HeapExhausted;
    }
    pages = std::min(pages, remaining);

    constexpr auto flags = PageFlags::Present | PageFlags::Writable | PageFlags::NoExecute;
    auto grownStart      = start + mapped;
    auto grown           = std::size_t(0);
    auto error           = std::optional<elib::Error>();
    for (auto page = std::size_t(0); page < pages; page++) {
        error = pageMapper->allocateAndMap(grownStart + grown, flags);
        if (error) {
            break;
        }
        grown += FrameSize;
    }

    mapped += grown;
    if (grown > 0) {
        release(reinterpret_cast<void*>(grownStart), grown);
    }
    return error;
}

std::size_t KernelHeap::freeBytes() const
{
    auto total = reservedSize - mapped;
    for (const auto& block : freeBlocks) {
        total += block.size;
    }
    return total;
}

std::size_t KernelHeap::mappedBytes() const
{
    return mapped;
}

std::size_t KernelHeap::freeBlockCount() const
{
    return freeBlocks.size();
}

std::size_t KernelHeap::blockSize(std::size_t bytes)
{
    bytes = std::max(bytes, BlockGranularity);
    return (bytes + BlockGranularity - 1) & ~(BlockGranularity - 1);
}

void* KernelHeap::takeFirstFit(std::size_t size, std::size_t alignment)
{
    FreeBlock* previous = nullptr;
    for (auto block = freeBlocks.front(); block != nullptr; previous = block, block = block->next) {
        auto blockStart = block->startAddress();
        auto blockEnd   = block->endAddress();
        // Blocks are granularity aligned, so a non-empty front gap is at least one granule.
        auto aligned = (blockStart + alignment - 1) & ~(alignment - 1);
        if (aligned + size > blockEnd) {
            continue;
        }

        freeBlocks.eraseAfter(previous);
        if (aligned > blockStart) {
            auto front  = ::new (reinterpret_cast<void*>(blockStart)) FreeBlock{};
            front->size = aligned - blockStart;
            freeBlocks.insertAfter(previous, *front);
            previous = front;
        }
        if (blockEnd > aligned + size) {
            auto back  = ::new (reinterpret_cast<void*>(aligned + size)) FreeBlock{};
            back->size = blockEnd - (aligned + size);
            freeBlocks.insertAfter(previous, *back);
        }
        return reinterpret_cast<void*>(aligned);
    }

    return nullptr;
}

std::size_t KernelHeap::growthFor(std::size_t size, std::size_t alignment) const
{
    auto needed = size + alignment - BlockGranularity;

    // A free block at the end of the mapped range merges with the grown pages.
    const FreeBlock* last = nullptr;
    for (const auto& block : freeBlocks) {
        last = &block;
    }
    if (last != nullptr && last->endAddress() == start + mapped) {
        needed = needed > last->size ? needed - last->size : FrameSize;
    }
    return needed;
}

void* KernelHeap::do_allocate(std::size_t bytes, std::size_t alignment)
{
    auto p = tryAllocate(bytes, alignment);
    if (!p) {
        return nullptr;
    }
    return *p;
}

void KernelHeap::do_deallocate(void* p, std::size_t bytes, std::size_t)
{
    release(p, bytes);
}

bool KernelHeap::do_owns(void* p) const
{
    auto address = reinterpret_cast<std::uintptr_t>(p);
    return address >= start && address < start + mapped;
}
