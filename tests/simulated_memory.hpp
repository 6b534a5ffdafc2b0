#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <vector>
#include <kernel/paging.hpp>

// Host buffer standing in for a range of physical memory.
class SimulatedMemory {
public:
    SimulatedMemory(std::uintptr_t physicalBase, std::size_t frames) :
        physicalBase(physicalBase),
        size(frames * FrameSize),
        storage(static_cast<std::byte*>(std::aligned_alloc(FrameSize, frames * FrameSize)), &std::free)
    {
        std::memset(storage.get(), 0, size);
    }

    // Distance from a physical address to the host address holding it.
    std::uintptr_t offset() const {
        return reinterpret_cast<std::uintptr_t>(storage.get()) - physicalBase;
    }

    template<typename T>
    T* at(std::uintptr_t physicalAddress) const {
        return reinterpret_cast<T*>(physicalAddress + offset());
    }

private:
    std::uintptr_t                               physicalBase;
    std::size_t                                  size;
    std::unique_ptr<std::byte, decltype(&std::free)> storage;
};

// Records what the page mapper asks of the hardware.
class FakeMmu : public Mmu {
public:
    explicit FakeMmu(std::uintptr_t root) : root(root) {}

    void invalidate(VirtualAddress address) override {
        invalidated.push_back(address);
    }

    void invalidateAll() override {
        fullFlushes++;
    }

    std::uintptr_t rootTable() override {
        return root;
    }

    void loadRootTable(std::uintptr_t rootPhysicalAddress) override {
        root = rootPhysicalAddress;
        loads++;
    }

    bool wasInvalidated(std::uintptr_t address) const {
        return std::find(invalidated.begin(), invalidated.end(), address) != invalidated.end();
    }

    std::vector<std::uintptr_t> invalidated;
    std::size_t                 fullFlushes = 0;
    std::size_t                 loads       = 0;
    std::uintptr_t              root;
};

// A page mapper over simulated memory. The first frame holds the root table,
// the remaining frames feed the frame allocator.
struct PagingFixture {
    static constexpr auto PhysicalBase = std::uintptr_t(0x10'0000);
    static constexpr auto FrameCount   = std::size_t(64);

    explicit PagingFixture(std::size_t frameLimit = FrameCount - 1) :
        memory(PhysicalBase, FrameCount),
        mmu(PhysicalBase),
        window(memory.offset(), mmu),
        available{Block{PhysicalBase + FrameSize, (FrameCount - 1) * FrameSize}},
        reuseStorage(frameLimit),
        frames(*FrameAllocator::make(available, {}, reuseStorage)),
        mapper(window, frames, mmu)
    {}

    TableView rootTable() {
        return window.root();
    }

    SimulatedMemory             memory;
    FakeMmu                     mmu;
    IdentityWindow              window;
    std::array<Block, 1>        available;
    std::vector<std::uintptr_t> reuseStorage;
    FrameAllocator              frames;
    PageMapper                  mapper;
};
