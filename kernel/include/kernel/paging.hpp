#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <libe/error.hpp>

constexpr std::size_t operator""_KiB(unsigned long long int x) {
    return 1024ULL * x;
}

constexpr std::size_t operator""_MiB(unsigned long long int x) {
    return 1024_KiB * x;
}

constexpr std::size_t operator""_GiB(unsigned long long int x) {
    return 1024_MiB * x;
}

struct PagingErrorCategory : elib::ErrorCategory {};
inline constexpr auto pagingErrorCategory = PagingErrorCategory{{"paging"}};

inline constexpr auto OutOfPhysicalMemory = elib::Error(-1, &pagingErrorCategory, "out of physical memory");
inline constexpr auto AlreadyMapped = elib::Error(-2, &pagingErrorCategory, "page already mapped");
inline constexpr auto NotMapped = elib::Error(-3, &pagingErrorCategory, "page not mapped");
inline constexpr auto HugePageConflict = elib::Error(-4, &pagingErrorCategory, "address covered by a huge page");
inline constexpr auto ReservedAddress = elib::Error(-5, &pagingErrorCategory, "address reserved for table access");
inline constexpr auto UnalignedAddress = elib::Error(-6, &pagingErrorCategory, "address not page aligned");
inline constexpr auto TooManyRegions = elib::Error(-7, &pagingErrorCategory, "too many memory ranges");

inline constexpr auto FrameSize = 4_KiB;

struct Block {
    std::uintptr_t startAddress;
    std::size_t size;

    /**
     * Align block such that both the start and end address are a multiple of alignment.
     *
     * Start address is rounded up, end address is rounded down.
     *
     * @param alignment Should be a power of two.
     * @returns An aligned block, possibly of size zero.
     */
    Block align(std::size_t alignment) const;

    // Grow the block outwards to multiples of alignment.
    Block cover(std::size_t alignment) const;

    std::uintptr_t endAddress() const;

    bool contains(std::uintptr_t address) const;

    bool overlaps(const Block& other) const;
};

class VirtualAddress {
public:
    constexpr VirtualAddress(std::uintptr_t address) :
        address(address) {}

    VirtualAddress(const void* ptr) :
        address(reinterpret_cast<std::uintptr_t>(ptr)) {}

    constexpr std::uint16_t indexLevel4() const {
        return (address >> 39) & 0x1FF;
    }

    constexpr std::uint16_t indexLevel3() const {
        return (address >> 30) & 0x1FF;
    }

    constexpr std::uint16_t indexLevel2() const {
        return (address >> 21) & 0x1FF;
    }

    constexpr std::uint16_t indexLevel1() const {
        return (address >> 12) & 0x1FF;
    }

    constexpr bool pageAligned() const {
        return (address & (FrameSize - 1)) == 0;
    }

    // Sign extend bit 47 into the upper 16 bits.
    static constexpr VirtualAddress canonical(std::uintptr_t address) {
        address &= 0x0000'FFFF'FFFF'FFFF;
        if (address & (std::uintptr_t(1) << 47)) {
            address |= 0xFFFF'0000'0000'0000;
        }
        return VirtualAddress(address);
    }

    template<class T = void>
    T* ptr() const {
        return reinterpret_cast<T*>(address);
    }

    constexpr operator std::uintptr_t() const {
        return address;
    }

private:
    std::uintptr_t address;
};

// Hands out physical frames from the available boot memory regions.
// Freed frames are kept on a reuse stack and handed out again most recently freed first.
//
// Contract: a frame must only be deallocated once and only after every mapping to it is
// gone. Nothing tracks the set of frames in use.
class FrameAllocator {
public:
    static constexpr auto MaxRegions = std::size_t(32);
    static constexpr auto MaxReservedRanges = std::size_t(8);

    /**
     * @param availableRegions Physical ranges usable as RAM. Unaligned boundaries are trimmed.
     * @param reservedRanges Ranges that must never be handed out (kernel image, low memory, ...).
     * @param reuseStorage Backing store of the reuse stack. Its size caps the number of
     *                     frames this allocator manages.
     * @returns TooManyRegions if either list does not fit.
     */
    static std::expected<FrameAllocator, elib::Error> make(
        std::span<const Block> availableRegions,
        std::span<const Block> reservedRanges,
        std::span<std::uintptr_t> reuseStorage
    );

    FrameAllocator(FrameAllocator&&) = default;

    FrameAllocator(const FrameAllocator&) = delete;

    FrameAllocator& operator=(const FrameAllocator&) = delete;

    std::expected<std::uintptr_t, elib::Error> allocate();

    void deallocate(std::uintptr_t physicalAddress);

    // Frames ever handed out from the regions (not counting reuse).
    std::size_t frameCount() const;

    std::size_t reusableFrameCount() const;

private:
    explicit FrameAllocator(std::span<std::uintptr_t> reuseStorage);

    std::optional<std::uintptr_t> nextFreshFrame();

    const Block* reservedRangeOverlapping(const Block& frame) const;

    std::array<Block, MaxRegions> regions;
    std::size_t regionCount;
    std::array<Block, MaxReservedRanges> reserved;
    std::size_t reservedCount;
    std::span<std::uintptr_t> reuseStack;
    std::size_t reuseCount;
    std::size_t currentRegion;
    std::uintptr_t cursor;
    std::size_t freshCount;
};

struct PageFlags {
    using Type = std::uint64_t;

    static constexpr auto Present = Type(1);
    static constexpr auto Writable = Type(1) << 1;
    static constexpr auto UserAccessible = Type(1) << 2;
    static constexpr auto HugePage = Type(1) << 7;
    static constexpr auto Global = Type(1) << 8;
    static constexpr auto NoExecute = Type(1) << 63;
    static constexpr auto All = Present | Writable | UserAccessible | HugePage | Global | NoExecute;
};

class TableEntryView {
public:
    explicit TableEntryView(std::uint64_t& entry);

    TableEntryView(const TableEntryView&) = default;

    bool present() const;

    PageFlags::Type flags() const;

    std::uint64_t physicalAddress() const;

    TableEntryView setFlags(PageFlags::Type flags);

    TableEntryView setPhysicalAddress(std::uint64_t address);

    void clear();

private:
    static constexpr std::uint64_t encodedPhysicalAddress(std::uint64_t address);

    std::uint64_t* entry;
};

// Both TableEntryView and TableView do not own their data.
class TableView {
public:
    static constexpr auto EntryCount = std::size_t(512);

    explicit TableView(std::uint64_t* ptr);

    TableEntryView at(std::uint16_t index) const;

    bool empty() const;

    void clear() const;

    VirtualAddress address() const;

private:
    std::uint64_t* ptr;
};

// Control over the translation hardware: TLB invalidation and the root table register.
class Mmu {
public:
    virtual void invalidate(VirtualAddress address) = 0;

    virtual void invalidateAll() = 0;

    virtual std::uintptr_t rootTable() = 0;

    virtual void loadRootTable(std::uintptr_t rootPhysicalAddress) = 0;
};

// How the page mapper reaches table nodes it only knows by physical address.
class TableWindow {
public:
    virtual TableView root() = 0;

    // The table referenced by the present entry parent[index].
    virtual TableView child(TableView parent, std::uint16_t index) = 0;

    // Redirect the window to the hierarchy rooted at a fresh frame, clearing the frame first.
    virtual std::optional<elib::Error> open(std::uintptr_t rootPhysicalAddress) = 0;

    // Return the window to the hierarchy loaded in the MMU.
    virtual void close() = 0;

    virtual bool reserves(VirtualAddress address) const = 0;
};

// Tables reachable at a fixed offset from their physical address.
class IdentityWindow : public TableWindow {
public:
    IdentityWindow(std::uintptr_t offset, Mmu& mmu);

    VirtualAddress translate(std::uintptr_t physicalAddress) const;

    TableView root() override;

    TableView child(TableView parent, std::uint16_t index) override;

    std::optional<elib::Error> open(std::uintptr_t rootPhysicalAddress) override;

    void close() override;

    bool reserves(VirtualAddress address) const override;

private:
    std::uintptr_t offset;
    Mmu* mmu;
    std::optional<std::uintptr_t> openedRoot;
};

// Tables reachable through root slot SelfIndex, which points back at the root itself.
// ScratchIndex is borrowed while a second hierarchy is being edited.
class RecursiveWindow : public TableWindow {
public:
    static constexpr auto SelfIndex = std::uint16_t(511);
    static constexpr auto ScratchIndex = std::uint16_t(510);

    explicit RecursiveWindow(Mmu& mmu);

    TableView root() override;

    TableView child(TableView parent, std::uint16_t index) override;

    std::optional<elib::Error> open(std::uintptr_t rootPhysicalAddress) override;

    void close() override;

    bool reserves(VirtualAddress address) const override;

private:
    Mmu* mmu;
    std::uintptr_t activeRoot;
};

enum class UnmapMode {
    KeepFrame,
    ReleaseFrame
};

// An identity mapped range of the running kernel and the permissions it ends up with.
struct KernelSection {
    Block range;
    PageFlags::Type flags;
};

struct KernelLayout {
    std::span<const KernelSection> sections;
    VirtualAddress stackGuard;
};

class PageMapper {
public:
    PageMapper(TableWindow& window, FrameAllocator& frameAllocator, Mmu& mmu);

    PageMapper(const PageMapper&) = delete;

    PageMapper& operator=(const PageMapper&) = delete;

    /**
     * Map a 4 KiB page, creating missing intermediate tables.
     *
     * @param overwrite Replace an existing mapping instead of failing with AlreadyMapped.
     */
    std::optional<elib::Error> map(VirtualAddress page, std::uintptr_t frame, PageFlags::Type flags, bool overwrite = false);

    std::optional<elib::Error> allocateAndMap(VirtualAddress page, PageFlags::Type flags);

    // Returns the frame that backed the page. Tables left empty are reclaimed.
    std::expected<std::uintptr_t, elib::Error> unmap(VirtualAddress page, UnmapMode mode = UnmapMode::KeepFrame);

    std::optional<std::uintptr_t> translate(VirtualAddress address);

    std::optional<PageFlags::Type> flags(VirtualAddress page);

    /**
     * Back size bytes above guard with fresh frames, writable and not executable.
     * The guard page itself must be unmapped and stays so, an overflow faults there.
     *
     * @returns The stack range. Nothing stays mapped on failure.
     */
    std::expected<Block, elib::Error> mapGuardedStack(VirtualAddress guard, std::size_t size);

    /**
     * Build a new hierarchy holding the kernel sections with their final permissions,
     * leave the stack guard page unmapped and switch the MMU to it.
     *
     * @returns Physical address of the new root table.
     */
    std::expected<std::uintptr_t, elib::Error> applyKernelLayout(const KernelLayout& layout);

private:
    struct Link {
        TableView parent;
        std::uint16_t index;
    };

    std::expected<TableView, elib::Error> ensureTable(TableView parent, std::uint16_t index);

    void reclaimEmptyTables(VirtualAddress page);

    TableWindow* window;
    FrameAllocator* frameAllocator;
    Mmu* mmu;
};
