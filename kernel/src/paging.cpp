#include "kernel/paging.hpp"
#include <algorithm>

Block Block::align(std::size_t alignment) const
{
    auto alignmentMask       = alignment - 1;
    auto alignedStartAddress = (startAddress + alignmentMask) & ~alignmentMask;
    auto alignedEndAddress   = endAddress() & ~alignmentMask;
    if (alignedEndAddress <= alignedStartAddress) {
        return {alignedStartAddress, 0};
    }
    return {alignedStartAddress, alignedEndAddress - alignedStartAddress};
}

Block Block::cover(std::size_t alignment) const
{
    auto alignmentMask       = alignment - 1;
    auto alignedStartAddress = startAddress & ~alignmentMask;
    auto alignedEndAddress   = (endAddress() + alignmentMask) & ~alignmentMask;
    return {alignedStartAddress, alignedEndAddress - alignedStartAddress};
}

std::uintptr_t Block::endAddress() const
{
    return startAddress + size;
}

bool Block::contains(std::uintptr_t address) const
{
    return address >= startAddress && address < endAddress();
}

bool Block::overlaps(const Block& other) const
{
    return startAddress < other.endAddress() && other.startAddress < endAddress();
}

FrameAllocator::FrameAllocator(std::span<std::uintptr_t> reuseStorage) :
    regions{},
    regionCount(0),
    reserved{},
    reservedCount(0),
    reuseStack(reuseStorage),
    reuseCount(0),
    currentRegion(0),
    cursor(0),
    freshCount(0)
{}

std::expected<FrameAllocator, elib::Error> FrameAllocator::make(
    std::span<const Block> availableRegions, std::span<const Block> reservedRanges, std::span<std::uintptr_t> reuseStorage
)
{
    auto allocator = FrameAllocator(reuseStorage);

    for (const auto& region : availableRegions) {
        auto alignedRegion = region.align(FrameSize);
        if (alignedRegion.size == 0) {
            continue;
        }
        if (allocator.regionCount == MaxRegions) {
            return std::unexpected(TooManyRegions);
        }
        allocator.regions[allocator.regionCount++] = alignedRegion;
    }
    std::sort(allocator.regions.begin(), allocator.regions.begin() + allocator.regionCount, [](const auto& a, const auto& b) {
        return a.startAddress < b.startAddress;
    });

    // A dropped reserved range would make its frames allocatable.
    for (const auto& range : reservedRanges) {
        if (range.size == 0) {
            continue;
        }
        if (allocator.reservedCount == MaxReservedRanges) {
            return std::unexpected(TooManyRegions);
        }
        allocator.reserved[allocator.reservedCount++] = range.cover(FrameSize);
    }

    return allocator;
}

std::expected<std::uintptr_t, elib::Error> FrameAllocator::allocate()
{
    if (reuseCount > 0) {
        return reuseStack[--reuseCount];
    }

    auto frame = nextFreshFrame();
    if (!frame) {
        return std::unexpected(OutOfPhysicalMemory);
    }
    return *frame;
}

void FrameAllocator::deallocate(std::uintptr_t physicalAddress)
{
    // Never more frames are handed out than the stack holds, so only a double free can fill it.
    if (reuseCount == reuseStack.size()) {
        return;
    }
    reuseStack[reuseCount++] = physicalAddress;
}

std::size_t FrameAllocator::frameCount() const
{
    return freshCount;
}

std::size_t FrameAllocator::reusableFrameCount() const
{
    return reuseCount;
}

std::optional<std::uintptr_t> FrameAllocator::nextFreshFrame()
{
    if (freshCount == reuseStack.size()) {
        return {};
    }

    while (currentRegion < regionCount) {
        const auto& region = regions[currentRegion];
        cursor = std::max(cursor, region.startAddress);
        if (cursor >= region.endAddress()) {
            currentRegion++;
            continue;
        }

        auto frame = Block{cursor, FrameSize};
        if (auto range = reservedRangeOverlapping(frame)) {
            cursor = range->endAddress();
            continue;
        }

        cursor += FrameSize;
        freshCount++;
        return frame.startAddress;
    }

    return {};
}

const Block* FrameAllocator::reservedRangeOverlapping(const Block& frame) const
{
    for (auto i = std::size_t(0); i < reservedCount; i++) {
        if (reserved[i].overlaps(frame)) {
            return &reserved[i];
        }
    }
    return nullptr;
}

TableEntryView::TableEntryView(std::uint64_t& entry) : entry(&entry) {}

bool TableEntryView::present() const
{
    return *entry & PageFlags::Present;
}

std::uint64_t TableEntryView::flags() const
{
    return *entry & PageFlags::All;
}

std::uint64_t TableEntryView::physicalAddress() const
{
    return *entry & encodedPhysicalAddress(-1);
}

TableEntryView TableEntryView::setFlags(PageFlags::Type flags)
{
    *entry = (*entry & ~PageFlags::All) | (flags & PageFlags::All);
    return *this;
}

TableEntryView TableEntryView::setPhysicalAddress(std::uint64_t address)
{
    *entry = (*entry & ~encodedPhysicalAddress(-1)) | encodedPhysicalAddress(address);
    return *this;
}

void TableEntryView::clear()
{
    *entry = 0;
}

constexpr std::uint64_t TableEntryView::encodedPhysicalAddress(std::uint64_t address)
{
    return address & std::uint64_t(0xF'FFFF'FFFF'F000);
}

TableView::TableView(std::uint64_t* ptr) : ptr(ptr) {}

TableEntryView TableView::at(std::uint16_t index) const
{
    return TableEntryView(ptr[index]);
}

bool TableView::empty() const
{
    return std::none_of(ptr, ptr + EntryCount, [](auto entry) { return entry & PageFlags::Present; });
}

void TableView::clear() const
{
    std::fill(ptr, ptr + EntryCount, std::uint64_t(0));
}

VirtualAddress TableView::address() const
{
    return VirtualAddress(ptr);
}

IdentityWindow::IdentityWindow(std::uintptr_t offset, Mmu& mmu) : offset(offset), mmu(&mmu) {}

VirtualAddress IdentityWindow::translate(std::uintptr_t physicalAddress) const
{
    return physicalAddress + offset;
}

TableView IdentityWindow::root()
{
    auto rootPhysicalAddress = openedRoot ? *openedRoot : mmu->rootTable();
    return TableView(translate(rootPhysicalAddress).ptr<std::uint64_t>());
}

TableView IdentityWindow::child(TableView parent, std::uint16_t index)
{
    return TableView(translate(parent.at(index).physicalAddress()).ptr<std::uint64_t>());
}

std::optional<elib::Error> IdentityWindow::open(std::uintptr_t rootPhysicalAddress)
{
    openedRoot = rootPhysicalAddress;
    root().clear();
    return {};
}

void IdentityWindow::close()
{
    openedRoot.reset();
}

bool IdentityWindow::reserves(VirtualAddress) const
{
    return false;
}

RecursiveWindow::RecursiveWindow(Mmu& mmu) : mmu(&mmu), activeRoot(0) {}

TableView RecursiveWindow::root()
{
    constexpr auto rootAddress = VirtualAddress::canonical(
        std::uintptr_t(SelfIndex) << 39 | std::uintptr_t(SelfIndex) << 30 | std::uintptr_t(SelfIndex) << 21 |
        std::uintptr_t(SelfIndex) << 12
    );
    return TableView(rootAddress.ptr<std::uint64_t>());
}

TableView RecursiveWindow::child(TableView parent, std::uint16_t index)
{
    // Walking one more level through the self slot shifts the indices left by one level.
    auto address = (std::uintptr_t(parent.address()) << 9) | (std::uintptr_t(index) << 12);
    return TableView(VirtualAddress::canonical(address).ptr<std::uint64_t>());
}

std::optional<elib::Error> RecursiveWindow::open(std::uintptr_t rootPhysicalAddress)
{
    constexpr auto tableFlags = PageFlags::Present | PageFlags::Writable | PageFlags::NoExecute;

    auto active = root();
    activeRoot  = active.at(SelfIndex).physicalAddress();

    // Reach the new root as a child of the active one to initialize it.
    active.at(ScratchIndex).setPhysicalAddress(rootPhysicalAddress).setFlags(tableFlags);
    auto fresh = child(active, ScratchIndex);
    mmu->invalidate(fresh.address());
    fresh.clear();
    fresh.at(SelfIndex).setPhysicalAddress(rootPhysicalAddress).setFlags(tableFlags);
    // Way back to the active root while the window shows the new hierarchy.
    fresh.at(ScratchIndex).setPhysicalAddress(activeRoot).setFlags(tableFlags);

    active.at(SelfIndex).setPhysicalAddress(rootPhysicalAddress);
    mmu->invalidateAll();
    return {};
}

void RecursiveWindow::close()
{
    auto previous = child(root(), ScratchIndex);
    previous.at(SelfIndex).setPhysicalAddress(activeRoot);
    mmu->invalidateAll();

    // The active root still links the edited root through the scratch slot.
    auto active = root();
    auto edited = child(active, ScratchIndex);
    edited.at(ScratchIndex).clear();
    active.at(ScratchIndex).clear();
    mmu->invalidateAll();
}

bool RecursiveWindow::reserves(VirtualAddress address) const
{
    return address.indexLevel4() == SelfIndex || address.indexLevel4() == ScratchIndex;
}

PageMapper::PageMapper(TableWindow& window, FrameAllocator& frameAllocator, Mmu& mmu) :
    window(&window), frameAllocator(&frameAllocator), mmu(&mmu)
{}

std::optional<elib::Error>
PageMapper::map(VirtualAddress page, std::uintptr_t frame, PageFlags::Type flags, bool overwrite)
{
    if (!page.pageAligned() || (frame & (FrameSize - 1)) != 0) {
        return UnalignedAddress;
    }
    if (window->reserves(page)) {
        return ReservedAddress;
    }

    auto tableLevel3 = ensureTable(window->root(), page.indexLevel4());
    if (!tableLevel3) {
        return tableLevel3.error();
    }
    auto tableLevel2 = ensureTable(*tableLevel3, page.indexLevel3());
    if (!tableLevel2) {
        reclaimEmptyTables(page);
        return tableLevel2.error();
    }
    auto tableLevel1 = ensureTable(*tableLevel2, page.indexLevel2());
    if (!tableLevel1) {
        reclaimEmptyTables(page);
        return tableLevel1.error();
    }

    auto entry = tableLevel1->at(page.indexLevel1());
    if (entry.present() && !overwrite) {
        return AlreadyMapped;
    }
    entry.setPhysicalAddress(frame).setFlags((flags | PageFlags::Present) & ~PageFlags::HugePage);
    mmu->invalidate(page);

    return {};
}

std::optional<elib::Error> PageMapper::allocateAndMap(VirtualAddress page, PageFlags::Type flags)
{
    auto frame = frameAllocator->allocate();
    if (!frame) {
        return frame.error();
    }

    auto error = map(page, *frame, flags);
    if (error) {
        frameAllocator->deallocate(*frame);
    }
    return error;
}

std::expected<std::uintptr_t, elib::Error> PageMapper::unmap(VirtualAddress page, UnmapMode mode)
{
    if (!page.pageAligned()) {
        return std::unexpected(UnalignedAddress);
    }
    if (window->reserves(page)) {
        return std::unexpected(ReservedAddress);
    }

    auto table   = window->root();
    auto indices = std::array{page.indexLevel4(), page.indexLevel3(), page.indexLevel2()};
    for (auto index : indices) {
        auto entry = table.at(index);
        if (!entry.present()) {
            return std::unexpected(NotMapped);
        }
        if (entry.flags() & PageFlags::HugePage) {
            return std::unexpected(HugePageConflict);
        }
        table = window->child(table, index);
    }

    auto entry = table.at(page.indexLevel1());
    if (!entry.present()) {
        return std::unexpected(NotMapped);
    }

    auto frame = entry.physicalAddress();
    entry.clear();
    mmu->invalidate(page);
    reclaimEmptyTables(page);

    if (mode == UnmapMode::ReleaseFrame) {
        frameAllocator->deallocate(frame);
    }
    return frame;
}

std::optional<std::uintptr_t> PageMapper::translate(VirtualAddress address)
{
    auto entryLevel4 = window->root().at(address.indexLevel4());
    if (!entryLevel4.present()) {
        return {};
    }

    auto tableLevel3 = window->child(window->root(), address.indexLevel4());
    auto entryLevel3 = tableLevel3.at(address.indexLevel3());
    if (!entryLevel3.present()) {
        return {};
    }
    if (entryLevel3.flags() & PageFlags::HugePage) {
        return entryLevel3.physicalAddress() + address % 1_GiB;
    }

    auto tableLevel2 = window->child(tableLevel3, address.indexLevel3());
    auto entryLevel2 = tableLevel2.at(address.indexLevel2());
    if (!entryLevel2.present()) {
        return {};
    }
    if (entryLevel2.flags() & PageFlags::HugePage) {
        return entryLevel2.physicalAddress() + address % 2_MiB;
    }

    auto tableLevel1 = window->child(tableLevel2, address.indexLevel2());
    auto entryLevel1 = tableLevel1.at(address.indexLevel1());
    if (!entryLevel1.present()) {
        return {};
    }
    return entryLevel1.physicalAddress() + address % 4_KiB;
}

std::optional<PageFlags::Type> PageMapper::flags(VirtualAddress page)
{
    auto table   = window->root();
    auto indices = std::array{page.indexLevel4(), page.indexLevel3(), page.indexLevel2()};
    for (auto index : indices) {
        auto entry = table.at(index);
        if (!entry.present()) {
            return {};
        }
        if (entry.flags() & PageFlags::HugePage) {
            return entry.flags();
        }
        table = window->child(table, index);
    }

    auto entry = table.at(page.indexLevel1());
    if (!entry.present()) {
        return {};
    }
    return entry.flags();
}

std::expected<Block, elib::Error> PageMapper::mapGuardedStack(VirtualAddress guard, std::size_t size)
{
    if (!guard.pageAligned() || size % FrameSize != 0) {
        return std::unexpected(UnalignedAddress);
    }
    if (size == 0) {
        return std::unexpected(elib::InvalidArgument);
    }
    if (translate(guard)) {
        return std::unexpected(AlreadyMapped);
    }

    auto stack = Block{guard + FrameSize, size};
    for (auto page = stack.startAddress; page < stack.endAddress(); page += FrameSize) {
        auto error = allocateAndMap(page, PageFlags::Present | PageFlags::Writable | PageFlags::NoExecute);
        if (!error) {
            continue;
        }
        for (auto mapped = stack.startAddress; mapped < page; mapped += FrameSize) {
            if (auto unmapped = unmap(mapped, UnmapMode::ReleaseFrame); !unmapped) {
                return std::unexpected(unmapped.error());
            }
        }
        return std::unexpected(*error);
    }

    return stack;
}

std::expected<std::uintptr_t, elib::Error> PageMapper::applyKernelLayout(const KernelLayout& layout)
{
    auto newRoot = frameAllocator->allocate();
    if (!newRoot) {
        return std::unexpected(newRoot.error());
    }
    if (auto error = window->open(*newRoot)) {
        frameAllocator->deallocate(*newRoot);
        return std::unexpected(*error);
    }

    for (const auto& section : layout.sections) {
        auto range = section.range.cover(FrameSize);
        for (auto page = range.startAddress; page < range.endAddress(); page += FrameSize) {
            auto error = map(page, page, section.flags);
            if (error == AlreadyMapped) {
                // Two sections share this page: grant the union of their permissions.
                auto existing = *flags(page);
                auto merged   = PageFlags::Present | ((existing | section.flags) & PageFlags::Writable);
                if (existing & section.flags & PageFlags::NoExecute) {
                    merged |= PageFlags::NoExecute;
                }
                error = map(page, page, merged, true);
            }
            if (error) {
                window->close();
                return std::unexpected(*error);
            }
        }
    }

    auto guard = unmap(layout.stackGuard);
    if (!guard && guard.error() != NotMapped) {
        window->close();
        return std::unexpected(guard.error());
    }

    window->close();
    mmu->loadRootTable(*newRoot);
    return *newRoot;
}

std::expected<TableView, elib::Error> PageMapper::ensureTable(TableView parent, std::uint16_t index)
{
    auto entry = parent.at(index);
    if (entry.present()) {
        if (entry.flags() & PageFlags::HugePage) {
            return std::unexpected(HugePageConflict);
        }
        return window->child(parent, index);
    }

    auto frame = frameAllocator->allocate();
    if (!frame) {
        return std::unexpected(frame.error());
    }

    entry.setPhysicalAddress(*frame).setFlags(PageFlags::Present | PageFlags::Writable);
    auto table = window->child(parent, index);
    mmu->invalidate(table.address());
    table.clear();

    return table;
}

void PageMapper::reclaimEmptyTables(VirtualAddress page)
{
    auto table     = window->root();
    auto links     = std::array{Link{table, 0}, Link{table, 0}, Link{table, 0}};
    auto linkCount = std::size_t(0);

    auto indices = std::array{page.indexLevel4(), page.indexLevel3(), page.indexLevel2()};
    for (auto index : indices) {
        auto entry = table.at(index);
        if (!entry.present() || (entry.flags() & PageFlags::HugePage)) {
            break;
        }
        links[linkCount++] = Link{table, index};
        table              = window->child(table, index);
    }

    // Deepest first; a table that still holds entries keeps all its ancestors alive.
    while (linkCount > 0) {
        auto link  = links[--linkCount];
        auto entry = link.parent.at(link.index);
        auto child = window->child(link.parent, link.index);
        if (!child.empty()) {
            return;
        }

        auto frame = entry.physicalAddress();
        entry.clear();
        mmu->invalidate(child.address());
        frameAllocator->deallocate(frame);
    }
}
