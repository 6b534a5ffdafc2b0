#define BOOST_TEST_MODULE FrameAllocator
#include <boost/test/unit_test.hpp>

#include <kernel/paging.hpp>
#include <array>
#include <random>
#include <set>
#include <vector>

namespace {

std::vector<std::uintptr_t> drain(FrameAllocator& allocator)
{
    std::vector<std::uintptr_t> frames;
    while (auto frame = allocator.allocate()) {
        frames.push_back(*frame);
    }
    return frames;
}

} // namespace

BOOST_AUTO_TEST_SUITE(frame_allocator_test)

BOOST_AUTO_TEST_CASE( first_frame_follows_kernel_image )
{
    const auto available = std::array{Block{0x10'0000, 0x1'0000}};
    const auto reserved  = std::array{Block{0x10'0000, 0x4000}};
    std::vector<std::uintptr_t> storage(64);
    auto allocator = *FrameAllocator::make(available, reserved, storage);

    auto frame = allocator.allocate();
    BOOST_REQUIRE(frame.has_value());
    BOOST_CHECK_EQUAL(*frame, 0x10'4000u);

    for (auto frame : drain(allocator)) {
        BOOST_CHECK(frame >= 0x10'4000u);
        BOOST_CHECK(frame < 0x11'0000u);
    }
}

BOOST_AUTO_TEST_CASE( most_recently_freed_first )
{
    const auto available = std::array{Block{0x20'0000, 0x1'0000}};
    std::vector<std::uintptr_t> storage(64);
    auto allocator = *FrameAllocator::make(available, {}, storage);

    auto a = *allocator.allocate();
    auto b = *allocator.allocate();
    allocator.deallocate(a);
    allocator.deallocate(b);
    BOOST_CHECK_EQUAL(allocator.reusableFrameCount(), 2u);

    BOOST_CHECK_EQUAL(*allocator.allocate(), b);
    BOOST_CHECK_EQUAL(*allocator.allocate(), a);

    // Reuse list is empty again, so the cursor continues after b.
    BOOST_CHECK_EQUAL(*allocator.allocate(), b + FrameSize);
    BOOST_CHECK_EQUAL(allocator.frameCount(), 3u);
}

BOOST_AUTO_TEST_CASE( live_frames_stay_disjoint )
{
    const auto available = std::array{Block{0x10'0000, 0x10'0000}, Block{0x40'0000, 0x8'0000}};
    const auto reserved  = std::array{Block{0x0, 0x10'0000}, Block{0x12'0000, 0x3000}};
    std::vector<std::uintptr_t> storage(1024);
    auto allocator = *FrameAllocator::make(available, reserved, storage);

    std::mt19937 random(42);
    std::vector<std::uintptr_t> live;
    std::set<std::uintptr_t> liveSet;

    for (int step = 0; step < 2000; step++) {
        if (live.empty() || random() % 3 != 0) {
            auto frame = allocator.allocate();
            if (!frame) {
                continue;
            }
            BOOST_CHECK_EQUAL(*frame % FrameSize, 0u);
            BOOST_CHECK(!Block(0x12'0000, 0x3000).contains(*frame));
            BOOST_CHECK_MESSAGE(liveSet.insert(*frame).second, "frame handed out twice");
            live.push_back(*frame);
        } else {
            auto index = random() % live.size();
            auto frame = live[index];
            live.erase(live.begin() + index);
            liveSet.erase(frame);
            allocator.deallocate(frame);
        }
    }
}

BOOST_AUTO_TEST_CASE( exhaustion_is_reported )
{
    const auto available = std::array{Block{0x30'0000, 4 * FrameSize}};
    std::vector<std::uintptr_t> storage(64);
    auto allocator = *FrameAllocator::make(available, {}, storage);

    BOOST_CHECK_EQUAL(drain(allocator).size(), 4u);

    auto frame = allocator.allocate();
    BOOST_REQUIRE(!frame.has_value());
    BOOST_CHECK(frame.error() == OutOfPhysicalMemory);

    allocator.deallocate(0x30'2000);
    BOOST_CHECK_EQUAL(*allocator.allocate(), 0x30'2000u);
}

BOOST_AUTO_TEST_CASE( low_memory_is_never_handed_out )
{
    const auto available = std::array{Block{0x0, 0x20'0000}};
    const auto reserved  = std::array{Block{0x0, 0x10'0000}};
    std::vector<std::uintptr_t> storage(16);
    auto allocator = *FrameAllocator::make(available, reserved, storage);

    BOOST_CHECK_EQUAL(*allocator.allocate(), 0x10'0000u);
}

BOOST_AUTO_TEST_CASE( region_boundaries_are_trimmed )
{
    const auto available = std::array{Block{0x10'0800, 0x3000}};
    std::vector<std::uintptr_t> storage(16);
    auto allocator = *FrameAllocator::make(available, {}, storage);

    auto frames = drain(allocator);
    BOOST_REQUIRE_EQUAL(frames.size(), 2u);
    BOOST_CHECK_EQUAL(frames[0], 0x10'1000u);
    BOOST_CHECK_EQUAL(frames[1], 0x10'2000u);
}

BOOST_AUTO_TEST_CASE( regions_are_visited_in_address_order )
{
    const auto available = std::array{Block{0x50'0000, FrameSize}, Block{0x20'0000, FrameSize}};
    std::vector<std::uintptr_t> storage(16);
    auto allocator = *FrameAllocator::make(available, {}, storage);

    BOOST_CHECK_EQUAL(*allocator.allocate(), 0x20'0000u);
    BOOST_CHECK_EQUAL(*allocator.allocate(), 0x50'0000u);
}

BOOST_AUTO_TEST_CASE( reserved_ranges_cover_whole_frames )
{
    const auto available = std::array{Block{0x10'0000, 4 * FrameSize}};
    const auto reserved  = std::array{Block{0x10'1800, 0x10}};
    std::vector<std::uintptr_t> storage(16);
    auto allocator = *FrameAllocator::make(available, reserved, storage);

    auto frames = drain(allocator);
    BOOST_REQUIRE_EQUAL(frames.size(), 3u);
    BOOST_CHECK_EQUAL(frames[0], 0x10'0000u);
    BOOST_CHECK_EQUAL(frames[1], 0x10'2000u);
    BOOST_CHECK_EQUAL(frames[2], 0x10'3000u);
}

BOOST_AUTO_TEST_CASE( reuse_storage_caps_managed_frames )
{
    const auto available = std::array{Block{0x10'0000, 0x10'0000}};
    std::vector<std::uintptr_t> storage(3);
    auto allocator = *FrameAllocator::make(available, {}, storage);

    auto frames = drain(allocator);
    BOOST_CHECK_EQUAL(frames.size(), 3u);

    for (auto frame : frames) {
        allocator.deallocate(frame);
    }
    BOOST_CHECK_EQUAL(allocator.reusableFrameCount(), 3u);
    BOOST_CHECK_EQUAL(drain(allocator).size(), 3u);
}

BOOST_AUTO_TEST_CASE( ranges_that_do_not_fit_are_refused )
{
    std::vector<std::uintptr_t> storage(16);

    std::vector<Block> regions;
    for (auto i = std::size_t(0); i <= FrameAllocator::MaxRegions; i++) {
        regions.push_back(Block{0x100'0000 + i * 0x10'0000, FrameSize});
    }
    auto tooManyRegions = FrameAllocator::make(regions, {}, storage);
    BOOST_REQUIRE(!tooManyRegions.has_value());
    BOOST_CHECK(tooManyRegions.error() == TooManyRegions);

    // Empty regions take no slot.
    regions.back().size = 0x800;
    BOOST_CHECK(FrameAllocator::make(regions, {}, storage).has_value());

    const auto available = std::array{Block{0x10'0000, 0x10'0000}};
    std::vector<Block> reserved;
    for (auto i = std::size_t(0); i <= FrameAllocator::MaxReservedRanges; i++) {
        reserved.push_back(Block{0x10'0000 + i * 2 * FrameSize, FrameSize});
    }
    auto tooManyReserved = FrameAllocator::make(available, reserved, storage);
    BOOST_REQUIRE(!tooManyReserved.has_value());
    BOOST_CHECK(tooManyReserved.error() == TooManyRegions);

    reserved.pop_back();
    auto allocator = *FrameAllocator::make(available, reserved, storage);
    for (auto frame : drain(allocator)) {
        for (const auto& range : reserved) {
            BOOST_CHECK(!range.contains(frame));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
