#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <libe/error.hpp>
#include "paging.hpp"

struct BootErrorCategory : elib::ErrorCategory {};
inline constexpr auto bootErrorCategory = BootErrorCategory{{"boot"}};

inline constexpr auto InvalidBootMagic = elib::Error(-1, &bootErrorCategory, "not loaded by a multiboot2 loader");
inline constexpr auto MalformedBootInformation = elib::Error(-2, &bootErrorCategory, "malformed boot information");
inline constexpr auto MissingMemoryMap = elib::Error(-3, &bootErrorCategory, "boot information lacks a memory map");
inline constexpr auto MissingElfSections = elib::Error(-4, &bootErrorCategory, "boot information lacks ELF sections");

namespace Multiboot2 {

    inline constexpr auto BootloaderMagic = std::uint32_t(0x36D7'6289);

    struct TagType {
        using Type = std::uint32_t;

        static constexpr auto End            = Type(0);
        static constexpr auto CommandLine    = Type(1);
        static constexpr auto BootloaderName = Type(2);
        static constexpr auto MemoryMap      = Type(6);
        static constexpr auto ElfSections    = Type(9);
    };

    struct __attribute__((packed)) InformationHeader {
        std::uint32_t totalSize;
        std::uint32_t reserved;
    };

    struct __attribute__((packed)) TagHeader {
        std::uint32_t type;
        std::uint32_t size;
    };

    struct __attribute__((packed)) MemoryMapTag {
        TagHeader     header;
        std::uint32_t entrySize;
        std::uint32_t entryVersion;
    };

    struct __attribute__((packed)) MemoryMapEntry {
        std::uint64_t baseAddress;
        std::uint64_t length;
        std::uint32_t type;
        std::uint32_t reserved;
    };

    struct __attribute__((packed)) ElfSectionsTag {
        TagHeader     header;
        std::uint32_t sectionCount;
        std::uint32_t entrySize;
        std::uint32_t stringTableIndex;
    };

    struct __attribute__((packed)) ElfSectionHeader {
        std::uint32_t name;
        std::uint32_t type;
        std::uint64_t flags;
        std::uint64_t address;
        std::uint64_t offset;
        std::uint64_t size;
        std::uint32_t link;
        std::uint32_t info;
        std::uint64_t addressAlignment;
        std::uint64_t entrySize;
    };

} // namespace Multiboot2

struct MemoryRegion {
    static constexpr auto Available = std::uint32_t(1);

    Block         block;
    std::uint32_t type;

    bool available() const {
        return type == Available;
    }
};

struct ImageSection {
    struct Flags {
        using Type = std::uint64_t;

        static constexpr auto Writable   = Type(1);
        static constexpr auto Allocated  = Type(1) << 1;
        static constexpr auto Executable = Type(1) << 2;
    };

    Block       block;
    Flags::Type flags;

    // Code is read-only and executable, everything else is non-executable.
    PageFlags::Type pageFlags() const;
};

// Copy of what the kernel needs from the multiboot2 information block.
// The block itself is not referenced after parsing.
class BootInformation {
public:
    static constexpr auto MaxRegions    = std::size_t(32);
    static constexpr auto MaxSections   = std::size_t(32);
    static constexpr auto MaxStringSize = std::size_t(128);

    static std::expected<BootInformation, elib::Error> parse(std::uint32_t magic, const std::byte* information);

    std::span<const MemoryRegion> memoryRegions() const;

    std::span<const Block> availableRegions() const;

    std::span<const ImageSection> sections() const;

    // From the lowest allocated section start to the highest allocated section end.
    Block kernelImage() const;

    Block extent() const;

    std::string_view commandLine() const;

    std::string_view bootloaderName() const;

private:
    BootInformation() = default;

    std::optional<elib::Error> readMemoryMap(const Multiboot2::TagHeader& tag);

    std::optional<elib::Error> readElfSections(const Multiboot2::TagHeader& tag);

    static std::size_t copyString(const Multiboot2::TagHeader& tag, std::array<char, MaxStringSize>& destination);

    std::array<MemoryRegion, MaxRegions>   regions{};
    std::size_t                            regionCount = 0;
    std::array<Block, MaxRegions>          available{};
    std::size_t                            availableCount = 0;
    std::array<ImageSection, MaxSections>  imageSections{};
    std::size_t                            sectionCount = 0;
    Block                                  image{0, 0};
    Block                                  informationBlock{0, 0};
    std::array<char, MaxStringSize>        commandLineBuffer{};
    std::size_t                            commandLineSize = 0;
    std::array<char, MaxStringSize>        bootloaderNameBuffer{};
    std::size_t                            bootloaderNameSize = 0;
};
