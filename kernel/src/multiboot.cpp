#include "kernel/multiboot.hpp"
#include <algorithm>

using namespace Multiboot2;

PageFlags::Type ImageSection::pageFlags() const
{
    if (flags & Flags::Executable) {
        return PageFlags::Present;
    }
    if (flags & Flags::Writable) {
        return PageFlags::Present | PageFlags::Writable | PageFlags::NoExecute;
    }
    return PageFlags::Present | PageFlags::NoExecute;
}

std::expected<BootInformation, elib::Error> BootInformation::parse(std::uint32_t magic, const std::byte* information)
{
    if (magic != BootloaderMagic) {
        return std::unexpected(InvalidBootMagic);
    }
    if (information == nullptr || reinterpret_cast<std::uintptr_t>(information) % 8 != 0) {
        return std::unexpected(MalformedBootInformation);
    }

    auto header    = reinterpret_cast<const InformationHeader*>(information);
    auto totalSize = std::size_t(header->totalSize);
    if (totalSize < sizeof(InformationHeader) + sizeof(TagHeader)) {
        return std::unexpected(MalformedBootInformation);
    }

    auto result             = BootInformation();
    result.informationBlock = Block{reinterpret_cast<std::uintptr_t>(information), totalSize};

    auto hasMemoryMap   = false;
    auto hasElfSections = false;
    auto terminated     = false;

    // Tags start after the header and are padded to 8 bytes.
    auto offset = sizeof(InformationHeader);
    while (offset + sizeof(TagHeader) <= totalSize) {
        const auto& tag = *reinterpret_cast<const TagHeader*>(information + offset);
        if (tag.size < sizeof(TagHeader) || offset + tag.size > totalSize) {
            return std::unexpected(MalformedBootInformation);
        }

        if (tag.type == TagType::End) {
            terminated = true;
            break;
        }

        switch (tag.type) {
        case TagType::MemoryMap:
            if (auto error = result.readMemoryMap(tag)) {
                return std::unexpected(*error);
            }
            hasMemoryMap = true;
            break;
        case TagType::ElfSections:
            if (auto error = result.readElfSections(tag)) {
                return std::unexpected(*error);
            }
            hasElfSections = true;
            break;
        case TagType::CommandLine:
            result.commandLineSize = copyString(tag, result.commandLineBuffer);
            break;
        case TagType::BootloaderName:
            result.bootloaderNameSize = copyString(tag, result.bootloaderNameBuffer);
            break;
        default:
            break;
        }

        offset += (tag.size + 7) & ~std::size_t(7);
    }

    if (!terminated) {
        return std::unexpected(MalformedBootInformation);
    }
    if (!hasMemoryMap) {
        return std::unexpected(MissingMemoryMap);
    }
    if (!hasElfSections) {
        return std::unexpected(MissingElfSections);
    }

    return result;
}

std::optional<elib::Error> BootInformation::readMemoryMap(const TagHeader& tag)
{
    if (tag.size < sizeof(MemoryMapTag)) {
        return MalformedBootInformation;
    }
    const auto& memoryMap = reinterpret_cast<const MemoryMapTag&>(tag);
    if (memoryMap.entrySize < sizeof(MemoryMapEntry)) {
        return MalformedBootInformation;
    }

    auto entries    = reinterpret_cast<const std::byte*>(&tag) + sizeof(MemoryMapTag);
    auto entryCount = (tag.size - sizeof(MemoryMapTag)) / memoryMap.entrySize;
    for (auto i = std::size_t(0); i < entryCount && regionCount < MaxRegions; i++) {
        const auto& entry = *reinterpret_cast<const MemoryMapEntry*>(entries + i * memoryMap.entrySize);
        auto region       = MemoryRegion{Block{entry.baseAddress, entry.length}, entry.type};

        regions[regionCount++] = region;
        if (region.available() && region.block.size > 0) {
            available[availableCount++] = region.block;
        }
    }

    return {};
}

std::optional<elib::Error> BootInformation::readElfSections(const TagHeader& tag)
{
    if (tag.size < sizeof(ElfSectionsTag)) {
        return MalformedBootInformation;
    }
    const auto& elfSections = reinterpret_cast<const ElfSectionsTag&>(tag);
    if (elfSections.entrySize < sizeof(ElfSectionHeader)) {
        return MalformedBootInformation;
    }
    auto payloadSize = std::size_t(tag.size - sizeof(ElfSectionsTag));
    if (std::size_t(elfSections.sectionCount) * elfSections.entrySize > payloadSize) {
        return MalformedBootInformation;
    }

    auto headers = reinterpret_cast<const std::byte*>(&tag) + sizeof(ElfSectionsTag);
    for (auto i = std::size_t(0); i < elfSections.sectionCount; i++) {
        const auto& section = *reinterpret_cast<const ElfSectionHeader*>(headers + i * elfSections.entrySize);
        if (!(section.flags & ImageSection::Flags::Allocated) || section.size == 0) {
            continue;
        }

        // Every allocated section gets remapped later, none may be left out.
        if (sectionCount == MaxSections) {
            return MalformedBootInformation;
        }

        auto block = Block{section.address, section.size};
        if (sectionCount == 0) {
            image = block;
        } else {
            auto start = std::min(image.startAddress, block.startAddress);
            auto end   = std::max(image.endAddress(), block.endAddress());
            image      = Block{start, end - start};
        }

        imageSections[sectionCount++] = ImageSection{block, section.flags};
    }

    if (sectionCount == 0) {
        return MissingElfSections;
    }
    return {};
}

std::size_t BootInformation::copyString(const TagHeader& tag, std::array<char, MaxStringSize>& destination)
{
    auto source = reinterpret_cast<const char*>(&tag) + sizeof(TagHeader);
    auto limit  = std::min(std::size_t(tag.size - sizeof(TagHeader)), destination.size());

    auto size = std::size_t(0);
    while (size < limit && source[size] != '\0') {
        destination[size] = source[size];
        size++;
    }
    return size;
}

std::span<const MemoryRegion> BootInformation::memoryRegions() const
{
    return std::span(regions.data(), regionCount);
}

std::span<const Block> BootInformation::availableRegions() const
{
    return std::span(available.data(), availableCount);
}

std::span<const ImageSection> BootInformation::sections() const
{
    return std::span(imageSections.data(), sectionCount);
}

Block BootInformation::kernelImage() const
{
    return image;
}

Block BootInformation::extent() const
{
    return informationBlock;
}

std::string_view BootInformation::commandLine() const
{
    return std::string_view(commandLineBuffer.data(), commandLineSize);
}

std::string_view BootInformation::bootloaderName() const
{
    return std::string_view(bootloaderNameBuffer.data(), bootloaderNameSize);
}
