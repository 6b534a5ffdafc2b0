#pragma once

#include <bit>
#include <cstdint>
#include <expected>
#include <optional>
#include <libe/allocator.hpp>
#include <libe/error.hpp>
#include "interrupts.hpp"
#include "paging.hpp"
#include "pic.hpp"

namespace Register {

    struct CR2 {
        static std::uint64_t read();
    };

    struct CR3 {
        static std::uint64_t read();

        static void write(std::uint64_t rootPageTablePhysicalAddress);

        static void flushTLBS();
    };

} // namespace Register

struct CpuErrorCategory : elib::ErrorCategory {};
inline constexpr auto cpuErrorCategory = CpuErrorCategory{{"cpu"}};

inline constexpr auto AlreadyCreated = elib::Error{-1, &cpuErrorCategory, "cpu already created"};

struct __attribute__((packed)) TaskStateSegment {
    std::uint32_t reserved0;
    std::uint64_t rsp0;
    std::uint64_t rsp1;
    std::uint64_t rsp2;
    std::uint64_t reserved1;
    std::uint64_t ist[7];
    std::uint64_t reserved2;
    std::uint16_t reserved3;
    std::uint16_t iobp;
};

// The MMU of the running processor.
class HardwareMmu : public Mmu {
public:
    void invalidate(VirtualAddress address) override;

    void invalidateAll() override;

    std::uintptr_t rootTable() override;

    void loadRootTable(std::uintptr_t rootPhysicalAddress) override;
};

// Called by the entry stubs with the saved register block.
extern "C" void dispatchInterrupt(InterruptContext* context);

class Cpu {
public:
    static constexpr auto KernelSegmentIndex = std::uint16_t(1);
    static constexpr auto FaultStackIndex    = std::uint8_t(1);
    static constexpr auto FaultStackSize     = 16_KiB;

    explicit Cpu(const Block& faultStack);

    // faultStack backs IST FaultStackIndex and is owned by the caller.
    static std::expected<Cpu*, elib::Error> make(elib::Allocator& allocator, const Block& faultStack);

    static Cpu& getInstance();

    // Enable interrupts and sleep until the next one.
    static void halt();

    static void maskInterrupts();

    static void unmaskInterrupts();

    static void setRootPageTable(std::uint64_t rootPageTablePhysicalAddress);

    // Let the dispatcher fill the IDT, then load it.
    std::optional<elib::Error> installInterrupts(InterruptDispatcher& dispatcher);

    // Unmask the cascade and keyboard lines and set the interrupt flag.
    std::optional<elib::Error> enableInterrupts();

    Pic& pic();

private:
    friend void dispatchInterrupt(InterruptContext* context);

    static Cpu* instance;

    void setupGdt(const Block& faultStack);

    static constexpr auto TssSegmentIndex = std::uint16_t(3);

    std::uint64_t       gdt[5];
    alignas(16) IdtDescriptor idt[InterruptDispatcher::VectorCount];
    // From the Intel 64 Architectures manual: Volume 3A
    // "Avoid placing a page boundary in the part of the TSS that the processor reads
    // during a task switch (the first 104 bytes)."
    alignas(std::bit_ceil(sizeof(TaskStateSegment))) TaskStateSegment tss;
    Pic                  _pic;
    InterruptDispatcher* dispatcher;
};
