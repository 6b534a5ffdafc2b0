#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <libe/error.hpp>
#include <libe/ringbuffer.hpp>
#include "cpu.hpp"
#include "heap.hpp"
#include "interrupts.hpp"
#include "keyboard.hpp"
#include "multiboot.hpp"
#include "paging.hpp"
#include "panic.hpp"
#include "sync.hpp"

// Bottom of the boot stack, one page that stays unmapped. See boot.S.
extern "C" char kernelStackGuard[];

class Kernel {
public:
    static constexpr auto HeapStart          = VirtualAddress(0x4000'0000);
    static constexpr auto HeapReservedSize   = 4_MiB;
    static constexpr auto HeapInitialSize    = 64_KiB;
    // Unmapped page below the stack of the fatal handlers.
    static constexpr auto FaultStackGuard    = VirtualAddress(0x4080'0000);
    static constexpr auto LowMemoryEnd       = 1_MiB;
    static constexpr auto MaxFrames          = std::size_t(128 * 1024);
    static constexpr auto KeyboardBufferSize = std::size_t(256);

    /**
     * Bring the machine up: parse the boot information, set up the frame allocator, switch to
     * the final kernel page tables, create the heap and install the interrupt vector table.
     *
     * Interrupts are enabled on success. Must be called once.
     */
    static std::expected<Kernel*, elib::Error> make(std::uint32_t magic, const std::byte* information);

    Kernel(const BootInformation& bootInformation, FrameAllocator&& frames);

    Kernel(const Kernel&) = delete;

    Kernel& operator=(const Kernel&) = delete;

    // Echo typed characters, sleeping between interrupts.
    [[noreturn]] Never run();

private:
    static Kernel* instance;

    std::optional<elib::Error> applyKernelLayout();

    std::optional<elib::Error> makeHeap();

    std::optional<elib::Error> setupInterrupts();

    static Never onFatalException(InterruptContext& context);

    static Never onPageFault(InterruptContext& context);

    static Never onUnhandledInterrupt(InterruptContext& context);

    static void onBreakpoint(InterruptContext& context);

    static void onKeyboard(InterruptContext& context);

    static void onSpuriousInterrupt(InterruptContext& context);

    static void logContext(const InterruptContext& context);

    BootInformation                                   bootInformation;
    HardwareMmu                                       mmu;
    RecursiveWindow                                   window;
    FrameAllocator                                    frames;
    IrqLocked<PageMapper>                             pageMapper;
    std::optional<IrqLocked<KernelHeap>>              heap;
    InterruptDispatcher                               dispatcher;
    Cpu*                                              cpu;
    Keyboard                                          keyboard;
    elib::SpscRing<char, KeyboardBufferSize> keys;
};
