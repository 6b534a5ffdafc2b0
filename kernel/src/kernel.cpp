#include "kernel/kernel.hpp"
#include "kernel/console.hpp"
#include "kernel/port.hpp"
#include <new>
#include <utility>

namespace {

// Backing store of the frame reuse stack; caps the number of frames the kernel manages.
std::uintptr_t frameReuseStorage[Kernel::MaxFrames];

alignas(Kernel) unsigned char kernelStorage[sizeof(Kernel)];

} // namespace

Kernel* Kernel::instance = nullptr;

std::expected<Kernel*, elib::Error> Kernel::make(std::uint32_t magic, const std::byte* information)
{
    auto& console = Console::getInstance();

    auto bootInformation = BootInformation::parse(magic, information);
    if (!bootInformation) {
        console.initialize(Console::Sink::Both);
        return std::unexpected(bootInformation.error());
    }

    console.initialize(Console::parseSinks(bootInformation->commandLine()));
    log("ember booting, loaded by ", bootInformation->bootloaderName());

    auto image = bootInformation->kernelImage();
    log("Kernel image ", Hex{image.startAddress}, " - ", Hex{image.endAddress()});

    auto frames = FrameAllocator::make(
        bootInformation->availableRegions(),
        std::array{
            Block{0, LowMemoryEnd},
            image,
            bootInformation->extent(),
        },
        frameReuseStorage
    );
    if (!frames) {
        return std::unexpected(frames.error());
    }

    Kernel::instance = ::new (kernelStorage) Kernel(*bootInformation, std::move(*frames));
    auto& kernel     = *Kernel::instance;
    log("Frame allocator ready, ", kernel.bootInformation.availableRegions().size(), " available regions");

    if (auto error = kernel.applyKernelLayout()) {
        return std::unexpected(*error);
    }
    if (auto error = kernel.makeHeap()) {
        return std::unexpected(*error);
    }
    if (auto error = kernel.setupInterrupts()) {
        return std::unexpected(*error);
    }

    return Kernel::instance;
}

Kernel::Kernel(const BootInformation& bootInformation, FrameAllocator&& frames) :
    bootInformation(bootInformation),
    window(mmu),
    frames(std::move(frames)),
    pageMapper(window, frames, mmu),
    dispatcher(&Kernel::onUnhandledInterrupt),
    cpu(nullptr)
{}

Never Kernel::run()
{
    char buffer[KeyboardBufferSize];
    auto& console = Console::getInstance();

    while (true) {
        {
            // Handlers log through the same console.
            InterruptGuard guard;
            auto end = keys.drain(buffer);
            for (auto c = buffer; c != end; c++) {
                console.write(*c);
            }
        }

        // Check for input with interrupts off so a key arriving in between still wakes us.
        Cpu::maskInterrupts();
        if (keys.empty()) {
            Cpu::halt();
        } else {
            Cpu::unmaskInterrupts();
        }
    }
}

std::optional<elib::Error> Kernel::applyKernelLayout()
{
    constexpr auto vgaFlags = PageFlags::Present | PageFlags::Writable | PageFlags::NoExecute;

    std::array<KernelSection, BootInformation::MaxSections + 1> sections{};
    auto count = std::size_t(0);
    for (const auto& section : bootInformation.sections()) {
        sections[count++] = KernelSection{section.block, section.pageFlags()};
    }
    sections[count++] = KernelSection{Block{Console::VgaBufferAddress, Console::VgaBufferSize}, vgaFlags};

    auto layout = KernelLayout{
        std::span<const KernelSection>(sections.data(), count),
        VirtualAddress(reinterpret_cast<std::uintptr_t>(kernelStackGuard)),
    };

    auto root = pageMapper.lock()->applyKernelLayout(layout);
    if (!root) {
        return root.error();
    }

    log("Kernel remapped, root table ", Hex{*root}, ", stack guard ", Hex{layout.stackGuard});
    return {};
}

std::optional<elib::Error> Kernel::makeHeap()
{
    auto mapper     = pageMapper.lock();
    auto kernelHeap = KernelHeap::make(*mapper, HeapStart, HeapReservedSize, HeapInitialSize);
    if (!kernelHeap) {
        return kernelHeap.error();
    }

    heap.emplace(std::move(*kernelHeap));
    log("Heap at ", Hex{HeapStart}, ", ", HeapInitialSize / 1_KiB, " KiB mapped of ", HeapReservedSize / 1_KiB, " KiB");
    return {};
}

std::optional<elib::Error> Kernel::setupInterrupts()
{
    auto faultStack = pageMapper.lock()->mapGuardedStack(FaultStackGuard, Cpu::FaultStackSize);
    if (!faultStack) {
        return faultStack.error();
    }
    log("Fault stack ", Hex{faultStack->startAddress}, " - ", Hex{faultStack->endAddress()});

    {
        auto allocator = heap->lock();
        auto created   = Cpu::make(*allocator, *faultStack);
        if (!created) {
            return created.error();
        }
        cpu = *created;
    }

    constexpr Vector::Type fatalVectors[] = {
        Vector::DivideError,
        Vector::Debug,
        Vector::NonMaskableInterrupt,
        Vector::Overflow,
        Vector::BoundRangeExceeded,
        Vector::InvalidOpcode,
        Vector::DeviceNotAvailable,
        Vector::DoubleFault,
        Vector::InvalidTss,
        Vector::SegmentNotPresent,
        Vector::StackSegmentFault,
        Vector::GeneralProtection,
        Vector::X87FloatingPoint,
        Vector::AlignmentCheck,
        Vector::MachineCheck,
        Vector::SimdFloatingPoint,
    };
    for (auto vector : fatalVectors) {
        if (auto error = dispatcher.registerHandler(vector, &Kernel::onFatalException)) {
            return error;
        }
    }

    const std::pair<Vector::Type, InterruptHandler> handlers[] = {
        {Vector::PageFault, &Kernel::onPageFault},
        {Vector::Breakpoint, &Kernel::onBreakpoint},
        {Vector::Keyboard, &Kernel::onKeyboard},
        {Vector::SpuriousMaster, &Kernel::onSpuriousInterrupt},
        {Vector::SpuriousSlave, &Kernel::onSpuriousInterrupt},
    };
    for (const auto& [vector, handler] : handlers) {
        if (auto error = dispatcher.registerHandler(vector, handler)) {
            return error;
        }
    }

    if (auto error = cpu->installInterrupts(dispatcher)) {
        return error;
    }
    if (auto error = cpu->enableInterrupts()) {
        return error;
    }

    log("Interrupts enabled");
    return {};
}

Never Kernel::onFatalException(InterruptContext& context)
{
    log("Fatal exception ", context.vector, " (", vectorName(context.vector), ")");
    logContext(context);
    panic("Unrecoverable exception");
}

Never Kernel::onPageFault(InterruptContext& context)
{
    auto fault = PageFault{Register::CR2::read(), context.errorCode};

    log("Page fault at ", Hex{fault.address}, ": ", describe(fault.cause()), fault.instructionFetch() ? " (instruction fetch)" : "");
    logContext(context);

    auto guard = reinterpret_cast<std::uintptr_t>(kernelStackGuard);
    if (Block{guard, FrameSize}.contains(fault.address)) {
        panic("Kernel stack overflow");
    }
    if (Block{FaultStackGuard, FrameSize}.contains(fault.address)) {
        panic("Fault stack overflow");
    }
    // Nothing is mapped lazily, so no page fault can be resolved.
    panic("Unhandled page fault");
}

Never Kernel::onUnhandledInterrupt(InterruptContext& context)
{
    log("Unhandled interrupt ", context.vector, " (", vectorName(context.vector), ")");
    logContext(context);
    panic("Unexpected interrupt");
}

void Kernel::onBreakpoint(InterruptContext& context)
{
    log("Breakpoint at ", Hex{context.rip});
}

void Kernel::onKeyboard(InterruptContext&)
{
    auto& kernel   = *Kernel::instance;
    auto  scancode = Port::readByte(Keyboard::DataPort);

    if (auto c = kernel.keyboard.translate(scancode)) {
        if (!kernel.keys.push(*c)) {
            log("Keyboard buffer full, key dropped");
        }
    }

    kernel.cpu->pic().notifyEndOfInterrupt(Pic::KeyboardIrq);
}

void Kernel::onSpuriousInterrupt(InterruptContext& context)
{
    auto& pic = Kernel::instance->cpu->pic();
    auto  irq = std::uint8_t(context.vector - Vector::HardwareInterruptBase);
    if (!pic.notifyEndOfInterrupt(irq)) {
        return;
    }
    log("Spurious interrupt, ", pic.spuriousCount(), " so far");
}

void Kernel::logContext(const InterruptContext& context)
{
    log("  error code ", Hex{context.errorCode}, " rip ", Hex{context.rip}, " cs ", Hex{context.cs});
    log("  rflags ", Hex{context.rflags}, " rsp ", Hex{context.rsp}, " cr2 ", Hex{Register::CR2::read()});
}
