#include <kernel/cpu.hpp>
#include <kernel/panic.hpp>
#include <span>
#include <tuple>

extern "C" void setGdt(const DescriptorTablePointer* gdt, std::uint16_t codeSegmentIndex, std::uint16_t tssSegmentIndex);

extern "C" void setIdt(const DescriptorTablePointer* idt);

// Entry stub addresses for vectors 0-47, see isr.S.
extern "C" const std::uintptr_t interruptStubTable[48];

struct GdtAccess {
    using Type                             = std::uint8_t;
    static constexpr auto ReadableWritable = Type(1) << 1;
    static constexpr auto Executable       = Type(1) << 3;
    static constexpr auto CodeDataSegment  = Type(1) << 4;
    static constexpr auto Present          = Type(1) << 7;
    static constexpr auto TSS              = Type(0x9);
};

constexpr std::uint64_t makeSegmentDescriptor(GdtAccess::Type access)
{
    auto entry = std::uint64_t(access) << 40;
    if (access & GdtAccess::Executable) {
        entry |= std::uint64_t(1) << 53; // Set long-mode code flag.
    }
    return entry;
};

constexpr std::tuple<std::uint64_t, std::uint64_t> makeTaskStateSegmentDescriptor(std::uintptr_t tssLinearAddress)
{
    static_assert(sizeof(TaskStateSegment) - 1 < 0xffff);
    constexpr auto access = GdtAccess::Present | GdtAccess::TSS;

    // No I/O permission map: the map base lies beyond the segment limit.
    auto lowerEntry = sizeof(TaskStateSegment) - 1;
    lowerEntry |= (tssLinearAddress & 0xff'ffff) << 16;
    lowerEntry |= std::uint64_t(access) << 40;
    lowerEntry |= (tssLinearAddress & 0xff00'0000) << 32;

    auto higherEntry = tssLinearAddress >> 32;
    return {lowerEntry, higherEntry};
}

Cpu* Cpu::instance = nullptr;

Cpu::Cpu(const Block& faultStack) :
    gdt{0}, idt{{0, 0}}, tss{}, _pic(Vector::HardwareInterruptBase, Vector::HardwareInterruptBase + 8),
    dispatcher(nullptr)
{
    setupGdt(faultStack);
}

std::expected<Cpu*, elib::Error> Cpu::make(elib::Allocator& allocator, const Block& faultStack)
{
    if (Cpu::instance != nullptr) {
        return std::unexpected(AlreadyCreated);
    }

    Cpu::instance = elib::constructRaw<Cpu>(allocator, faultStack);
    if (Cpu::instance == nullptr) {
        return std::unexpected(elib::OutOfMemoryError);
    }

    return Cpu::instance;
}

Cpu& Cpu::getInstance()
{
    return *Cpu::instance;
}

void Cpu::halt()
{
    // sti only takes effect after the next instruction, so no interrupt slips in before hlt.
    asm volatile("sti; hlt" ::: "memory");
}

void Cpu::maskInterrupts()
{
    asm volatile("cli" ::: "memory");
}

void Cpu::unmaskInterrupts()
{
    asm volatile("sti" ::: "memory");
}

void Cpu::setRootPageTable(std::uint64_t rootPageTablePhysicalAddress)
{
    Register::CR3::write(rootPageTablePhysicalAddress);
}

std::optional<elib::Error> Cpu::installInterrupts(InterruptDispatcher& dispatcher)
{
    auto error = dispatcher.install(
        std::span<IdtDescriptor, InterruptDispatcher::VectorCount>(idt),
        std::span<const std::uintptr_t>(interruptStubTable),
        KernelSegmentIndex,
        FaultStackIndex
    );
    if (error) {
        return error;
    }

    this->dispatcher = &dispatcher;
    auto pointer     = DescriptorTablePointer::of(idt);
    setIdt(&pointer);
    return {};
}

std::optional<elib::Error> Cpu::enableInterrupts()
{
    if (dispatcher == nullptr) {
        return NotInstalled;
    }
    if (auto error = dispatcher->enable()) {
        return error;
    }

    _pic.unmask(Pic::CascadeIrq);
    _pic.unmask(Pic::KeyboardIrq);
    unmaskInterrupts();
    return {};
}

Pic& Cpu::pic()
{
    return _pic;
}

void Cpu::setupGdt(const Block& faultStack)
{
    constexpr auto DataSegmentAccess = GdtAccess::CodeDataSegment | GdtAccess::Present | GdtAccess::ReadableWritable;
    constexpr auto CodeSegmentAccess = DataSegmentAccess | GdtAccess::Executable;

    tss.ist[FaultStackIndex - 1] = faultStack.endAddress();
    tss.iobp                     = sizeof(TaskStateSegment); // No IOBP

    gdt[0]                      = 0;
    gdt[KernelSegmentIndex]     = makeSegmentDescriptor(CodeSegmentAccess);
    gdt[KernelSegmentIndex + 1] = makeSegmentDescriptor(DataSegmentAccess);
    std::tie(gdt[TssSegmentIndex], gdt[TssSegmentIndex + 1]) =
        makeTaskStateSegmentDescriptor(reinterpret_cast<std::uintptr_t>(&tss));

    auto pointer = DescriptorTablePointer::of(gdt);
    setGdt(&pointer, KernelSegmentIndex, TssSegmentIndex);
}

void HardwareMmu::invalidate(VirtualAddress address)
{
    asm volatile("invlpg (%0)" : : "r"(std::uintptr_t(address)) : "memory");
}

void HardwareMmu::invalidateAll()
{
    Register::CR3::flushTLBS();
}

std::uintptr_t HardwareMmu::rootTable()
{
    return Register::CR3::read() & 0x000F'FFFF'FFFF'F000;
}

void HardwareMmu::loadRootTable(std::uintptr_t rootPhysicalAddress)
{
    Cpu::setRootPageTable(rootPhysicalAddress);
}

std::uint64_t Register::CR2::read()
{
    std::uint64_t cr2;
    asm volatile("mov %%cr2, %0" : "=r"(cr2));
    return cr2;
}

std::uint64_t Register::CR3::read()
{
    std::uint64_t cr3;
    asm volatile("mov %%cr3, %0" : "=r"(cr3));
    return cr3;
};

void Register::CR3::write(std::uint64_t value)
{
    asm volatile("mov %0, %%cr3" : : "r"(value) : "memory");
};

void Register::CR3::flushTLBS()
{
    asm volatile("mov %%cr3, %%rax;"
                 "mov %%rax, %%cr3"
                 :
                 :
                 : "%rax", "memory");
};

extern "C" void dispatchInterrupt(InterruptContext* context)
{
    auto& cpu = Cpu::getInstance();
    if (cpu.dispatcher == nullptr) {
        panic("Interrupt before the vector table was installed");
    }

    cpu.dispatcher->dispatch(*context);
}
