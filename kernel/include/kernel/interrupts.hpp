#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <libe/error.hpp>
#include "panic.hpp"

struct InterruptErrorCategory : elib::ErrorCategory {};
inline constexpr auto interruptErrorCategory = InterruptErrorCategory{{"interrupts"}};

inline constexpr auto AlreadyInstalled = elib::Error{-1, &interruptErrorCategory, "vector table already installed"};
inline constexpr auto NotInstalled = elib::Error{-2, &interruptErrorCategory, "vector table not installed"};
inline constexpr auto MissingStub = elib::Error{-3, &interruptErrorCategory, "no entry stub for vector"};

struct Vector {
    using Type = std::uint8_t;

    static constexpr auto DivideError                = Type(0);
    static constexpr auto Debug                      = Type(1);
    static constexpr auto NonMaskableInterrupt       = Type(2);
    static constexpr auto Breakpoint                 = Type(3);
    static constexpr auto Overflow                   = Type(4);
    static constexpr auto BoundRangeExceeded         = Type(5);
    static constexpr auto InvalidOpcode              = Type(6);
    static constexpr auto DeviceNotAvailable         = Type(7);
    static constexpr auto DoubleFault                = Type(8);
    static constexpr auto InvalidTss                 = Type(10);
    static constexpr auto SegmentNotPresent          = Type(11);
    static constexpr auto StackSegmentFault          = Type(12);
    static constexpr auto GeneralProtection          = Type(13);
    static constexpr auto PageFault                  = Type(14);
    static constexpr auto X87FloatingPoint           = Type(16);
    static constexpr auto AlignmentCheck             = Type(17);
    static constexpr auto MachineCheck               = Type(18);
    static constexpr auto SimdFloatingPoint          = Type(19);
    static constexpr auto HardwareInterruptBase      = Type(32);
    static constexpr auto Keyboard                   = Type(HardwareInterruptBase + 1);
    static constexpr auto SpuriousMaster             = Type(HardwareInterruptBase + 7);
    static constexpr auto SpuriousSlave              = Type(HardwareInterruptBase + 15);
};

const char* vectorName(Vector::Type vector);

// Register block pushed by the entry stubs, lowest address first.
struct InterruptContext {
    std::uint64_t r15;
    std::uint64_t r14;
    std::uint64_t r13;
    std::uint64_t r12;
    std::uint64_t r11;
    std::uint64_t r10;
    std::uint64_t r9;
    std::uint64_t r8;
    std::uint64_t rbp;
    std::uint64_t rdi;
    std::uint64_t rsi;
    std::uint64_t rdx;
    std::uint64_t rcx;
    std::uint64_t rbx;
    std::uint64_t rax;
    std::uint64_t vector;
    std::uint64_t errorCode;
    // Pushed by the processor.
    std::uint64_t rip;
    std::uint64_t cs;
    std::uint64_t rflags;
    std::uint64_t rsp;
    std::uint64_t ss;
};

// Assert no padding, otherwise assembler code will break.
static_assert(sizeof(InterruptContext) == 22 * sizeof(std::uint64_t));

enum class PageFaultCause {
    NotPresent,
    ProtectionViolation,
    WriteToReadOnly
};

struct PageFault {
    struct ErrorCode {
        using Type = std::uint64_t;

        static constexpr auto Present          = Type(1);
        static constexpr auto Write            = Type(1) << 1;
        static constexpr auto User             = Type(1) << 2;
        static constexpr auto ReservedBit      = Type(1) << 3;
        static constexpr auto InstructionFetch = Type(1) << 4;
    };

    std::uintptr_t  address;
    ErrorCode::Type errorCode;

    PageFaultCause cause() const;

    bool instructionFetch() const {
        return errorCode & ErrorCode::InstructionFetch;
    }
};

const char* describe(PageFaultCause cause);

enum class GateType : std::uint8_t {
    Interrupt = 0xe,
    Trap      = 0xf
};

struct IdtDescriptor {
    std::uint64_t low;
    std::uint64_t high;
};

// Operand of lgdt and lidt. The limit is the offset of the last valid byte.
struct __attribute__((packed)) DescriptorTablePointer {
    std::uint16_t limit;
    std::uint64_t base;

    template<typename T, std::size_t N>
    static DescriptorTablePointer of(const T (&table)[N]) {
        static_assert(sizeof(table) - 1 <= 0xffff);
        return {std::uint16_t(sizeof(table) - 1), reinterpret_cast<std::uint64_t>(&table)};
    }
};

constexpr IdtDescriptor
makeGateDescriptor(std::uintptr_t isrAddress, std::uint16_t codeSegmentIndex, GateType gateType, std::uint8_t istIndex)
{
    auto codesegmentSelector = codeSegmentIndex << 3;

    auto low = isrAddress & 0xffff;
    low |= std::uint64_t(codesegmentSelector) << 16;
    low |= std::uint64_t(istIndex & 7) << 32;
    low |= (static_cast<std::uint64_t>(gateType) & 0xf) << 40;
    low |= std::uint64_t(1) << 47;
    low |= (isrAddress & 0xffff0000) >> 16 << 48;

    auto high = isrAddress >> 32;
    return {low, high};
}

using RecoverableHandler = void (*)(InterruptContext& context);
using FatalHandler       = Never (*)(InterruptContext& context);

// A vector slot: empty, a handler that resumes the interrupted code, or one that never does.
class InterruptHandler {
public:
    enum class Kind {
        None,
        Recoverable,
        Fatal
    };

    constexpr InterruptHandler() : _kind(Kind::None), recoverable(nullptr), fatal(nullptr) {}

    constexpr InterruptHandler(RecoverableHandler handler) :
        _kind(Kind::Recoverable), recoverable(handler), fatal(nullptr) {}

    constexpr InterruptHandler(FatalHandler handler) : _kind(Kind::Fatal), recoverable(nullptr), fatal(handler) {}

    constexpr Kind kind() const {
        return _kind;
    }

    constexpr explicit operator bool() const {
        return _kind != Kind::None;
    }

private:
    friend class InterruptDispatcher;

    Kind               _kind;
    RecoverableHandler recoverable;
    FatalHandler       fatal;
};

class InterruptDispatcher {
public:
    static constexpr auto VectorCount = std::size_t(256);

    enum class State {
        Uninitialized,
        Installed,
        Enabled
    };

    explicit InterruptDispatcher(FatalHandler fallback);

    // Only possible before install(); the table is immutable afterwards.
    std::optional<elib::Error> registerHandler(Vector::Type vector, InterruptHandler handler);

    /**
     * Fill the descriptor table for every registered vector.
     *
     * Fatal handlers run on the interrupt stack table entry faultStackIndex so they work
     * even when the kernel stack is gone.
     *
     * @param stubs Entry stub addresses indexed by vector.
     */
    std::optional<elib::Error> install(
        std::span<IdtDescriptor, VectorCount> table,
        std::span<const std::uintptr_t>       stubs,
        std::uint16_t                         codeSegmentIndex,
        std::uint8_t                          faultStackIndex
    );

    std::optional<elib::Error> enable();

    void dispatch(InterruptContext& context) const;

    State state() const;

    const InterruptHandler& handler(Vector::Type vector) const;

private:
    std::array<InterruptHandler, VectorCount> handlers;
    FatalHandler                              fallback;
    State                                     _state;
};
