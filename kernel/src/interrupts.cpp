#include "kernel/interrupts.hpp"

const char* vectorName(Vector::Type vector)
{
    static constexpr const char* exceptionNames[] = {
        "Divide error",
        "Debug",
        "Non-maskable interrupt",
        "Breakpoint",
        "Overflow",
        "Bound range exceeded",
        "Invalid opcode",
        "Device not available",
        "Double fault",
        "Coprocessor segment overrun",
        "Invalid TSS",
        "Segment not present",
        "Stack segment fault",
        "General protection fault",
        "Page fault",
        "Reserved",
        "x87 floating point exception",
        "Alignment check",
        "Machine check",
        "SIMD floating point exception",
        "Virtualization exception",
        "Control protection exception",
    };

    if (vector < std::size(exceptionNames)) {
        return exceptionNames[vector];
    }
    if (vector < Vector::HardwareInterruptBase) {
        return "Reserved";
    }
    if (vector == Vector::Keyboard) {
        return "Keyboard";
    }
    if (vector < Vector::HardwareInterruptBase + 16) {
        return "Hardware interrupt";
    }
    return "Unknown";
}

PageFaultCause PageFault::cause() const
{
    if (!(errorCode & ErrorCode::Present)) {
        return PageFaultCause::NotPresent;
    }
    if (errorCode & ErrorCode::Write) {
        return PageFaultCause::WriteToReadOnly;
    }
    return PageFaultCause::ProtectionViolation;
}

const char* describe(PageFaultCause cause)
{
    switch (cause) {
    case PageFaultCause::NotPresent:
        return "page not present";
    case PageFaultCause::ProtectionViolation:
        return "protection violation";
    case PageFaultCause::WriteToReadOnly:
        return "write to read-only page";
    }
    return "unknown";
}

InterruptDispatcher::InterruptDispatcher(FatalHandler fallback) :
    handlers{}, fallback(fallback), _state(State::Uninitialized)
{}

std::optional<elib::Error> InterruptDispatcher::registerHandler(Vector::Type vector, InterruptHandler handler)
{
    if (_state != State::Uninitialized) {
        return AlreadyInstalled;
    }
    if (!handler) {
        return elib::InvalidArgument;
    }

    handlers[vector] = handler;
    return {};
}

std::optional<elib::Error> InterruptDispatcher::install(
    std::span<IdtDescriptor, VectorCount> table,
    std::span<const std::uintptr_t>       stubs,
    std::uint16_t                         codeSegmentIndex,
    std::uint8_t                          faultStackIndex
)
{
    if (_state != State::Uninitialized) {
        return AlreadyInstalled;
    }

    for (auto vector = std::size_t(0); vector < VectorCount; vector++) {
        if (handlers[vector] && vector >= stubs.size()) {
            return MissingStub;
        }
    }

    for (auto vector = std::size_t(0); vector < VectorCount; vector++) {
        const auto& handler = handlers[vector];
        if (!handler) {
            table[vector] = IdtDescriptor{0, 0};
            continue;
        }

        auto istIndex = handler.kind() == InterruptHandler::Kind::Fatal ? faultStackIndex : std::uint8_t(0);
        table[vector] = makeGateDescriptor(stubs[vector], codeSegmentIndex, GateType::Interrupt, istIndex);
    }

    _state = State::Installed;
    return {};
}

std::optional<elib::Error> InterruptDispatcher::enable()
{
    if (_state == State::Uninitialized) {
        return NotInstalled;
    }

    _state = State::Enabled;
    return {};
}

void InterruptDispatcher::dispatch(InterruptContext& context) const
{
    const auto& handler = handlers[context.vector % VectorCount];
    switch (handler.kind()) {
    case InterruptHandler::Kind::Recoverable:
        handler.recoverable(context);
        return;
    case InterruptHandler::Kind::Fatal:
        handler.fatal(context);
        break;
    case InterruptHandler::Kind::None:
        fallback(context);
        break;
    }
}

InterruptDispatcher::State InterruptDispatcher::state() const
{
    return _state;
}

const InterruptHandler& InterruptDispatcher::handler(Vector::Type vector) const
{
    return handlers[vector];
}
