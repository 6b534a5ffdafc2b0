#define BOOST_TEST_MODULE Interrupts
#include <boost/test/unit_test.hpp>

#include <kernel/interrupts.hpp>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Stand-ins for handlers that never return: on the host they leave by throwing.
struct Unhandled : std::runtime_error {
    explicit Unhandled(std::uint64_t vector) : std::runtime_error("unhandled"), vector(vector) {}
    std::uint64_t vector;
};

struct FatalRaised : std::runtime_error {
    FatalRaised() : std::runtime_error("fatal") {}
};

Never throwUnhandled(InterruptContext& context)
{
    throw Unhandled(context.vector);
}

Never throwFatal(InterruptContext&)
{
    throw FatalRaised();
}

std::vector<std::uint64_t> recovered;

void recordVector(InterruptContext& context)
{
    recovered.push_back(context.vector);
}

InterruptContext contextFor(std::uint64_t vector)
{
    InterruptContext context;
    std::memset(&context, 0, sizeof(context));
    context.vector = vector;
    return context;
}

std::vector<std::uintptr_t> fakeStubs(std::size_t count)
{
    std::vector<std::uintptr_t> stubs;
    for (auto vector = std::size_t(0); vector < count; vector++) {
        stubs.push_back(0xFFFF'FFFF'8010'0000 + vector * 16);
    }
    return stubs;
}

} // namespace

BOOST_AUTO_TEST_SUITE(interrupts_test)

BOOST_AUTO_TEST_CASE( gate_descriptor_encoding )
{
    auto gate = makeGateDescriptor(0x1234'5678'9ABC'DEF0, 1, GateType::Interrupt, 1);

    BOOST_CHECK_EQUAL(gate.low & 0xFFFF, 0xDEF0u);
    BOOST_CHECK_EQUAL((gate.low >> 16) & 0xFFFF, 0x08u);
    BOOST_CHECK_EQUAL((gate.low >> 32) & 0x7, 1u);
    BOOST_CHECK_EQUAL((gate.low >> 40) & 0xF, 0xEu);
    BOOST_CHECK((gate.low >> 47) & 1);
    BOOST_CHECK_EQUAL(gate.low >> 48, 0x9ABCu);
    BOOST_CHECK_EQUAL(gate.high, 0x1234'5678u);

    auto trap = makeGateDescriptor(0x1000, 2, GateType::Trap, 0);
    BOOST_CHECK_EQUAL((trap.low >> 40) & 0xF, 0xFu);
    BOOST_CHECK_EQUAL((trap.low >> 32) & 0x7, 0u);
}

BOOST_AUTO_TEST_CASE( descriptor_table_limit )
{
    static IdtDescriptor idt[InterruptDispatcher::VectorCount];
    static std::uint64_t gdt[5];

    auto idtPointer = DescriptorTablePointer::of(idt);
    BOOST_CHECK_EQUAL(idtPointer.limit, 4095u);
    BOOST_CHECK_EQUAL(idtPointer.base, reinterpret_cast<std::uint64_t>(&idt));

    BOOST_CHECK_EQUAL(DescriptorTablePointer::of(gdt).limit, 39u);
    BOOST_CHECK_EQUAL(sizeof(DescriptorTablePointer), 10u);
}

BOOST_AUTO_TEST_CASE( lifecycle )
{
    InterruptDispatcher dispatcher(throwUnhandled);
    std::array<IdtDescriptor, InterruptDispatcher::VectorCount> table{};
    auto stubs = fakeStubs(48);

    BOOST_CHECK(dispatcher.state() == InterruptDispatcher::State::Uninitialized);
    BOOST_CHECK(dispatcher.enable() == NotInstalled);

    BOOST_CHECK(!dispatcher.registerHandler(Vector::Breakpoint, recordVector));
    BOOST_CHECK(!dispatcher.install(table, stubs, 1, 1));
    BOOST_CHECK(dispatcher.state() == InterruptDispatcher::State::Installed);

    BOOST_CHECK(dispatcher.registerHandler(Vector::Keyboard, recordVector) == AlreadyInstalled);
    BOOST_CHECK(dispatcher.install(table, stubs, 1, 1) == AlreadyInstalled);

    BOOST_CHECK(!dispatcher.enable());
    BOOST_CHECK(dispatcher.state() == InterruptDispatcher::State::Enabled);
}

BOOST_AUTO_TEST_CASE( empty_handler_is_rejected )
{
    InterruptDispatcher dispatcher(throwUnhandled);
    BOOST_CHECK(dispatcher.registerHandler(Vector::Keyboard, InterruptHandler()) == elib::InvalidArgument);
    BOOST_CHECK(!dispatcher.handler(Vector::Keyboard));
}

BOOST_AUTO_TEST_CASE( registered_vector_needs_a_stub )
{
    InterruptDispatcher dispatcher(throwUnhandled);
    std::array<IdtDescriptor, InterruptDispatcher::VectorCount> table{};
    auto stubs = fakeStubs(48);

    BOOST_CHECK(!dispatcher.registerHandler(0x80, recordVector));
    BOOST_CHECK(dispatcher.install(table, stubs, 1, 1) == MissingStub);
    BOOST_CHECK(dispatcher.state() == InterruptDispatcher::State::Uninitialized);
}

BOOST_AUTO_TEST_CASE( fatal_handlers_use_the_fault_stack )
{
    InterruptDispatcher dispatcher(throwUnhandled);
    std::array<IdtDescriptor, InterruptDispatcher::VectorCount> table{};
    table.fill(IdtDescriptor{~0ULL, ~0ULL});
    auto stubs = fakeStubs(48);

    BOOST_CHECK(!dispatcher.registerHandler(Vector::DoubleFault, throwFatal));
    BOOST_CHECK(!dispatcher.registerHandler(Vector::Keyboard, recordVector));
    BOOST_CHECK(!dispatcher.install(table, stubs, 1, 2));

    auto doubleFault = table[Vector::DoubleFault];
    auto expected    = makeGateDescriptor(stubs[Vector::DoubleFault], 1, GateType::Interrupt, 2);
    BOOST_CHECK_EQUAL(doubleFault.low, expected.low);
    BOOST_CHECK_EQUAL(doubleFault.high, expected.high);

    auto keyboard = table[Vector::Keyboard];
    BOOST_CHECK_EQUAL((keyboard.low >> 32) & 0x7, 0u);
    BOOST_CHECK((keyboard.low >> 47) & 1);

    // Slots without a handler are not present.
    BOOST_CHECK_EQUAL(table[Vector::Breakpoint].low, 0u);
    BOOST_CHECK_EQUAL(table[0xFF].high, 0u);
}

BOOST_AUTO_TEST_CASE( dispatch_routes_by_vector )
{
    recovered.clear();
    InterruptDispatcher dispatcher(throwUnhandled);
    BOOST_CHECK(!dispatcher.registerHandler(Vector::Breakpoint, recordVector));
    BOOST_CHECK(!dispatcher.registerHandler(Vector::Keyboard, recordVector));
    BOOST_CHECK(!dispatcher.registerHandler(Vector::GeneralProtection, throwFatal));

    BOOST_CHECK(dispatcher.handler(Vector::Keyboard).kind() == InterruptHandler::Kind::Recoverable);
    BOOST_CHECK(dispatcher.handler(Vector::GeneralProtection).kind() == InterruptHandler::Kind::Fatal);

    auto breakpoint = contextFor(Vector::Breakpoint);
    dispatcher.dispatch(breakpoint);
    auto keyboard = contextFor(Vector::Keyboard);
    dispatcher.dispatch(keyboard);
    BOOST_REQUIRE_EQUAL(recovered.size(), 2u);
    BOOST_CHECK_EQUAL(recovered[0], Vector::Breakpoint);
    BOOST_CHECK_EQUAL(recovered[1], Vector::Keyboard);

    auto protection = contextFor(Vector::GeneralProtection);
    BOOST_CHECK_THROW(dispatcher.dispatch(protection), FatalRaised);

    auto unknown = contextFor(Vector::DivideError);
    try {
        dispatcher.dispatch(unknown);
        BOOST_ERROR("unregistered vector was not reported");
    } catch (const Unhandled& unhandled) {
        BOOST_CHECK_EQUAL(unhandled.vector, Vector::DivideError);
    }
}

BOOST_AUTO_TEST_CASE( page_fault_causes )
{
    using ErrorCode = PageFault::ErrorCode;

    BOOST_CHECK((PageFault{0x1000, 0}.cause() == PageFaultCause::NotPresent));
    BOOST_CHECK((PageFault{0x1000, ErrorCode::Write}.cause() == PageFaultCause::NotPresent));
    BOOST_CHECK((PageFault{0x1000, ErrorCode::Present | ErrorCode::Write}.cause() == PageFaultCause::WriteToReadOnly));
    BOOST_CHECK((PageFault{0x1000, ErrorCode::Present}.cause() == PageFaultCause::ProtectionViolation));

    auto fetch = PageFault{0x1000, ErrorCode::Present | ErrorCode::InstructionFetch};
    BOOST_CHECK(fetch.cause() == PageFaultCause::ProtectionViolation);
    BOOST_CHECK(fetch.instructionFetch());

    BOOST_CHECK_EQUAL(std::string(describe(PageFaultCause::WriteToReadOnly)), "write to read-only page");
}

BOOST_AUTO_TEST_CASE( vector_names )
{
    BOOST_CHECK_EQUAL(std::string(vectorName(Vector::PageFault)), "Page fault");
    BOOST_CHECK_EQUAL(std::string(vectorName(Vector::DoubleFault)), "Double fault");
    BOOST_CHECK_EQUAL(std::string(vectorName(25)), "Reserved");
    BOOST_CHECK_EQUAL(std::string(vectorName(Vector::Keyboard)), "Keyboard");
    BOOST_CHECK_EQUAL(std::string(vectorName(Vector::SpuriousMaster)), "Hardware interrupt");
    BOOST_CHECK_EQUAL(std::string(vectorName(0x80)), "Unknown");
}

BOOST_AUTO_TEST_SUITE_END()
