#include "kernel/pic.hpp"
#include "kernel/port.hpp"

namespace {

struct Command {
    using Type = std::uint8_t;

    static constexpr auto Initialize       = Type(0x11); // ICW1: edge triggered, cascade, ICW4 follows.
    static constexpr auto Mode8086         = Type(0x01);
    static constexpr auto EndOfInterrupt   = Type(0x20);
    static constexpr auto ReadInService    = Type(0x0B);
};

} // namespace

Pic::Pic(std::uint8_t masterOffset, std::uint8_t slaveOffset) : spurious(0)
{
    Port::writeByte(MasterCommand, Command::Initialize);
    Port::wait();
    Port::writeByte(SlaveCommand, Command::Initialize);
    Port::wait();
    Port::writeByte(MasterData, masterOffset);
    Port::wait();
    Port::writeByte(SlaveData, slaveOffset);
    Port::wait();
    // The slave hangs off line 2 of the master.
    Port::writeByte(MasterData, 1 << CascadeIrq);
    Port::wait();
    Port::writeByte(SlaveData, CascadeIrq);
    Port::wait();
    Port::writeByte(MasterData, Command::Mode8086);
    Port::wait();
    Port::writeByte(SlaveData, Command::Mode8086);
    Port::wait();

    Port::writeByte(MasterData, 0xFF);
    Port::writeByte(SlaveData, 0xFF);
}

void Pic::unmask(std::uint8_t irq)
{
    auto port = irq < 8 ? MasterData : SlaveData;
    auto bit  = std::uint8_t(1 << (irq % 8));
    Port::writeByte(port, Port::readByte(port) & ~bit);
}

bool Pic::notifyEndOfInterrupt(std::uint8_t irq)
{
    if (irq == 7 || irq == 15) {
        auto isr = inService();
        if (!(isr & (1 << irq))) {
            if (irq == 15) {
                // The master did raise the cascade line.
                Port::writeByte(MasterCommand, Command::EndOfInterrupt);
            }
            spurious++;
            return true;
        }
    }

    if (irq >= 8) {
        Port::writeByte(SlaveCommand, Command::EndOfInterrupt);
    }
    Port::writeByte(MasterCommand, Command::EndOfInterrupt);
    return false;
}

std::size_t Pic::spuriousCount() const
{
    return spurious;
}

std::uint16_t Pic::inService()
{
    Port::writeByte(MasterCommand, Command::ReadInService);
    Port::writeByte(SlaveCommand, Command::ReadInService);
    return std::uint16_t(Port::readByte(SlaveCommand)) << 8 | Port::readByte(MasterCommand);
}
