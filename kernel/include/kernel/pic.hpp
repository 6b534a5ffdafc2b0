#pragma once

#include <cstddef>
#include <cstdint>

// The pair of cascaded 8259 interrupt controllers.
class Pic {
public:
    static constexpr auto CascadeIrq  = std::uint8_t(2);
    static constexpr auto KeyboardIrq = std::uint8_t(1);

    // Move IRQ 0-7 to masterOffset and IRQ 8-15 to slaveOffset and mask every line.
    Pic(std::uint8_t masterOffset, std::uint8_t slaveOffset);

    void unmask(std::uint8_t irq);

    /**
     * Acknowledge an interrupt.
     *
     * Spurious interrupts (IRQ 7 or 15 without the in-service bit set) are not acknowledged,
     * except towards the master for a spurious IRQ 15.
     *
     * @returns true if the interrupt was spurious.
     */
    bool notifyEndOfInterrupt(std::uint8_t irq);

    std::size_t spuriousCount() const;

private:
    static constexpr auto MasterCommand = std::uint16_t(0x20);
    static constexpr auto MasterData    = std::uint16_t(0x21);
    static constexpr auto SlaveCommand  = std::uint16_t(0xA0);
    static constexpr auto SlaveData     = std::uint16_t(0xA1);

    std::uint16_t inService();

    std::size_t spurious;
};
