#pragma once

#include <cstdint>

namespace Port {

    inline void writeByte(std::uint16_t port, std::uint8_t value)
    {
        asm volatile("outb %0, %1" : : "a"(value), "Nd"(port));
    }

    inline std::uint8_t readByte(std::uint16_t port)
    {
        std::uint8_t value;
        asm volatile("inb %1, %0" : "=a"(value) : "Nd"(port));
        return value;
    }

    inline void writeWord(std::uint16_t port, std::uint16_t value)
    {
        asm volatile("outw %0, %1" : : "a"(value), "Nd"(port));
    }

    inline std::uint16_t readWord(std::uint16_t port)
    {
        std::uint16_t value;
        asm volatile("inw %1, %0" : "=a"(value) : "Nd"(port));
        return value;
    }

    inline void writeDoubleWord(std::uint16_t port, std::uint32_t value)
    {
        asm volatile("outl %0, %1" : : "a"(value), "Nd"(port));
    }

    inline std::uint32_t readDoubleWord(std::uint16_t port)
    {
        std::uint32_t value;
        asm volatile("inl %1, %0" : "=a"(value) : "Nd"(port));
        return value;
    }

    // A write to the unused POST port takes long enough for slow devices to settle.
    inline void wait()
    {
        writeByte(0x80, 0);
    }

} // namespace Port
