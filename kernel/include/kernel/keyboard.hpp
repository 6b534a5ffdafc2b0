#pragma once

#include <cstdint>
#include <optional>

// Translates PS/2 scancode set 1 into characters for a US layout.
class Keyboard {
public:
    static constexpr auto DataPort = std::uint16_t(0x60);

    std::optional<char> translate(std::uint8_t scancode);

    bool shifted() const;

private:
    static constexpr auto ReleaseBit     = std::uint8_t(0x80);
    static constexpr auto LeftShift      = std::uint8_t(0x2A);
    static constexpr auto RightShift     = std::uint8_t(0x36);
    static constexpr auto CapsLock       = std::uint8_t(0x3A);
    static constexpr auto ExtendedPrefix = std::uint8_t(0xE0);

    bool leftShift  = false;
    bool rightShift = false;
    bool capsLock   = false;
    bool extended   = false;
};
