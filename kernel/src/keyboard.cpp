#include "kernel/keyboard.hpp"
#include <array>

namespace {

// Indexed by make code; zero marks keys without a character.
constexpr std::array<char, 128> usLayout = {
    0,    27,  '1', '2', '3',  '4', '5', '6', '7', '8', '9', '0', '-', '=', '\b', '\t',
    'q',  'w', 'e', 'r', 't',  'y', 'u', 'i', 'o', 'p', '[', ']', '\n', 0,  'a',  's',
    'd',  'f', 'g', 'h', 'j',  'k', 'l', ';', '\'', '`', 0, '\\', 'z', 'x', 'c', 'v',
    'b',  'n', 'm', ',', '.',  '/', 0,   '*', 0,   ' ', 0,   0,   0,   0,   0,    0,
    0,    0,   0,   0,   0,    0,   0,   '7', '8', '9', '-', '4', '5', '6', '+', '1',
    '2',  '3', '0', '.', 0,    0,   0,   0,   0,
};

constexpr std::array<char, 128> usLayoutShifted = {
    0,    27,  '!', '@', '#',  '$', '%', '^', '&', '*', '(', ')', '_', '+', '\b', '\t',
    'Q',  'W', 'E', 'R', 'T',  'Y', 'U', 'I', 'O', 'P', '{', '}', '\n', 0,  'A',  'S',
    'D',  'F', 'G', 'H', 'J',  'K', 'L', ':', '"', '~', 0,   '|', 'Z', 'X', 'C', 'V',
    'B',  'N', 'M', '<', '>',  '?', 0,   '*', 0,   ' ', 0,   0,   0,   0,   0,    0,
    0,    0,   0,   0,   0,    0,   0,   '7', '8', '9', '-', '4', '5', '6', '+', '1',
    '2',  '3', '0', '.', 0,    0,   0,   0,   0,
};

bool isLetter(char c)
{
    return c >= 'a' && c <= 'z';
}

} // namespace

std::optional<char> Keyboard::translate(std::uint8_t scancode)
{
    if (scancode == ExtendedPrefix) {
        extended = true;
        return {};
    }
    // Extended keys (arrows, right control, ...) produce no characters.
    if (extended) {
        extended = false;
        return {};
    }

    auto released = (scancode & ReleaseBit) != 0;
    auto key      = std::uint8_t(scancode & ~ReleaseBit);

    switch (key) {
    case LeftShift:
        leftShift = !released;
        return {};
    case RightShift:
        rightShift = !released;
        return {};
    case CapsLock:
        if (!released) {
            capsLock = !capsLock;
        }
        return {};
    default:
        break;
    }

    if (released) {
        return {};
    }

    auto plain = usLayout[key];
    if (plain == 0) {
        return {};
    }

    // Caps lock only affects letters and is inverted by shift.
    auto upper = shifted();
    if (isLetter(plain) && capsLock) {
        upper = !upper;
    }
    return upper ? usLayoutShifted[key] : plain;
}

bool Keyboard::shifted() const
{
    return leftShift || rightShift;
}
