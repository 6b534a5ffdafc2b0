#pragma once

#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <libe/error.hpp>
#include "sync.hpp"

// Print an integer as 0x-prefixed hexadecimal.
struct Hex {
    std::uint64_t value;
};

// Cursor and scrolling over a text mode cell buffer.
class TextScreen {
public:
    static constexpr auto Columns = std::size_t(80);
    static constexpr auto Rows    = std::size_t(25);
    static constexpr auto Color   = std::uint8_t(0x07);

    explicit TextScreen(volatile std::uint16_t* cells);

    void clear();

    void write(char c);

    // Cell the next character goes to.
    std::size_t cursor() const;

private:
    void scroll();

    volatile std::uint16_t* cells;
    std::size_t             column;
    std::size_t             row;
};

// Text output on the first serial port and the VGA text buffer.
class Console {
public:
    struct Sink {
        using Type = std::uint8_t;

        static constexpr auto Serial = Type(1);
        static constexpr auto Vga    = Type(2);
        static constexpr auto Both   = Type(Serial | Vga);
    };

    static constexpr auto VgaBufferAddress = std::uintptr_t(0xB8000);
    static constexpr auto VgaBufferSize    = TextScreen::Columns * TextScreen::Rows * 2;

    static Console& getInstance();

    // Selects sinks from a `console=serial|vga|both` word in the kernel command line.
    // The last such word wins.
    static Sink::Type parseSinks(std::string_view commandLine);

    void initialize(Sink::Type sinks);

    template<typename... Args>
    void log(const Args&... args);

    void write(char c);

    void write(std::string_view text);

    void write(const char* text);

    void write(Hex hex);

    void write(const elib::Error& error);

    template<std::integral T>
    void write(T value);

private:
    Console();

    void writeSerial(char c);

    Sink::Type sinks;
    TextScreen vga;
};

template<typename... Args>
void Console::log(const Args&... args)
{
    (write(args), ...);
    write('\n');
}

template<std::integral T>
void Console::write(T value)
{
    if constexpr (std::same_as<T, bool>) {
        write(value ? "true" : "false");
    } else {
        char buffer[24];
        auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
        write(std::string_view(buffer, result.ptr));
    }
}

// Whole lines only: an interrupt handler logging in between must not split them.
template<typename... Args>
void log(const Args&... args)
{
    InterruptGuard guard;
    Console::getInstance().log(args...);
}
