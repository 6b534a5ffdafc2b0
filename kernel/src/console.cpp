#include "kernel/console.hpp"
#include "kernel/port.hpp"

namespace {

struct Serial {
    static constexpr auto Base            = std::uint16_t(0x3F8);
    static constexpr auto Data            = Base;
    static constexpr auto InterruptEnable = std::uint16_t(Base + 1);
    static constexpr auto DivisorHigh     = std::uint16_t(Base + 1);
    static constexpr auto FifoControl     = std::uint16_t(Base + 2);
    static constexpr auto LineControl     = std::uint16_t(Base + 3);
    static constexpr auto ModemControl    = std::uint16_t(Base + 4);
    static constexpr auto LineStatus      = std::uint16_t(Base + 5);

    static constexpr auto DivisorLatch       = std::uint8_t(0x80);
    static constexpr auto EightNoneOne       = std::uint8_t(0x03);
    static constexpr auto EnableFifo         = std::uint8_t(0xC7);
    static constexpr auto ReadyToSend        = std::uint8_t(0x0B);
    static constexpr auto TransmitterEmpty   = std::uint8_t(0x20);
    static constexpr auto Divisor38400Baud   = std::uint8_t(3);
};

constexpr std::uint16_t cell(char c)
{
    return std::uint16_t(TextScreen::Color) << 8 | static_cast<std::uint8_t>(c);
}

} // namespace

TextScreen::TextScreen(volatile std::uint16_t* cells) : cells(cells), column(0), row(0) {}

void TextScreen::clear()
{
    for (auto i = std::size_t(0); i < Columns * Rows; i++) {
        cells[i] = cell(' ');
    }
    column = 0;
    row    = 0;
}

void TextScreen::write(char c)
{
    switch (c) {
    case '\n':
        column = 0;
        row++;
        break;
    case '\b':
        if (column > 0) {
            column--;
            cells[row * Columns + column] = cell(' ');
        }
        break;
    default:
        cells[row * Columns + column] = cell(c);
        column++;
        if (column >= Columns) {
            column = 0;
            row++;
        }
        break;
    }

    if (row >= Rows) {
        scroll();
        row = Rows - 1;
    }
}

std::size_t TextScreen::cursor() const
{
    return row * Columns + column;
}

void TextScreen::scroll()
{
    for (auto i = std::size_t(0); i < Columns * (Rows - 1); i++) {
        cells[i] = cells[i + Columns];
    }
    for (auto i = Columns * (Rows - 1); i < Columns * Rows; i++) {
        cells[i] = cell(' ');
    }
}

Console::Console() : sinks(0), vga(reinterpret_cast<volatile std::uint16_t*>(VgaBufferAddress)) {}

Console& Console::getInstance()
{
    static Console instance;
    return instance;
}

Console::Sink::Type Console::parseSinks(std::string_view commandLine)
{
    constexpr auto key = std::string_view("console=");

    auto sinks = Sink::Both;
    while (!commandLine.empty()) {
        auto end  = commandLine.find(' ');
        auto word = commandLine.substr(0, end);
        commandLine.remove_prefix(end == std::string_view::npos ? commandLine.size() : end + 1);

        if (!word.starts_with(key)) {
            continue;
        }
        word.remove_prefix(key.size());
        if (word == "serial") {
            sinks = Sink::Serial;
        } else if (word == "vga") {
            sinks = Sink::Vga;
        } else {
            sinks = Sink::Both;
        }
    }
    return sinks;
}

void Console::initialize(Sink::Type sinks)
{
    this->sinks = sinks;

    if (sinks & Sink::Serial) {
        Port::writeByte(Serial::InterruptEnable, 0);
        Port::writeByte(Serial::LineControl, Serial::DivisorLatch);
        Port::writeByte(Serial::Data, Serial::Divisor38400Baud);
        Port::writeByte(Serial::DivisorHigh, 0);
        Port::writeByte(Serial::LineControl, Serial::EightNoneOne);
        Port::writeByte(Serial::FifoControl, Serial::EnableFifo);
        Port::writeByte(Serial::ModemControl, Serial::ReadyToSend);
    }

    if (sinks & Sink::Vga) {
        vga.clear();
    }
}

void Console::write(char c)
{
    if (sinks & Sink::Serial) {
        writeSerial(c);
    }
    if (sinks & Sink::Vga) {
        vga.write(c);
    }
}

void Console::write(std::string_view text)
{
    for (auto c : text) {
        write(c);
    }
}

void Console::write(const char* text)
{
    write(std::string_view(text));
}

void Console::write(Hex hex)
{
    static constexpr char digits[] = "0123456789abcdef";

    char buffer[16];
    auto length = std::size_t(0);
    auto value  = hex.value;
    do {
        buffer[sizeof(buffer) - 1 - length++] = digits[value & 0xF];
        value >>= 4;
    } while (value != 0);

    write("0x");
    write(std::string_view(buffer + sizeof(buffer) - length, length));
}

void Console::write(const elib::Error& error)
{
    write(error.categoryName());
    write(": ");
    write(error.description());
}

void Console::writeSerial(char c)
{
    if (c == '\n') {
        writeSerial('\r');
    }
    while (!(Port::readByte(Serial::LineStatus) & Serial::TransmitterEmpty)) {
    }
    Port::writeByte(Serial::Data, static_cast<std::uint8_t>(c));
}
