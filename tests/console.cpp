#define BOOST_TEST_MODULE Console
#include <boost/test/unit_test.hpp>

#include <kernel/console.hpp>
#include <array>
#include <string>

namespace {

constexpr auto CellCount = TextScreen::Columns * TextScreen::Rows;

// A screen followed by cells that must never be written.
struct ScreenFixture {
    static constexpr auto Untouched = std::uint16_t(0xDEAD);

    ScreenFixture() : screen(cells.data()) {
        cells.fill(Untouched);
        screen.clear();
    }

    char at(std::size_t row, std::size_t column) const {
        return char(cells[row * TextScreen::Columns + column] & 0xFF);
    }

    void write(const std::string& text) {
        for (auto c : text) {
            screen.write(c);
        }
    }

    bool tailUntouched() const {
        for (auto i = CellCount; i < cells.size(); i++) {
            if (cells[i] != Untouched) {
                return false;
            }
        }
        return true;
    }

    std::array<std::uint16_t, CellCount + TextScreen::Columns> cells;
    TextScreen screen;
};

} // namespace

BOOST_AUTO_TEST_SUITE(console_test)

BOOST_AUTO_TEST_CASE( default_is_both_sinks )
{
    BOOST_CHECK_EQUAL(Console::parseSinks(""), Console::Sink::Both);
    BOOST_CHECK_EQUAL(Console::parseSinks("quiet loglevel=3"), Console::Sink::Both);
}

BOOST_AUTO_TEST_CASE( console_word_selects_sinks )
{
    BOOST_CHECK_EQUAL(Console::parseSinks("console=serial"), Console::Sink::Serial);
    BOOST_CHECK_EQUAL(Console::parseSinks("console=vga"), Console::Sink::Vga);
    BOOST_CHECK_EQUAL(Console::parseSinks("console=both"), Console::Sink::Both);
}

BOOST_AUTO_TEST_CASE( console_word_among_others )
{
    BOOST_CHECK_EQUAL(Console::parseSinks("quiet console=vga debug"), Console::Sink::Vga);
    BOOST_CHECK_EQUAL(Console::parseSinks("debug console=serial"), Console::Sink::Serial);
}

BOOST_AUTO_TEST_CASE( unknown_value_falls_back_to_both )
{
    BOOST_CHECK_EQUAL(Console::parseSinks("console=lpt"), Console::Sink::Both);
    BOOST_CHECK_EQUAL(Console::parseSinks("console= serial"), Console::Sink::Both);
    BOOST_CHECK_EQUAL(Console::parseSinks("console=serialx"), Console::Sink::Both);
}

BOOST_AUTO_TEST_CASE( option_must_be_a_whole_word )
{
    BOOST_CHECK_EQUAL(Console::parseSinks("xconsole=vga"), Console::Sink::Both);
    BOOST_CHECK_EQUAL(Console::parseSinks("xconsole=vga console=serial"), Console::Sink::Serial);
    BOOST_CHECK_EQUAL(Console::parseSinks("console=vga console=serial"), Console::Sink::Serial);
}

BOOST_AUTO_TEST_CASE( screen_wraps_long_lines )
{
    ScreenFixture fixture;
    fixture.write(std::string(TextScreen::Columns, 'a') + "b");

    BOOST_CHECK_EQUAL(fixture.at(0, TextScreen::Columns - 1), 'a');
    BOOST_CHECK_EQUAL(fixture.at(1, 0), 'b');
    BOOST_CHECK_EQUAL(fixture.screen.cursor(), TextScreen::Columns + 1);
}

BOOST_AUTO_TEST_CASE( screen_newline_and_backspace )
{
    ScreenFixture fixture;
    fixture.write("ab\b\nx\b\b");

    BOOST_CHECK_EQUAL(fixture.at(0, 0), 'a');
    BOOST_CHECK_EQUAL(fixture.at(0, 1), ' ');
    BOOST_CHECK_EQUAL(fixture.at(1, 0), ' ');
    // Backspace stops at the start of the line.
    BOOST_CHECK_EQUAL(fixture.screen.cursor(), TextScreen::Columns);
}

BOOST_AUTO_TEST_CASE( screen_scrolls_at_the_bottom )
{
    ScreenFixture fixture;
    for (auto row = std::size_t(0); row < TextScreen::Rows; row++) {
        fixture.write(std::string(1, char('A' + row)) + "\n");
    }

    // Row 0 scrolled away, the cursor sits on a blank last row.
    BOOST_CHECK_EQUAL(fixture.at(0, 0), 'B');
    BOOST_CHECK_EQUAL(fixture.at(TextScreen::Rows - 2, 0), char('A' + TextScreen::Rows - 1));
    BOOST_CHECK_EQUAL(fixture.at(TextScreen::Rows - 1, 0), ' ');
    BOOST_CHECK_EQUAL(fixture.screen.cursor(), (TextScreen::Rows - 1) * TextScreen::Columns);

    // Filling the screen many times over never writes past the last cell.
    fixture.write(std::string(3 * CellCount + 7, 'z'));
    BOOST_CHECK(fixture.screen.cursor() < CellCount);
    BOOST_CHECK_EQUAL(fixture.at(TextScreen::Rows - 1, 6), 'z');
    BOOST_CHECK(fixture.tailUntouched());
}

BOOST_AUTO_TEST_SUITE_END()
