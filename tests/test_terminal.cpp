#include <catch2/catch.hpp>

#include "view/terminal.h"

namespace
{
    auto count_of(const std::string& text, const std::string_view needle) -> size_t
    {
        size_t count = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1))
        {
            ++count;
        }
        return count;
    }

    auto solid_frame(const size_t width, const size_t height, const uint32_t color) -> TerminalFrame
    {
        TerminalFrame frame;
        frame.width = width;
        frame.height = height;
        frame.status = "status";
        frame.pixels.assign(width * height, color);
        return frame;
    }
}

TEST_CASE("format_frame draws a full frame without a previous one")
{
    const TerminalFrame frame = solid_frame(3, 4, 0x102030);
    const std::string out = TerminalView::format_frame(frame, nullptr);

    REQUIRE(out.find("status") != std::string::npos);
    REQUIRE(count_of(out, "▀") == 6);
    REQUIRE(out.find("\033[38;2;16;32;48m") != std::string::npos);
    REQUIRE(out.find("\033[48;2;16;32;48m") != std::string::npos);
}

TEST_CASE("format_frame pads and truncates the status line")
{
    TerminalFrame frame = solid_frame(4, 2, 0);
    frame.status = "ab";
    const std::string padded = TerminalView::format_frame(frame, nullptr);
    REQUIRE(padded.find("\033[7mab  \033[0m") != std::string::npos);

    frame.status = "abcdefgh";
    const std::string truncated = TerminalView::format_frame(frame, nullptr);
    REQUIRE(truncated.find("\033[7mabcd\033[0m") != std::string::npos);
}

TEST_CASE("format_frame only redraws changed cells")
{
    const TerminalFrame prev = solid_frame(4, 4, 0x000000);
    TerminalFrame next = prev;

    REQUIRE(count_of(TerminalView::format_frame(next, &prev), "▀") == 0);

    next.pixels[1] = 0xFFFFFF;          // row 0, column 1 (upper half)
    next.pixels[2 * 4 + 3] = 0xFFFFFF;  // row 2, column 3
    const std::string out = TerminalView::format_frame(next, &prev);
    REQUIRE(count_of(out, "▀") == 2);
    REQUIRE(out.find("\033[2;2H") != std::string::npos);
    REQUIRE(out.find("\033[3;4H") != std::string::npos);
}

TEST_CASE("format_frame redraws everything after a resize")
{
    const TerminalFrame prev = solid_frame(2, 2, 0);
    const TerminalFrame next = solid_frame(4, 2, 0);
    REQUIRE(count_of(TerminalView::format_frame(next, &prev), "▀") == 4);
}
