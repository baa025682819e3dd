#pragma once

#include "../prelude.hpp"

struct TerminalSize
{
    size_t width = 0;
    size_t height = 0;
};

struct TerminalFrame
{
    size_t width = 0;
    size_t height = 0;
    std::string status;
    std::vector<uint32_t> pixels;
};

// Full-screen true-colour output. Each terminal cell shows two pixels with an
// upper half block, so a frame is width x (rows - 1) * 2 pixels under one
// status row.
struct TerminalView
{
    TerminalView();
    ~TerminalView();

    TerminalView(const TerminalView&) = delete;
    auto operator=(const TerminalView&) -> TerminalView& = delete;

    auto update_size() -> void;

    [[nodiscard]]
    auto size() const -> TerminalSize
    {
        return size_;
    }

    // Pixel dimensions a frame must have for the current terminal size.
    [[nodiscard]]
    auto frame_size() const -> TerminalSize;

    auto present(TerminalFrame frame) -> void;

    [[nodiscard]]
    static auto format_frame(const TerminalFrame& frame, const TerminalFrame* prev) -> std::string;

private:
    TerminalSize size_{};
    TerminalFrame last_frame_{};
    bool have_last_ = false;

    static auto write_all(std::string_view text) -> void;
};
