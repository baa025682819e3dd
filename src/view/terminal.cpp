#include "terminal.h"

#include <sys/ioctl.h>
#include <unistd.h>

namespace {

constexpr std::string_view kRenderChar = "▀";
constexpr std::string_view kEnterAlt = "\033[?1049h\033[?25l\033[0m\033[2J\033[H";
constexpr std::string_view kLeaveAlt = "\033[?25h\033[0m\033[?1049l";
constexpr std::string_view kReset = "\033[0m";

// SGR true-colour sequence, foreground (38) or background (48).
void append_color(std::string& out, int plane, uint32_t color) {
    char buf[24];
    char* const last = buf + sizeof(buf);
    char* it = std::to_chars(buf, last, plane).ptr;
    *it++ = ';';
    *it++ = '2';
    for (int shift = 16; shift >= 0; shift -= 8) {
        *it++ = ';';
        it = std::to_chars(it, last, (color >> shift) & 0xFFu).ptr;
    }
    out += "\033[";
    out.append(buf, static_cast<size_t>(it - buf));
    out += 'm';
}

void move_to(std::string& out, size_t row, size_t col) {
    char buf[48];
    const int n = std::snprintf(buf, sizeof(buf), "\033[%zu;%zuH", row, col);
    if (n > 0) out.append(buf, static_cast<size_t>(n));
}

// Cells [from, to) of the terminal row holding pixel rows y and y + 1.
void emit_cells(std::string& out, const TerminalFrame& frame, size_t y, size_t from, size_t to) {
    const uint32_t* upper = frame.pixels.data() + y * frame.width;
    const uint32_t* lower = upper + frame.width;
    std::optional<uint32_t> fg;
    std::optional<uint32_t> bg;
    move_to(out, y / 2 + 2, from + 1);
    for (size_t x = from; x < to; ++x) {
        if (fg != upper[x]) {
            fg = upper[x];
            append_color(out, 38, *fg);
        }
        if (bg != lower[x]) {
            bg = lower[x];
            append_color(out, 48, *bg);
        }
        out += kRenderChar;
    }
    out += kReset;
}

bool cell_changed(const TerminalFrame& frame, const TerminalFrame& prev, size_t y, size_t x) {
    const size_t upper = y * frame.width + x;
    const size_t lower = upper + frame.width;
    return frame.pixels[upper] != prev.pixels[upper] || frame.pixels[lower] != prev.pixels[lower];
}

} // namespace

TerminalView::TerminalView() {
    update_size();
    write_all(kEnterAlt);
}

TerminalView::~TerminalView() {
    write_all(kLeaveAlt);
}

auto TerminalView::update_size() -> void {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0 || w.ws_row == 0) {
        if (size_.width == 0 || size_.height == 0) {
            size_ = {80, 24};
        }
        return;
    }
    size_ = {w.ws_col, w.ws_row};
}

auto TerminalView::frame_size() const -> TerminalSize {
    if (size_.width == 0 || size_.height < 2) return {};
    return {size_.width, (size_.height - 1) * 2};
}

auto TerminalView::format_frame(const TerminalFrame& frame, const TerminalFrame* prev) -> std::string {
    const size_t width = frame.width;
    const size_t rows = frame.height / 2;

    std::string out;
    out.reserve(width * rows * 20 + width + 32);

    // Status row in reverse video, clipped or padded to the terminal width.
    out += kReset;
    out += "\033[H\033[7m";
    const size_t status_len = std::min(frame.status.size(), width);
    out.append(frame.status, 0, status_len);
    out.append(width - status_len, ' ');
    out += kReset;

    if (frame.pixels.size() < width * rows * 2) {
        return out;
    }

    const bool diff = prev != nullptr && prev->width == width && prev->height == frame.height &&
                      prev->pixels.size() == frame.pixels.size();

    for (size_t row = 0; row < rows; ++row) {
        const size_t y = row * 2;
        if (!diff) {
            emit_cells(out, frame, y, 0, width);
            continue;
        }
        size_t x = 0;
        while (x < width) {
            if (!cell_changed(frame, *prev, y, x)) {
                ++x;
                continue;
            }
            const size_t first = x;
            while (x < width && cell_changed(frame, *prev, y, x)) ++x;
            emit_cells(out, frame, y, first, x);
        }
    }
    return out;
}

auto TerminalView::present(TerminalFrame frame) -> void {
    write_all(format_frame(frame, have_last_ ? &last_frame_ : nullptr));
    last_frame_ = std::move(frame);
    have_last_ = true;
}

auto TerminalView::write_all(std::string_view text) -> void {
    while (!text.empty()) {
        const ssize_t n = ::write(STDOUT_FILENO, text.data(), text.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return;
        }
        text.remove_prefix(static_cast<size_t>(n));
    }
}
