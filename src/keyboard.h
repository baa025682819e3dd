#pragma once

#include "prelude.hpp"

#include <termios.h>

// Non-canonical, non-echoing, non-blocking stdin while alive. When stdin is
// not a terminal nothing is changed and no keys are read.
struct KeyboardMode
{
    KeyboardMode();
    ~KeyboardMode();

    KeyboardMode(const KeyboardMode&) = delete;
    auto operator=(const KeyboardMode&) -> KeyboardMode& = delete;

    [[nodiscard]]
    auto active() const -> bool
    {
        return saved_termios_.has_value();
    }

    // Appends every byte currently waiting on stdin, returns how many.
    auto drain_into(std::string& buffer) const -> size_t;

private:
    std::optional<termios> saved_termios_;
    int saved_flags_ = -1;
};
