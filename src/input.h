#pragma once

#include "prelude.hpp"

enum class InputAction
{
    None,
    Quit,
    TogglePause,
    ToggleView,
    OrbitLeft,
    OrbitRight,
    OrbitUp,
    OrbitDown,
    ZoomIn,
    ZoomOut
};

enum class ParseResult
{
    Parsed,
    NeedMore,
    Invalid
};

struct InputParse
{
    ParseResult result = ParseResult::Invalid;
    size_t consumed = 0;
    InputAction action = InputAction::None;
};

struct InputParser
{
    [[nodiscard]]
    static auto key_to_action(int ch) -> InputAction;
    [[nodiscard]]
    static auto parse_csi_key(std::string_view buffer) -> InputParse;

    // Decodes every complete key in buffer and erases the consumed bytes. An
    // escape sequence that is still arriving stays in the buffer.
    static auto drain(std::string& buffer) -> std::vector<InputAction>;
};
