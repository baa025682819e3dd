#include <catch2/catch.hpp>

#include "input.h"

TEST_CASE("key_to_action maps quit keys")
{
    REQUIRE(InputParser::key_to_action('q') == InputAction::Quit);
    REQUIRE(InputParser::key_to_action('Q') == InputAction::Quit);
    REQUIRE(InputParser::key_to_action('x') == InputAction::None);
    REQUIRE(InputParser::key_to_action(-1) == InputAction::None);
}

TEST_CASE("key_to_action maps pause and view toggles")
{
    REQUIRE(InputParser::key_to_action('p') == InputAction::TogglePause);
    REQUIRE(InputParser::key_to_action('P') == InputAction::TogglePause);
    REQUIRE(InputParser::key_to_action('m') == InputAction::ToggleView);
    REQUIRE(InputParser::key_to_action('M') == InputAction::ToggleView);
}

TEST_CASE("key_to_action maps orbit and zoom keys")
{
    REQUIRE(InputParser::key_to_action('w') == InputAction::OrbitUp);
    REQUIRE(InputParser::key_to_action('s') == InputAction::OrbitDown);
    REQUIRE(InputParser::key_to_action('a') == InputAction::OrbitLeft);
    REQUIRE(InputParser::key_to_action('d') == InputAction::OrbitRight);
    REQUIRE(InputParser::key_to_action('r') == InputAction::ZoomIn);
    REQUIRE(InputParser::key_to_action('f') == InputAction::ZoomOut);
}

TEST_CASE("parse_csi_key maps arrow keys")
{
    const InputParse up = InputParser::parse_csi_key("\x1b[A");
    REQUIRE(up.result == ParseResult::Parsed);
    REQUIRE(up.consumed == 3);
    REQUIRE(up.action == InputAction::OrbitUp);

    REQUIRE(InputParser::parse_csi_key("\x1b[B").action == InputAction::OrbitDown);
    REQUIRE(InputParser::parse_csi_key("\x1b[C").action == InputAction::OrbitRight);
    REQUIRE(InputParser::parse_csi_key("\x1b[D").action == InputAction::OrbitLeft);
}

TEST_CASE("parse_csi_key waits for incomplete sequences")
{
    REQUIRE(InputParser::parse_csi_key("\x1b").result == ParseResult::NeedMore);
    REQUIRE(InputParser::parse_csi_key("\x1b[").result == ParseResult::NeedMore);
}

TEST_CASE("parse_csi_key rejects other sequences")
{
    REQUIRE(InputParser::parse_csi_key("ab").result == ParseResult::Invalid);
    REQUIRE(InputParser::parse_csi_key("\x1b[Z").result == ParseResult::Invalid);
    REQUIRE(InputParser::parse_csi_key("\x1bOA").result == ParseResult::Invalid);
}

TEST_CASE("parse_csi_key only consumes the first key")
{
    const InputParse parsed = InputParser::parse_csi_key("\x1b[Cq");
    REQUIRE(parsed.result == ParseResult::Parsed);
    REQUIRE(parsed.consumed == 3);
    REQUIRE(parsed.action == InputAction::OrbitRight);
}

TEST_CASE("drain decodes mixed keys and arrows in order")
{
    std::string buffer = "m\x1b[Dxq";
    const std::vector<InputAction> actions = InputParser::drain(buffer);
    const std::vector<InputAction> expected{InputAction::ToggleView, InputAction::OrbitLeft, InputAction::Quit};
    REQUIRE(actions == expected);
    REQUIRE(buffer.empty());
}

TEST_CASE("drain keeps a partial escape sequence for the next read")
{
    std::string buffer = "p\x1b[";
    const std::vector<InputAction> actions = InputParser::drain(buffer);
    REQUIRE(actions.size() == 1);
    REQUIRE(actions[0] == InputAction::TogglePause);
    REQUIRE(buffer == "\x1b[");

    buffer += "A";
    const std::vector<InputAction> rest = InputParser::drain(buffer);
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0] == InputAction::OrbitUp);
    REQUIRE(buffer.empty());
}

TEST_CASE("drain treats a lone unknown escape sequence as plain bytes")
{
    std::string buffer = "\x1b[Zr";
    const std::vector<InputAction> actions = InputParser::drain(buffer);
    REQUIRE(actions.size() == 1);
    REQUIRE(actions[0] == InputAction::ZoomIn);
    REQUIRE(buffer.empty());
}
