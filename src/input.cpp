#include "input.h"

#include <cctype>

auto InputParser::key_to_action(const int ch) -> InputAction
{
    if (ch < 0 || ch > 0xFF)
    {
        return InputAction::None;
    }
    const int key = std::tolower(ch);
    switch (key)
    {
        case 'w': return InputAction::OrbitUp;
        case 's': return InputAction::OrbitDown;
        case 'a': return InputAction::OrbitLeft;
        case 'd': return InputAction::OrbitRight;
        case 'r': return InputAction::ZoomIn;
        case 'f': return InputAction::ZoomOut;
        case 'm': return InputAction::ToggleView;
        case 'p': return InputAction::TogglePause;
        case 'q': return InputAction::Quit;
    }
    return InputAction::None;
}

auto InputParser::parse_csi_key(const std::string_view buffer) -> InputParse
{
    // Cursor keys in normal mode: ESC [ A..D.
    static constexpr std::string_view kIntroducer = "\x1b[";
    static constexpr std::array<std::pair<char, InputAction>, 4> kArrows{{
        {'A', InputAction::OrbitUp},
        {'B', InputAction::OrbitDown},
        {'C', InputAction::OrbitRight},
        {'D', InputAction::OrbitLeft}
    }};

    const size_t prefix = std::min(buffer.size(), kIntroducer.size());
    if (buffer.substr(0, prefix) != kIntroducer.substr(0, prefix))
    {
        return {ParseResult::Invalid, 0, InputAction::None};
    }
    if (buffer.size() <= kIntroducer.size())
    {
        return {ParseResult::NeedMore, 0, InputAction::None};
    }

    const char final_byte = buffer[kIntroducer.size()];
    for (const auto& [key, action] : kArrows)
    {
        if (key == final_byte)
        {
            return {ParseResult::Parsed, kIntroducer.size() + 1, action};
        }
    }
    return {ParseResult::Invalid, 0, InputAction::None};
}

auto InputParser::drain(std::string& buffer) -> std::vector<InputAction>
{
    std::vector<InputAction> actions;
    size_t offset = 0;
    while (offset < buffer.size())
    {
        if (buffer[offset] == '\x1b')
        {
            std::string_view view(buffer);
            view.remove_prefix(offset);

            const InputParse key_result = parse_csi_key(view);
            if (key_result.result == ParseResult::NeedMore) break;
            if (key_result.result == ParseResult::Parsed)
            {
                offset += key_result.consumed;
                actions.push_back(key_result.action);
                continue;
            }
        }

        const InputAction action = key_to_action(static_cast<unsigned char>(buffer[offset]));
        offset++;
        if (action != InputAction::None)
        {
            actions.push_back(action);
        }
    }

    if (offset > 0)
    {
        buffer.erase(0, offset);
    }
    return actions;
}
