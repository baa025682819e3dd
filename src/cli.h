#pragma once

#include "bake/settings.h"
#include "log.h"

struct AppOptions
{
    std::string scene = "pillars";
    uint64_t samples = 0;
    bool headless = false;
    std::string output;
    LogLevel log_level = LogLevel::Info;
    BakeSettings settings{};
};

enum class CliStatus
{
    Parsed,
    ShowHelp,
    ShowVersion,
    Invalid
};

struct CliParse
{
    CliStatus status = CliStatus::Invalid;
    AppOptions options{};
    std::string error;
};

struct CommandLine
{
    static constexpr std::string_view kVersion = "1.0.0";

    // argv follows the usual main() contract: argv[0] is the program name and
    // argv[argc] is null. getopt state is reset on every call.
    [[nodiscard]]
    static auto parse(int argc, char** argv) -> CliParse;

    [[nodiscard]]
    static auto usage(std::string_view program) -> std::string;

    [[nodiscard]]
    static auto parse_vec3(std::string_view text) -> std::optional<Vec3>;
};
