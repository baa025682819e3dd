#include <catch2/catch.hpp>

#include "cli.h"

namespace
{
    struct Args
    {
        Args(std::initializer_list<const char*> args)
        {
            storage.emplace_back("baketm");
            for (const char* arg : args)
            {
                storage.emplace_back(arg);
            }
            for (std::string& arg : storage)
            {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
        }

        auto parse() -> CliParse
        {
            return CommandLine::parse(static_cast<int>(storage.size()), argv.data());
        }

        std::vector<std::string> storage;
        std::vector<char*> argv;
    };
}

TEST_CASE("no arguments give the interactive defaults")
{
    const CliParse parse = Args{}.parse();
    REQUIRE(parse.status == CliStatus::Parsed);
    REQUIRE(parse.options.scene == "pillars");
    REQUIRE(parse.options.samples == 0);
    REQUIRE_FALSE(parse.options.headless);
    REQUIRE(parse.options.output.empty());
    REQUIRE(parse.options.log_level == LogLevel::Info);
    REQUIRE(parse.options.settings.atlas.texels_per_cell == 8);
    REQUIRE(parse.options.settings.depth.resolution == 512);
}

TEST_CASE("short and long options fill the settings")
{
    const CliParse parse = Args{"-s", "open", "-n", "16", "--texels=4", "-d", "128",
                                "--key-light=0,1,0.5", "-j", "0.1", "--forward-bias=0.05",
                                "--depth-bias=-0.001", "--seed=9", "-o", "out.png", "-H", "-q"}.parse();
    REQUIRE(parse.status == CliStatus::Parsed);

    const AppOptions& opts = parse.options;
    REQUIRE(opts.scene == "open");
    REQUIRE(opts.samples == 16);
    REQUIRE(opts.settings.atlas.texels_per_cell == 4);
    REQUIRE(opts.settings.depth.resolution == 128);
    REQUIRE(opts.settings.sampler.key_light.y == Catch::Detail::Approx(1.0));
    REQUIRE(opts.settings.sampler.key_light.z == Catch::Detail::Approx(0.5));
    REQUIRE(opts.settings.sampler.jitter_radius == Catch::Detail::Approx(0.1));
    REQUIRE(opts.settings.shadow.forward_bias == Catch::Detail::Approx(0.05));
    REQUIRE(opts.settings.shadow.depth_bias == Catch::Detail::Approx(-0.001));
    REQUIRE(opts.settings.sampler.seed == 9);
    REQUIRE(opts.output == "out.png");
    REQUIRE(opts.headless);
    REQUIRE(opts.log_level == LogLevel::Error);
}

TEST_CASE("verbose raises the log level")
{
    const CliParse parse = Args{"--verbose"}.parse();
    REQUIRE(parse.status == CliStatus::Parsed);
    REQUIRE(parse.options.log_level == LogLevel::Debug);
}

TEST_CASE("help and version stop parsing")
{
    REQUIRE(Args{"--help"}.parse().status == CliStatus::ShowHelp);
    REQUIRE(Args{"-V"}.parse().status == CliStatus::ShowVersion);
    REQUIRE(Args{"--version", "--bogus"}.parse().status == CliStatus::ShowVersion);
}

TEST_CASE("malformed options are rejected")
{
    REQUIRE(Args{"--bogus"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"-n"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"-n", "many"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"-t", "4x"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"-k", "1,2"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"-k", "1,2,3,4"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"--scene=cathedral"}.parse().status == CliStatus::Invalid);
    REQUIRE(Args{"stray"}.parse().status == CliStatus::Invalid);
}

TEST_CASE("headless runs need a sample count")
{
    const CliParse parse = Args{"--headless"}.parse();
    REQUIRE(parse.status == CliStatus::Invalid);
    REQUIRE_FALSE(parse.error.empty());

    REQUIRE(Args{"--headless", "-n", "4"}.parse().status == CliStatus::Parsed);
}

TEST_CASE("parse_vec3 reads three comma separated numbers")
{
    const auto v = CommandLine::parse_vec3("0.5,-1,2e-1");
    REQUIRE(v.has_value());
    REQUIRE(v->x == Catch::Detail::Approx(0.5));
    REQUIRE(v->y == Catch::Detail::Approx(-1.0));
    REQUIRE(v->z == Catch::Detail::Approx(0.2));

    REQUIRE_FALSE(CommandLine::parse_vec3("").has_value());
    REQUIRE_FALSE(CommandLine::parse_vec3("1,,2").has_value());
    REQUIRE_FALSE(CommandLine::parse_vec3("1,2,").has_value());
}

TEST_CASE("usage lists every option")
{
    const std::string text = CommandLine::usage("baketm");
    for (const char* option : {"--scene", "--samples", "--texels", "--depth-size", "--key-light",
                               "--jitter", "--forward-bias", "--depth-bias", "--seed", "--output",
                               "--headless", "--verbose", "--quiet", "--version", "--help"})
    {
        REQUIRE(text.find(option) != std::string::npos);
    }
}
