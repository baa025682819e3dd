#include "cli.h"

#include "bake/scene.h"

#include <getopt.h>

namespace
{
    enum LongOnly
    {
        OptHelp = 1000,
        OptForwardBias,
        OptDepthBias,
        OptSeed
    };

    const option long_opts[] =
    {
        {"scene",        required_argument, nullptr, 's'},
        {"samples",      required_argument, nullptr, 'n'},
        {"texels",       required_argument, nullptr, 't'},
        {"depth-size",   required_argument, nullptr, 'd'},
        {"key-light",    required_argument, nullptr, 'k'},
        {"jitter",       required_argument, nullptr, 'j'},
        {"forward-bias", required_argument, nullptr, OptForwardBias},
        {"depth-bias",   required_argument, nullptr, OptDepthBias},
        {"seed",         required_argument, nullptr, OptSeed},
        {"output",       required_argument, nullptr, 'o'},
        {"headless",     no_argument,       nullptr, 'H'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {"quiet",        no_argument,       nullptr, 'q'},
        {"version",      no_argument,       nullptr, 'V'},
        {"help",         no_argument,       nullptr, OptHelp},
        {nullptr, 0, nullptr, 0}
    };

    constexpr char short_opts[] = ":s:n:t:d:k:j:o:HvqV";

    template <typename T>
    auto parse_number(const std::string_view text) -> std::optional<T>
    {
        T value{};
        const char* first = text.data();
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last || text.empty())
        {
            return std::nullopt;
        }
        return value;
    }

    auto invalid(CliParse& parse, std::string message) -> CliParse&
    {
        parse.status = CliStatus::Invalid;
        parse.error = std::move(message);
        return parse;
    }
}

auto CommandLine::parse_vec3(const std::string_view text) -> std::optional<Vec3>
{
    std::array<double, 3> parts{};
    size_t start = 0;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        const size_t comma = text.find(',', start);
        const bool last = i + 1 == parts.size();
        if (last != (comma == std::string_view::npos))
        {
            return std::nullopt;
        }
        const size_t end = last ? text.size() : comma;
        const auto value = parse_number<double>(text.substr(start, end - start));
        if (!value)
        {
            return std::nullopt;
        }
        parts[i] = *value;
        start = end + 1;
    }
    return Vec3{parts[0], parts[1], parts[2]};
}

auto CommandLine::parse(const int argc, char** argv) -> CliParse
{
    CliParse parse{};
    AppOptions& opts = parse.options;

    optind = 0;
    opterr = 0;

    int ch = 0;
    while ((ch = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1)
    {
        const std::string_view arg = optarg != nullptr ? std::string_view(optarg) : std::string_view();
        switch (ch)
        {
            case 's':
                opts.scene = std::string(arg);
                break;
            case 'n':
            {
                const auto value = parse_number<uint64_t>(arg);
                if (!value) return invalid(parse, "invalid sample count '" + std::string(arg) + "'");
                opts.samples = *value;
                break;
            }
            case 't':
            {
                const auto value = parse_number<int>(arg);
                if (!value) return invalid(parse, "invalid texel count '" + std::string(arg) + "'");
                opts.settings.atlas.texels_per_cell = *value;
                break;
            }
            case 'd':
            {
                const auto value = parse_number<int>(arg);
                if (!value) return invalid(parse, "invalid depth size '" + std::string(arg) + "'");
                opts.settings.depth.resolution = *value;
                break;
            }
            case 'k':
            {
                const auto value = parse_vec3(arg);
                if (!value) return invalid(parse, "key light must be X,Y,Z, got '" + std::string(arg) + "'");
                opts.settings.sampler.key_light = *value;
                break;
            }
            case 'j':
            {
                const auto value = parse_number<double>(arg);
                if (!value) return invalid(parse, "invalid jitter radius '" + std::string(arg) + "'");
                opts.settings.sampler.jitter_radius = *value;
                break;
            }
            case OptForwardBias:
            {
                const auto value = parse_number<double>(arg);
                if (!value) return invalid(parse, "invalid forward bias '" + std::string(arg) + "'");
                opts.settings.shadow.forward_bias = *value;
                break;
            }
            case OptDepthBias:
            {
                const auto value = parse_number<double>(arg);
                if (!value) return invalid(parse, "invalid depth bias '" + std::string(arg) + "'");
                opts.settings.shadow.depth_bias = *value;
                break;
            }
            case OptSeed:
            {
                const auto value = parse_number<uint32_t>(arg);
                if (!value) return invalid(parse, "invalid seed '" + std::string(arg) + "'");
                opts.settings.sampler.seed = *value;
                break;
            }
            case 'o':
                opts.output = std::string(arg);
                break;
            case 'H':
                opts.headless = true;
                break;
            case 'v':
                opts.log_level = LogLevel::Debug;
                break;
            case 'q':
                opts.log_level = LogLevel::Error;
                break;
            case 'V':
                parse.status = CliStatus::ShowVersion;
                return parse;
            case OptHelp:
                parse.status = CliStatus::ShowHelp;
                return parse;
            case ':':
                return invalid(parse, std::string("missing argument for ") + argv[optind - 1]);
            default:
                return invalid(parse, std::string("unrecognized option ") + argv[optind - 1]);
        }
    }

    if (optind < argc)
    {
        return invalid(parse, std::string("unexpected argument ") + argv[optind]);
    }

    const auto names = SceneLibrary::names();
    if (std::find(names.begin(), names.end(), std::string_view(opts.scene)) == names.end())
    {
        return invalid(parse, "unknown scene '" + opts.scene + "'");
    }
    if (opts.headless && opts.samples == 0)
    {
        return invalid(parse, "--headless needs a sample count (-n)");
    }

    parse.status = CliStatus::Parsed;
    return parse;
}

auto CommandLine::usage(const std::string_view program) -> std::string
{
    std::string text;
    text += "Usage: ";
    text += program;
    text += " [options]\n"
        "  -s, --scene=NAME        Scene to bake: pillars (default), open, enclosed\n"
        "  -n, --samples=N         Samples to bake, 0 bakes until quit\n"
        "  -t, --texels=N          Texels per atlas cell (default 8)\n"
        "  -d, --depth-size=N      Depth buffer resolution (default 512)\n"
        "  -k, --key-light=X,Y,Z   Key light direction\n"
        "  -j, --jitter=R          Key light jitter radius (default 0.3)\n"
        "      --forward-bias=F    Shadow lookup offset in world units\n"
        "      --depth-bias=F      Shadow depth comparison bias\n"
        "      --seed=N            Direction sampler seed\n"
        "  -o, --output=FILE       Write the lightmap as PNG when baking ends\n"
        "  -H, --headless          No terminal preview, requires -n\n"
        "  -v, --verbose           Debug logging\n"
        "  -q, --quiet             Errors only\n"
        "  -V, --version           Print version and exit\n"
        "      --help              Show this text\n";
    return text;
}
