#include "prelude.hpp"

#include "bake/baker.h"
#include "bake/scene.h"
#include "cli.h"
#include "controls.h"
#include "input.h"
#include "keyboard.h"
#include "log.h"
#include "view/png_writer.h"
#include "view/preview.h"
#include "view/terminal.h"

#include <thread>

struct SignalState
{
    static auto install() -> void
    {
        std::signal(SIGINT, &SignalState::handle);
        std::signal(SIGTERM, &SignalState::handle);
        std::signal(SIGWINCH, &SignalState::handle);
    }

    [[nodiscard]]
    static auto shutdown() -> bool
    {
        return shutdown_req != 0;
    }

    [[nodiscard]]
    static auto take_resize() -> bool
    {
        if (resize_req == 0)
        {
            return false;
        }
        resize_req = 0;
        return true;
    }

private:
    static auto handle(int sig) -> void
    {
        if (sig == SIGWINCH)
        {
            resize_req = 1;
            return;
        }
        shutdown_req = 1;
    }

    static inline volatile std::sig_atomic_t shutdown_req = 0;
    static inline volatile std::sig_atomic_t resize_req = 0;
};

struct TerminalSession
{
    auto read_keys(std::string& buffer) const -> void
    {
        (void)keyboard.drain_into(buffer);
    }

    TerminalView view;

private:
    KeyboardMode keyboard;
};

struct App
{
    App(AppOptions options, BakeContext context):
        options(std::move(options)),
        bake(std::move(context))
    {}

    auto run() -> int
    {
        const bool completed = options.headless ? run_headless() : run_interactive();
        if (!completed)
        {
            Log::warn("stopped after %llu samples", static_cast<unsigned long long>(bake.sample_count()));
        }
        Log::info("%s: %llu samples, lightmap mean %.4f", options.scene.c_str(),
                  static_cast<unsigned long long>(bake.sample_count()), bake.lightmap().mean());
        return write_output() ? 0 : 1;
    }

private:
    static constexpr double kOrbitStep = 0.08;
    static constexpr auto kIdleFrame = std::chrono::milliseconds(16);

    AppOptions options;
    BakeContext bake;
    PreviewRenderer preview;
    OrbitCamera camera;
    PreviewMode mode = PreviewMode::Mesh;
    bool paused = false;
    bool quit = false;
    std::string input_buffer;
    double fps = 0.0;
    std::chrono::steady_clock::time_point last_frame = std::chrono::steady_clock::now();

    [[nodiscard]]
    auto target_reached() const -> bool
    {
        return options.samples > 0 && bake.sample_count() >= options.samples;
    }

    [[nodiscard]]
    auto run_headless() -> bool
    {
        const uint64_t report_every = std::max<uint64_t>(1, options.samples / 10);
        while (!target_reached())
        {
            if (SignalState::shutdown())
            {
                return false;
            }
            const StepResult step = bake.step();
            Log::debug("sample %llu dir (%.3f, %.3f, %.3f) wrote %zu texels",
                       static_cast<unsigned long long>(step.sample_index), step.direction.x,
                       step.direction.y, step.direction.z, step.texels_written);
            if (bake.sample_count() % report_every == 0)
            {
                Log::info("%llu/%llu samples",
                          static_cast<unsigned long long>(bake.sample_count()),
                          static_cast<unsigned long long>(options.samples));
            }
        }
        return true;
    }

    [[nodiscard]]
    auto run_interactive() -> bool
    {
        TerminalSession session;
        TerminalFrame frame;

        while (!quit)
        {
            if (SignalState::shutdown())
            {
                return target_reached();
            }
            if (SignalState::take_resize())
            {
                session.view.update_size();
            }

            session.read_keys(input_buffer);
            for (const InputAction action : InputParser::drain(input_buffer))
            {
                handle_action(action);
            }
            if (quit) break;

            const bool baking = !paused && !target_reached();
            if (baking)
            {
                (void)bake.step();
            }

            const TerminalSize size = session.view.frame_size();
            frame.width = size.width;
            frame.height = size.height;
            frame.pixels.assign(size.width * size.height, PreviewRenderer::kBackground);
            preview.render(bake.mesh(), bake.lightmap(), camera, mode, frame.pixels,
                           size.width, size.height);
            frame.status = status_line();
            session.view.present(frame);

            if (!baking)
            {
                std::this_thread::sleep_for(kIdleFrame);
            }
            update_fps();
        }
        return options.samples == 0 || target_reached();
    }

    auto handle_action(const InputAction action) -> void
    {
        switch (action)
        {
            case InputAction::None: return;
            case InputAction::Quit: quit = true; return;
            case InputAction::TogglePause: paused = !paused; return;
            case InputAction::ToggleView:
                mode = mode == PreviewMode::Mesh ? PreviewMode::Atlas : PreviewMode::Mesh;
                return;
            default: break;
        }

        const OrbitIntent intent = OrbitIntent::from_action(action, kOrbitStep);
        camera.rotate(intent.rotate);
        camera.zoom(intent.zoom);
    }

    auto update_fps() -> void
    {
        const auto now = std::chrono::steady_clock::now();
        const double dt = std::chrono::duration<double>(now - last_frame).count();
        last_frame = now;
        if (dt <= 0.0) return;
        fps = fps == 0.0 ? 1.0 / dt : fps * 0.9 + (1.0 / dt) * 0.1;
    }

    [[nodiscard]]
    auto status_line() const -> std::string
    {
        const char* state = target_reached() ? "done" : (paused ? "paused" : "baking");
        char buf[160];
        std::snprintf(buf, sizeof(buf), " %s | %llu samples | mean %.3f | %.1f fps | %s | %s ",
                      options.scene.c_str(), static_cast<unsigned long long>(bake.sample_count()),
                      bake.lightmap().mean(), fps, state,
                      mode == PreviewMode::Mesh ? "mesh" : "atlas");
        return buf;
    }

    [[nodiscard]]
    auto write_output() const -> bool
    {
        if (options.output.empty())
        {
            return true;
        }
        if (!PngWriter::save_lightmap(options.output, bake.lightmap()))
        {
            return false;
        }
        Log::info("wrote %zux%zu lightmap to %s", bake.lightmap().size, bake.lightmap().size,
                  options.output.c_str());
        return true;
    }
};

auto main(int argc, char** argv) -> int
{
    const CliParse cli = CommandLine::parse(argc, argv);
    switch (cli.status)
    {
        case CliStatus::ShowHelp:
            std::fputs(CommandLine::usage(argv[0]).c_str(), stdout);
            return 0;
        case CliStatus::ShowVersion:
            std::printf("baketm %.*s\n", static_cast<int>(CommandLine::kVersion.size()),
                        CommandLine::kVersion.data());
            return 0;
        case CliStatus::Invalid:
            Log::error("%s", cli.error.c_str());
            std::fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
            return 2;
        case CliStatus::Parsed:
            break;
    }

    const AppOptions& options = cli.options;
    Log::set_level(options.log_level);

    const std::optional<Scene> scene = SceneLibrary::by_name(options.scene);
    if (!scene)
    {
        Log::error("unknown scene '%s'", options.scene.c_str());
        return 2;
    }

    SceneBuild build = build_scene_lightmap(*scene, options.settings.atlas);
    if (build.status != BakeStatus::Ok)
    {
        Log::error("cannot build atlas for '%s': %s", scene->name.c_str(),
                   std::string(bake_status_message(build.status)).c_str());
        return 1;
    }
    Log::debug("%s: %zu quads, %zux%zu texels", scene->name.c_str(), build.lightmap->mesh.quad_count(),
               build.lightmap->layout.texture_size(), build.lightmap->layout.texture_size());

    BakeSetup setup = BakeContext::create(std::move(*build.lightmap), options.settings);
    if (setup.status != BakeStatus::Ok)
    {
        Log::error("bake setup failed: %s", std::string(bake_status_message(setup.status)).c_str());
        return 1;
    }

    SignalState::install();
    App app(options, std::move(*setup.context));
    return app.run();
}
