#include <catch2/catch.hpp>

#include "bake/scene.h"
#include "view/preview.h"

namespace
{
    auto lit_open_quad() -> CompiledLightmap
    {
        SceneBuild build = build_scene_lightmap(SceneLibrary::open_quad(), AtlasSettings{});
        REQUIRE(build.lightmap.has_value());
        std::fill(build.lightmap->texture.texels.begin(), build.lightmap->texture.texels.end(), 1.0f);
        return std::move(*build.lightmap);
    }
}

TEST_CASE("shade maps visibility to grey levels")
{
    REQUIRE(PreviewRenderer::shade(0.0f) == 0x000000u);
    REQUIRE(PreviewRenderer::shade(1.0f) == 0xFFFFFFu);
    REQUIRE(PreviewRenderer::shade(5.0f) == 0xFFFFFFu);

    const uint32_t mid = PreviewRenderer::shade(0.5f);
    const uint32_t level = mid & 0xFF;
    REQUIRE(level > 128);
    REQUIRE(((mid >> 8) & 0xFF) == level);
    REQUIRE(((mid >> 16) & 0xFF) == level);
}

TEST_CASE("mesh preview draws the lightmap where the mesh is")
{
    const CompiledLightmap compiled = lit_open_quad();
    constexpr size_t width = 64;
    constexpr size_t height = 48;
    std::vector<uint32_t> pixels(width * height, 0);

    PreviewRenderer preview;
    preview.render(compiled.mesh, compiled.texture, OrbitCamera{}, PreviewMode::Mesh, pixels, width, height);

    REQUIRE(pixels[(height / 2) * width + width / 2] == 0xFFFFFFu);
    REQUIRE(pixels[0] == PreviewRenderer::kBackground);

    const auto lit = std::count(pixels.begin(), pixels.end(), 0xFFFFFFu);
    const auto background = std::count(pixels.begin(), pixels.end(), PreviewRenderer::kBackground);
    REQUIRE(lit > 100);
    REQUIRE(background > 100);
    REQUIRE(static_cast<size_t>(lit + background) == pixels.size());
}

TEST_CASE("atlas preview fits the texture into a centred square")
{
    LightmapTexture lightmap(2);
    lightmap.texels = {1.0f, 0.0f, 0.0f, 1.0f};
    const Mesh mesh{};

    constexpr size_t width = 20;
    constexpr size_t height = 10;
    std::vector<uint32_t> pixels(width * height, 0);

    PreviewRenderer preview;
    preview.render(mesh, lightmap, OrbitCamera{}, PreviewMode::Atlas, pixels, width, height);

    REQUIRE(pixels[0] == PreviewRenderer::kBackground);
    REQUIRE(pixels[width - 1] == PreviewRenderer::kBackground);
    REQUIRE(pixels[5] == 0xFFFFFFu);
    REQUIRE(pixels[14] == 0x000000u);
    REQUIRE(pixels[9 * width + 5] == 0x000000u);
    REQUIRE(pixels[9 * width + 14] == 0xFFFFFFu);
}

TEST_CASE("render ignores frames that are too small")
{
    const CompiledLightmap compiled = lit_open_quad();
    std::vector<uint32_t> pixels(4, 7);

    PreviewRenderer preview;
    preview.render(compiled.mesh, compiled.texture, OrbitCamera{}, PreviewMode::Mesh, pixels, 8, 8);
    REQUIRE(pixels[0] == 7);
}
