#pragma once

#include "../bake/lightmap.h"
#include "../bake/mesh.h"
#include "camera.h"

enum class PreviewMode
{
    Mesh,
    Atlas
};

// Presents the lightmap: either texture-mapped onto the mesh through an orbit
// camera, or the raw atlas fitted into the frame. Pixels are 0xRRGGBB.
struct PreviewRenderer
{
    static constexpr uint32_t kBackground = 0x1C2230;

    auto render(const Mesh& mesh, const LightmapTexture& lightmap, const OrbitCamera& camera,
                PreviewMode mode, std::span<uint32_t> pixels, size_t width, size_t height) -> void;

    [[nodiscard]]
    static auto shade(float value) -> uint32_t;

private:
    std::vector<float> zbuffer_;

    auto render_mesh(const Mesh& mesh, const LightmapTexture& lightmap, const OrbitCamera& camera,
                     std::span<uint32_t> pixels, size_t width, size_t height) -> void;

    static auto render_atlas(const LightmapTexture& lightmap, std::span<uint32_t> pixels,
                             size_t width, size_t height) -> void;
};
