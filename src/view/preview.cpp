#include "preview.h"
#include "../bake/raster.h"

auto PreviewRenderer::shade(const float value) -> uint32_t
{
    const float c = std::clamp(value, 0.0f, 1.0f);
    // Display gamma.
    const auto level = static_cast<uint32_t>(std::lround(std::pow(c, 1.0f / 2.2f) * 255.0f));
    return (level << 16) | (level << 8) | level;
}

auto PreviewRenderer::render(const Mesh& mesh, const LightmapTexture& lightmap, const OrbitCamera& camera,
                             const PreviewMode mode, const std::span<uint32_t> pixels,
                             const size_t width, const size_t height) -> void
{
    if (width == 0 || height == 0 || pixels.size() < width * height)
    {
        return;
    }
    std::fill(pixels.begin(), pixels.begin() + static_cast<std::ptrdiff_t>(width * height), kBackground);

    if (mode == PreviewMode::Atlas)
    {
        render_atlas(lightmap, pixels, width, height);
        return;
    }
    render_mesh(mesh, lightmap, camera, pixels, width, height);
}

auto PreviewRenderer::render_mesh(const Mesh& mesh, const LightmapTexture& lightmap, const OrbitCamera& camera,
                                  const std::span<uint32_t> pixels, const size_t width, const size_t height) -> void
{
    zbuffer_.assign(width * height, std::numeric_limits<float>::max());

    const double width_d = static_cast<double>(width);
    const double height_d = static_cast<double>(height);
    const Mat4 vp = camera.projection(mesh.bounds, width_d / height_d) * camera.view_matrix(mesh.bounds);

    for (const auto& tri : mesh.triangles)
    {
        std::array<Vec2, 3> screen{};
        std::array<double, 3> inv_w{};
        std::array<double, 3> depth{};
        std::array<Vec2, 3> uv_over_w{};
        bool visible = true;

        for (size_t i = 0; i < 3; ++i)
        {
            const uint32_t v = tri[i];
            const Vec4 clip = vp.transform(mesh.positions[v]);
            if (clip.w <= OrbitCamera::near_plane)
            {
                visible = false;
                break;
            }
            inv_w[i] = 1.0 / clip.w;
            const double ndc_x = clip.x * inv_w[i];
            const double ndc_y = clip.y * inv_w[i];
            screen[i] = {(ndc_x * 0.5 + 0.5) * width_d, (0.5 - ndc_y * 0.5) * height_d};
            depth[i] = clip.z * inv_w[i];
            uv_over_w[i] = mesh.atlas_uvs[v] * inv_w[i];
        }
        if (!visible) continue;

        TriangleRasterizer::draw(screen[0], screen[1], screen[2], width, height,
            [&](const Fragment& frag) {
                const size_t idx = frag.y * width + frag.x;
                const auto z = static_cast<float>(frag.w0 * depth[0] + frag.w1 * depth[1] + frag.w2 * depth[2]);
                if (z >= zbuffer_[idx]) return;
                zbuffer_[idx] = z;

                const double one_over_w = frag.w0 * inv_w[0] + frag.w1 * inv_w[1] + frag.w2 * inv_w[2];
                if (one_over_w <= 0.0) return;
                const Vec2 uv = (uv_over_w[0] * frag.w0 + uv_over_w[1] * frag.w1 + uv_over_w[2] * frag.w2) *
                                (1.0 / one_over_w);
                pixels[idx] = shade(lightmap.sample_bilinear(uv));
            });
    }
}

auto PreviewRenderer::render_atlas(const LightmapTexture& lightmap, const std::span<uint32_t> pixels,
                                   const size_t width, const size_t height) -> void
{
    if (lightmap.size == 0)
    {
        return;
    }

    // Terminal pixels are drawn as half-blocks and come out roughly square.
    const size_t extent = std::min(width, height);
    const size_t offset_x = (width - extent) / 2;
    const size_t offset_y = (height - extent) / 2;
    const double inv_extent = 1.0 / static_cast<double>(extent);

    for (size_t y = 0; y < extent; ++y)
    {
        for (size_t x = 0; x < extent; ++x)
        {
            const Vec2 uv{
                (static_cast<double>(x) + 0.5) * inv_extent,
                (static_cast<double>(y) + 0.5) * inv_extent
            };
            pixels[(y + offset_y) * width + x + offset_x] = shade(lightmap.texel_at_uv(uv));
        }
    }
}
