#include "occlusion_pass.h"
#include "raster.h"

auto OcclusionAccumulator::forward_offset(const Vec3& normal, const Vec3& dir, const double bias) -> Vec3
{
    return dir.cross(normal.cross(dir)).normalize() * bias;
}

auto OcclusionAccumulator::visibility(const Vec3& position, const Vec3& normal,
                                      const LightTransform& light, const DepthBuffer& depth,
                                      const ShadowSettings& shadow) -> float
{
    const Vec3& dir = light.direction;
    if (normal.dot(dir) <= 0.0)
    {
        return 0.0f;
    }

    const Vec3 biased = position + forward_offset(normal, dir, shadow.forward_bias);
    const Vec3 ndc = light.view_projection.transform_point(biased);
    const Vec2 light_uv{ndc.x * 0.5 + 0.5, ndc.y * 0.5 + 0.5};
    const double light_z = ndc.z * 0.5 + 0.5;

    const double sampled = depth.sample(light_uv);
    const bool in_shadow = shadow.depth_bias + light_z - sampled > 0.0;
    return in_shadow ? 0.0f : 1.0f;
}

auto OcclusionAccumulator::accumulate(const Mesh& mesh, const LightTransform& light,
                                      const DepthBuffer& depth, const ShadowSettings& shadow,
                                      LightmapTexture& lightmap, uint64_t& sample_count) -> size_t
{
    const size_t size = lightmap.size;
    const double scale = static_cast<double>(size);
    const uint64_t prior = sample_count;

    // Texels on a quad's diagonal are reached by both of its triangles.
    std::vector<uint8_t> written(size * size, 0);
    size_t texels_written = 0;

    for (const auto& tri : mesh.triangles)
    {
        std::array<Vec2, 3> screen{};
        std::array<Vec3, 3> world{};
        std::array<Vec3, 3> normal{};
        for (size_t i = 0; i < 3; ++i)
        {
            const uint32_t v = tri[i];
            screen[i] = mesh.margin_uvs[v] * scale;
            world[i] = mesh.margin_positions[v];
            normal[i] = mesh.normals[v];
        }

        TriangleRasterizer::draw(screen[0], screen[1], screen[2], size, size,
            [&](const Fragment& frag) {
                const size_t idx = frag.y * size + frag.x;
                if (written[idx]) return;
                written[idx] = 1;

                const Vec3 position = world[0] * frag.w0 + world[1] * frag.w1 + world[2] * frag.w2;
                const Vec3 n = (normal[0] * frag.w0 + normal[1] * frag.w1 + normal[2] * frag.w2).normalize();
                const float value = visibility(position, n, light, depth, shadow);
                lightmap.blend(idx, value, prior);
                ++texels_written;
            });
    }

    ++sample_count;
    return texels_written;
}
