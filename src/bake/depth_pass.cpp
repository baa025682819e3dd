#include "depth_pass.h"
#include "raster.h"

DepthBuffer::DepthBuffer(const size_t resolution):
    size(resolution),
    depth(resolution * resolution, 1.0f)
{}

auto DepthBuffer::clear(const float value) -> void
{
    std::fill(depth.begin(), depth.end(), value);
}

auto DepthBuffer::sample(const Vec2& uv) const -> float
{
    if (size == 0)
    {
        return 1.0f;
    }
    const double scale = static_cast<double>(size);
    const double max_index = scale - 1.0;
    const auto x = static_cast<size_t>(std::clamp(std::floor(uv.x * scale), 0.0, max_index));
    const auto y = static_cast<size_t>(std::clamp(std::floor(uv.y * scale), 0.0, max_index));
    return depth[y * size + x];
}

auto DepthCapture::up_vector(const Vec3& dir) -> Vec3
{
    const double ax = std::fabs(dir.x);
    const double ay = std::fabs(dir.y);
    const double az = std::fabs(dir.z);
    const bool y_dominant = ay >= ax && ay >= az;
    const Vec3 axis = y_dominant ? Vec3{1.0, 0.0, 0.0} : Vec3{0.0, 1.0, 0.0};
    return dir.cross(axis);
}

auto DepthCapture::light_transform(const Vec3& dir, const BoundingSphere& bounds) -> LightTransform
{
    const double r = bounds.radius;
    const Vec3 center = bounds.center;

    LightTransform light;
    light.direction = dir;
    light.projection = Mat4::ortho(-r, r, -r, r, -r, r);
    light.view = Mat4::look_at(center, center - dir, up_vector(dir));
    light.view_projection = light.projection * light.view;
    return light;
}

auto DepthCapture::render(const Mesh& mesh, const LightTransform& light, DepthBuffer& target) -> void
{
    target.clear(1.0f);

    const size_t size = target.size;
    const double scale = static_cast<double>(size);
    float* depth = target.depth.data();

    for (const auto& tri : mesh.triangles)
    {
        std::array<Vec2, 3> screen{};
        std::array<double, 3> z{};
        for (size_t i = 0; i < 3; ++i)
        {
            const Vec3 ndc = light.view_projection.transform_point(mesh.positions[tri[i]]);
            screen[i] = {(ndc.x * 0.5 + 0.5) * scale, (ndc.y * 0.5 + 0.5) * scale};
            z[i] = ndc.z * 0.5 + 0.5;
        }

        TriangleRasterizer::draw(screen[0], screen[1], screen[2], size, size,
            [&](const Fragment& frag) {
                const double frag_z = frag.w0 * z[0] + frag.w1 * z[1] + frag.w2 * z[2];
                if (frag_z < 0.0 || frag_z > 1.0) return;

                float& stored = depth[frag.y * size + frag.x];
                const auto value = static_cast<float>(frag_z);
                if (value < stored)
                {
                    stored = value;
                }
            });
    }
}

auto DepthCapture::capture(const Mesh& mesh, const Vec3& dir, DepthBuffer& target) -> LightTransform
{
    const LightTransform light = light_transform(dir, mesh.bounds);
    render(mesh, light, target);
    return light;
}
