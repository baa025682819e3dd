#pragma once

#include "math.h"

struct BoundingSphere
{
    Vec3 center{};
    double radius = 0.0;
};

// Four vertices and two triangles per quad. The safety-margin streams are the
// quad extrapolated half a texel past its cell so atlas-space rasterization
// covers every border texel.
struct Mesh
{
    std::vector<Vec3> positions;
    std::vector<Vec3> normals;
    std::vector<Vec2> atlas_uvs;
    std::vector<Vec3> margin_positions;
    std::vector<Vec2> margin_uvs;
    std::vector<std::array<uint32_t, 3>> triangles;
    BoundingSphere bounds{};

    [[nodiscard]]
    auto vertex_count() const -> size_t
    {
        return positions.size();
    }

    [[nodiscard]]
    auto quad_count() const -> size_t
    {
        return positions.size() / 4;
    }

    auto update_bounds() -> void;
};

[[nodiscard]]
auto compute_bounding_sphere(std::span<const Vec3> points) -> BoundingSphere;
