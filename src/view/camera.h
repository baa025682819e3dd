#pragma once

#include "../bake/mesh.h"

// Orbit camera around the mesh bounding sphere.
struct OrbitCamera
{
    double yaw = 0.8;
    double pitch = 0.55;
    double distance_scale = 2.4;
    double fov_y = 0.9;

    static constexpr double near_plane = 0.05;

    auto rotate(const Vec2& delta) -> void
    {
        yaw += delta.x;
        pitch = clamp_pitch(pitch + delta.y);
    }

    auto zoom(const double factor) -> void
    {
        distance_scale = std::clamp(distance_scale * factor, 1.2, 8.0);
    }

    [[nodiscard]]
    auto position(const BoundingSphere& bounds) const -> Vec3;

    [[nodiscard]]
    auto view_matrix(const BoundingSphere& bounds) const -> Mat4;

    [[nodiscard]]
    auto projection(const BoundingSphere& bounds, double aspect) const -> Mat4;

private:
    [[nodiscard]]
    static constexpr auto clamp_pitch(const double value) -> double
    {
        return std::clamp(value, -1.4, 1.4);
    }
};
