#include "camera.h"

auto OrbitCamera::position(const BoundingSphere& bounds) const -> Vec3
{
    const double cp = std::cos(pitch);
    const double distance = bounds.radius * distance_scale;
    const Vec3 offset{
        std::sin(yaw) * cp,
        std::sin(pitch),
        std::cos(yaw) * cp
    };
    return bounds.center + offset * distance;
}

auto OrbitCamera::view_matrix(const BoundingSphere& bounds) const -> Mat4
{
    return Mat4::look_at(position(bounds), bounds.center, {0.0, 1.0, 0.0});
}

auto OrbitCamera::projection(const BoundingSphere& bounds, const double aspect) const -> Mat4
{
    const double distance = bounds.radius * distance_scale;
    const double far_plane = distance + bounds.radius * 2.0;
    return Mat4::perspective(fov_y, aspect, near_plane, far_plane);
}
