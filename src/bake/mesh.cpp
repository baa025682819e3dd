#include "mesh.h"

namespace {

constexpr double kMinRadius = 1e-6;

} // namespace

auto compute_bounding_sphere(const std::span<const Vec3> points) -> BoundingSphere
{
    if (points.empty())
    {
        return {Vec3::zero(), kMinRadius};
    }

    Vec3 lo = points[0];
    Vec3 hi = points[0];
    for (const Vec3& p : points)
    {
        lo = {std::min(lo.x, p.x), std::min(lo.y, p.y), std::min(lo.z, p.z)};
        hi = {std::max(hi.x, p.x), std::max(hi.y, p.y), std::max(hi.z, p.z)};
    }

    const Vec3 center = Vec3::lerp(lo, hi, 0.5);
    double radius = 0.0;
    for (const Vec3& p : points)
    {
        radius = std::max(radius, (p - center).length());
    }
    return {center, std::max(radius, kMinRadius)};
}

auto Mesh::update_bounds() -> void
{
    bounds = compute_bounding_sphere(positions);
}
