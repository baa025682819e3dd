#pragma once

#include "mesh.h"

struct DepthBuffer
{
    size_t size = 0;
    std::vector<float> depth;

    DepthBuffer() = default;
    explicit DepthBuffer(size_t resolution);

    auto clear(float value = 1.0f) -> void;

    // Nearest texel, clamped to the edge.
    [[nodiscard]]
    auto sample(const Vec2& uv) const -> float;
};

struct LightTransform
{
    Vec3 direction{};
    Mat4 view{};
    Mat4 projection{};
    Mat4 view_projection{};
};

struct DepthCapture
{
    // Orthographic light looking along -dir from the sphere center. The
    // projection box [-r, r]^3 holds the whole sphere for every direction.
    [[nodiscard]]
    static auto light_transform(const Vec3& dir, const BoundingSphere& bounds) -> LightTransform;

    // Axis that is never close to parallel with dir.
    [[nodiscard]]
    static auto up_vector(const Vec3& dir) -> Vec3;

    static auto render(const Mesh& mesh, const LightTransform& light, DepthBuffer& target) -> void;

    static auto capture(const Mesh& mesh, const Vec3& dir, DepthBuffer& target) -> LightTransform;
};
