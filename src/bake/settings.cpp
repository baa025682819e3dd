#include "settings.h"

namespace {

constexpr int kMaxDepthResolution = 8192;

auto is_finite(const Vec3& v) -> bool
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

auto validate_settings(const BakeSettings& settings) -> BakeStatus
{
    const auto& atlas = settings.atlas;
    if (atlas.texels_per_cell < 1 || atlas.texels_per_cell > atlas.max_texture_size)
    {
        return BakeStatus::InvalidTexelsPerCell;
    }

    const int depth_res = settings.depth.resolution;
    if (depth_res < 1 || depth_res > kMaxDepthResolution)
    {
        return BakeStatus::InvalidDepthResolution;
    }

    const auto& shadow = settings.shadow;
    if (!std::isfinite(shadow.forward_bias) || !std::isfinite(shadow.depth_bias) ||
        shadow.forward_bias < 0.0)
    {
        return BakeStatus::InvalidBias;
    }

    const auto& sampler = settings.sampler;
    if (!is_finite(sampler.key_light) || sampler.key_light.length() == 0.0)
    {
        return BakeStatus::InvalidKeyLight;
    }
    if (!std::isfinite(sampler.jitter_radius) || sampler.jitter_radius < 0.0)
    {
        return BakeStatus::InvalidJitterRadius;
    }

    return BakeStatus::Ok;
}

auto bake_status_message(const BakeStatus status) -> std::string_view
{
    switch (status)
    {
        case BakeStatus::Ok:
            return "ok";
        case BakeStatus::InvalidTexelsPerCell:
            return "texels per cell must be between 1 and the maximum texture size";
        case BakeStatus::InvalidDepthResolution:
            return "depth buffer resolution must be between 1 and 8192";
        case BakeStatus::InvalidBias:
            return "shadow biases must be finite and the forward bias non-negative";
        case BakeStatus::InvalidKeyLight:
            return "key light direction must be finite and non-zero";
        case BakeStatus::InvalidJitterRadius:
            return "key light jitter radius must be finite and non-negative";
        case BakeStatus::EmptyMesh:
            return "mesh has no quads";
        case BakeStatus::AtlasOverflow:
            return "more quads than lightmap atlas cells";
        case BakeStatus::TextureTooLarge:
            return "lightmap atlas exceeds the maximum texture size";
    }
    return "unknown status";
}
