#pragma once

#include "math.h"

struct AtlasSettings
{
    int texels_per_cell = 8;
    int max_texture_size = 8192;
};

struct DepthSettings
{
    int resolution = 512;
};

// Both biases are tuned for meshes a few world units across.
// forward_bias is in world units; depth_bias is in normalized depth, where one
// world unit along the light direction spans 1 / (2 * bounding radius).
struct ShadowSettings
{
    double forward_bias = 0.02;
    double depth_bias = -0.0025;
};

struct SamplerSettings
{
    Vec3 key_light{0.4, 1.0, 0.6};
    double jitter_radius = 0.3;
    uint32_t seed = 1;
};

struct BakeSettings
{
    AtlasSettings atlas{};
    DepthSettings depth{};
    ShadowSettings shadow{};
    SamplerSettings sampler{};
};

enum class BakeStatus
{
    Ok,
    InvalidTexelsPerCell,
    InvalidDepthResolution,
    InvalidBias,
    InvalidKeyLight,
    InvalidJitterRadius,
    EmptyMesh,
    AtlasOverflow,
    TextureTooLarge
};

[[nodiscard]]
auto validate_settings(const BakeSettings& settings) -> BakeStatus;

[[nodiscard]]
auto bake_status_message(BakeStatus status) -> std::string_view;
