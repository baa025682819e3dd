#pragma once

#include "atlas.h"
#include "depth_pass.h"
#include "settings.h"

struct OcclusionAccumulator
{
    // Lit (1) or occluded (0) for one surface point under the light.
    [[nodiscard]]
    static auto visibility(const Vec3& position, const Vec3& normal,
                           const LightTransform& light, const DepthBuffer& depth,
                           const ShadowSettings& shadow) -> float;

    // Shifts the lookup sideways in light space, towards the side the surface faces.
    [[nodiscard]]
    static auto forward_offset(const Vec3& normal, const Vec3& dir, double bias) -> Vec3;

    // Rasterizes the safety-margin geometry into atlas space and folds one
    // visibility sample into every covered texel. Returns the number of texels
    // written and advances sample_count by one.
    static auto accumulate(const Mesh& mesh, const LightTransform& light,
                           const DepthBuffer& depth, const ShadowSettings& shadow,
                           LightmapTexture& lightmap, uint64_t& sample_count) -> size_t;
};
