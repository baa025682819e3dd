#pragma once

#include "math.h"

// Single-channel float texture addressed by atlas UV. Texel (x, y) covers
// [x, x + 1) x [y, y + 1) in texel units; v grows with y.
struct LightmapTexture
{
    size_t size = 0;
    std::vector<float> texels;

    LightmapTexture() = default;
    explicit LightmapTexture(size_t texture_size);

    [[nodiscard]]
    auto at(size_t x, size_t y) const -> float
    {
        return texels[y * size + x];
    }

    // Running average: after n prior samples the next one enters with weight 1 / (n + 1).
    auto blend(size_t index, float value, uint64_t prior_samples) -> void;

    [[nodiscard]]
    auto sample_bilinear(const Vec2& uv) const -> float;

    [[nodiscard]]
    auto texel_at_uv(const Vec2& uv) const -> float;

    [[nodiscard]]
    auto mean() const -> double;
};

[[nodiscard]]
constexpr auto running_average_weight(const uint64_t prior_samples) -> float
{
    return 1.0f / (1.0f + static_cast<float>(prior_samples));
}
