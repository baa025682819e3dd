#include "lightmap.h"

LightmapTexture::LightmapTexture(const size_t texture_size):
    size(texture_size),
    texels(texture_size * texture_size, 0.0f)
{}

auto LightmapTexture::blend(const size_t index, const float value, const uint64_t prior_samples) -> void
{
    const float alpha = running_average_weight(prior_samples);
    float& texel = texels[index];
    texel = texel * (1.0f - alpha) + value * alpha;
}

auto LightmapTexture::sample_bilinear(const Vec2& uv) const -> float
{
    if (size == 0)
    {
        return 0.0f;
    }

    const double max_coord = static_cast<double>(size - 1);
    const double fx = std::clamp(uv.x * static_cast<double>(size) - 0.5, 0.0, max_coord);
    const double fy = std::clamp(uv.y * static_cast<double>(size) - 0.5, 0.0, max_coord);

    const size_t x0 = static_cast<size_t>(fx);
    const size_t y0 = static_cast<size_t>(fy);
    const size_t x1 = std::min(x0 + 1, size - 1);
    const size_t y1 = std::min(y0 + 1, size - 1);
    const float tx = static_cast<float>(fx - static_cast<double>(x0));
    const float ty = static_cast<float>(fy - static_cast<double>(y0));

    const float top = std::lerp(at(x0, y0), at(x1, y0), tx);
    const float bottom = std::lerp(at(x0, y1), at(x1, y1), tx);
    return std::lerp(top, bottom, ty);
}

auto LightmapTexture::texel_at_uv(const Vec2& uv) const -> float
{
    if (size == 0)
    {
        return 0.0f;
    }
    const double scale = static_cast<double>(size);
    const auto clamp_index = [&](const double coord) -> size_t {
        const double texel = std::floor(coord * scale);
        return static_cast<size_t>(std::clamp(texel, 0.0, scale - 1.0));
    };
    return at(clamp_index(uv.x), clamp_index(uv.y));
}

auto LightmapTexture::mean() const -> double
{
    if (texels.empty())
    {
        return 0.0;
    }
    double sum = 0.0;
    for (const float t : texels)
    {
        sum += t;
    }
    return sum / static_cast<double>(texels.size());
}
