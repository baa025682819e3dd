#include "sampler.h"

namespace {

constexpr double kTwoPi = 6.283185307179586;

} // namespace

DirectionSampler::DirectionSampler(const SamplerSettings& settings):
    key_light_(settings.key_light.normalize()),
    jitter_radius_(settings.jitter_radius),
    rng_(settings.seed)
{}

auto DirectionSampler::random_direction() -> Vec3
{
    const double z = unit_(rng_) * 2.0 - 1.0;
    const double phi = unit_(rng_) * kTwoPi;
    const double r = std::sqrt(std::max(0.0, 1.0 - z * z));
    return {r * std::cos(phi), r * std::sin(phi), z};
}

auto DirectionSampler::next() -> Vec3
{
    const bool soft_shadow = (calls_++ & 1u) != 0;

    Vec3 dir{};
    if (soft_shadow)
    {
        const Vec3 jitter = random_direction() * (jitter_radius_ * std::sqrt(unit_(rng_)));
        dir = (key_light_ + jitter).normalize();
        if (dir.length() == 0.0)
        {
            dir = key_light_;
        }
    }
    else
    {
        dir = random_direction();
    }

    if (dir.y < 0.0)
    {
        dir = -dir;
    }
    return dir;
}
