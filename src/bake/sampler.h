#pragma once

#include "settings.h"

// Sky directions for successive bake samples. Even calls are uniform over the
// sphere, odd calls cluster around the key light for a soft shadow core; every
// result is folded into the upper hemisphere (y >= 0).
struct DirectionSampler
{
    explicit DirectionSampler(const SamplerSettings& settings);

    auto next() -> Vec3;

    [[nodiscard]]
    auto random_direction() -> Vec3;

    [[nodiscard]]
    auto calls() const -> uint64_t
    {
        return calls_;
    }

private:
    Vec3 key_light_;
    double jitter_radius_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
    uint64_t calls_ = 0;
};
