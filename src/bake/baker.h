#pragma once

#include "atlas.h"
#include "depth_pass.h"
#include "occlusion_pass.h"
#include "sampler.h"
#include "settings.h"

struct StepResult
{
    Vec3 direction{};
    uint64_t sample_index = 0;
    size_t texels_written = 0;
};

struct BakeSetup;

// Everything one progressive bake owns: the compiled mesh and its lightmap,
// the per-frame depth scratch buffer, the direction sampler and the sample
// counter. Each step is one depth capture followed by one accumulation pass.

struct BakeContext
{
    [[nodiscard]]
    static auto create(CompiledLightmap compiled, const BakeSettings& settings) -> BakeSetup;

    auto step() -> StepResult;
    auto step(const Vec3& dir) -> StepResult;

    [[nodiscard]]
    auto sample_count() const -> uint64_t
    {
        return sample_count_;
    }

    [[nodiscard]]
    auto mesh() const -> const Mesh&
    {
        return compiled_.mesh;
    }

    [[nodiscard]]
    auto layout() const -> const AtlasLayout&
    {
        return compiled_.layout;
    }

    [[nodiscard]]
    auto lightmap() const -> const LightmapTexture&
    {
        return compiled_.texture;
    }

    [[nodiscard]]
    auto depth_buffer() const -> const DepthBuffer&
    {
        return depth_;
    }

    [[nodiscard]]
    auto last_light() const -> const LightTransform&
    {
        return last_light_;
    }

    [[nodiscard]]
    auto settings() const -> const BakeSettings&
    {
        return settings_;
    }

private:
    BakeContext(CompiledLightmap compiled, const BakeSettings& settings);

    CompiledLightmap compiled_;
    BakeSettings settings_;
    DepthBuffer depth_;
    DirectionSampler sampler_;
    LightTransform last_light_{};
    uint64_t sample_count_ = 0;
};

struct BakeSetup
{
    BakeStatus status = BakeStatus::Ok;
    std::optional<BakeContext> context;
};
