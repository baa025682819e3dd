#include "baker.h"

BakeContext::BakeContext(CompiledLightmap compiled, const BakeSettings& settings):
    compiled_(std::move(compiled)),
    settings_(settings),
    depth_(static_cast<size_t>(settings.depth.resolution)),
    sampler_(settings.sampler)
{}

auto BakeContext::create(CompiledLightmap compiled, const BakeSettings& settings) -> BakeSetup
{
    const BakeStatus status = validate_settings(settings);
    if (status != BakeStatus::Ok)
    {
        return {status, std::nullopt};
    }
    if (compiled.mesh.quad_count() == 0)
    {
        return {BakeStatus::EmptyMesh, std::nullopt};
    }
    const size_t texture_size = compiled.layout.texture_size();
    if (texture_size == 0 || texture_size > static_cast<size_t>(settings.atlas.max_texture_size) ||
        compiled.texture.texels.size() != texture_size * texture_size)
    {
        return {BakeStatus::TextureTooLarge, std::nullopt};
    }

    return {BakeStatus::Ok, BakeContext(std::move(compiled), settings)};
}

auto BakeContext::step() -> StepResult
{
    return step(sampler_.next());
}

auto BakeContext::step(const Vec3& dir) -> StepResult
{
    StepResult result;
    result.direction = dir.normalize();
    result.sample_index = sample_count_;
    if (result.direction.length() == 0.0)
    {
        return result;
    }

    last_light_ = DepthCapture::capture(compiled_.mesh, result.direction, depth_);
    result.texels_written = OcclusionAccumulator::accumulate(compiled_.mesh, last_light_, depth_,
                                                             settings_.shadow, compiled_.texture,
                                                             sample_count_);
    return result;
}
