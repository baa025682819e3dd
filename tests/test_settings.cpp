#include <catch2/catch.hpp>

#include "bake/settings.h"

TEST_CASE("default settings are valid")
{
    REQUIRE(validate_settings(BakeSettings{}) == BakeStatus::Ok);
}

TEST_CASE("validate_settings rejects bad texel counts")
{
    BakeSettings settings;
    settings.atlas.texels_per_cell = 0;
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidTexelsPerCell);

    settings.atlas.texels_per_cell = 64;
    settings.atlas.max_texture_size = 32;
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidTexelsPerCell);
}

TEST_CASE("validate_settings rejects bad depth resolutions")
{
    BakeSettings settings;
    settings.depth.resolution = 0;
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidDepthResolution);
    settings.depth.resolution = 1 << 20;
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidDepthResolution);
}

TEST_CASE("validate_settings rejects non-finite or negative biases")
{
    BakeSettings settings;
    settings.shadow.forward_bias = -0.1;
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidBias);

    settings.shadow.forward_bias = 0.02;
    settings.shadow.depth_bias = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidBias);

    settings.shadow.depth_bias = 0.01;
    REQUIRE(validate_settings(settings) == BakeStatus::Ok);
}

TEST_CASE("validate_settings rejects a zero key light and negative jitter")
{
    BakeSettings settings;
    settings.sampler.key_light = Vec3::zero();
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidKeyLight);

    settings.sampler.key_light = {0.0, std::numeric_limits<double>::infinity(), 0.0};
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidKeyLight);

    settings.sampler.key_light = {0.0, 1.0, 0.0};
    settings.sampler.jitter_radius = -1.0;
    REQUIRE(validate_settings(settings) == BakeStatus::InvalidJitterRadius);
}

TEST_CASE("every status has a message")
{
    for (const BakeStatus status : {BakeStatus::Ok, BakeStatus::InvalidTexelsPerCell,
                                    BakeStatus::InvalidDepthResolution, BakeStatus::InvalidBias,
                                    BakeStatus::InvalidKeyLight, BakeStatus::InvalidJitterRadius,
                                    BakeStatus::EmptyMesh, BakeStatus::AtlasOverflow,
                                    BakeStatus::TextureTooLarge})
    {
        REQUIRE_FALSE(bake_status_message(status).empty());
    }
}
