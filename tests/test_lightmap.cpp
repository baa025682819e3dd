#include <catch2/catch.hpp>

#include "bake/lightmap.h"
#include "bake/mesh.h"

TEST_CASE("LightmapTexture starts dark")
{
    const LightmapTexture lightmap(4);
    REQUIRE(lightmap.size == 4);
    REQUIRE(lightmap.texels.size() == 16);
    REQUIRE(lightmap.mean() == Catch::Detail::Approx(0.0));
}

TEST_CASE("running_average_weight gives the first sample full weight")
{
    REQUIRE(running_average_weight(0) == Catch::Detail::Approx(1.0));
    REQUIRE(running_average_weight(1) == Catch::Detail::Approx(0.5));
    REQUIRE(running_average_weight(3) == Catch::Detail::Approx(0.25));
}

TEST_CASE("blend keeps the arithmetic mean of all samples")
{
    LightmapTexture lightmap(1);
    const std::array<float, 6> samples{1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 1.0f};
    for (size_t i = 0; i < samples.size(); ++i)
    {
        lightmap.blend(0, samples[i], i);
    }
    REQUIRE(lightmap.at(0, 0) == Catch::Detail::Approx(4.0 / 6.0));
}

TEST_CASE("blend overwrites the cleared value on the first sample")
{
    LightmapTexture lightmap(2);
    lightmap.texels[3] = 0.75f;
    lightmap.blend(3, 0.25f, 0);
    REQUIRE(lightmap.texels[3] == Catch::Detail::Approx(0.25));
}

TEST_CASE("sample_bilinear interpolates between texel centers")
{
    LightmapTexture lightmap(2);
    lightmap.texels = {0.0f, 1.0f, 0.0f, 1.0f};

    REQUIRE(lightmap.sample_bilinear({0.25, 0.5}) == Catch::Detail::Approx(0.0));
    REQUIRE(lightmap.sample_bilinear({0.75, 0.5}) == Catch::Detail::Approx(1.0));
    REQUIRE(lightmap.sample_bilinear({0.5, 0.5}) == Catch::Detail::Approx(0.5));
    REQUIRE(lightmap.sample_bilinear({-1.0, 0.5}) == Catch::Detail::Approx(0.0));
    REQUIRE(lightmap.sample_bilinear({2.0, 0.5}) == Catch::Detail::Approx(1.0));
}

TEST_CASE("texel_at_uv picks the nearest texel and clamps")
{
    LightmapTexture lightmap(2);
    lightmap.texels = {0.1f, 0.2f, 0.3f, 0.4f};

    REQUIRE(lightmap.texel_at_uv({0.1, 0.1}) == Catch::Detail::Approx(0.1));
    REQUIRE(lightmap.texel_at_uv({0.9, 0.1}) == Catch::Detail::Approx(0.2));
    REQUIRE(lightmap.texel_at_uv({0.1, 0.9}) == Catch::Detail::Approx(0.3));
    REQUIRE(lightmap.texel_at_uv({5.0, 5.0}) == Catch::Detail::Approx(0.4));
}

TEST_CASE("compute_bounding_sphere contains every point")
{
    const std::vector<Vec3> points{
        {-1.0, 0.0, 0.0}, {3.0, 0.0, 0.0}, {1.0, 2.0, -1.0}, {0.0, -1.0, 4.0}
    };
    const BoundingSphere sphere = compute_bounding_sphere(points);
    REQUIRE(sphere.radius > 0.0);
    for (const Vec3& p : points)
    {
        REQUIRE((p - sphere.center).length() <= sphere.radius + 1e-9);
    }
}

TEST_CASE("compute_bounding_sphere keeps a positive radius for degenerate input")
{
    const std::vector<Vec3> single{{2.0, 2.0, 2.0}};
    const BoundingSphere sphere = compute_bounding_sphere(single);
    REQUIRE(sphere.center.x == Catch::Detail::Approx(2.0));
    REQUIRE(sphere.radius > 0.0);

    const BoundingSphere empty = compute_bounding_sphere({});
    REQUIRE(empty.radius > 0.0);
}
