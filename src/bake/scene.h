#pragma once

#include "atlas.h"
#include "settings.h"

struct SceneQuad
{
    std::array<Vec3, 4> corners;
    bool double_sided = false;
};

struct Scene
{
    std::string name;
    std::vector<SceneQuad> quads;

    // Atlas cells needed; double-sided quads take two.
    [[nodiscard]]
    auto cell_count() const -> size_t;

    auto add_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> void;
    auto add_double_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> void;

    // Axis-aligned box with outward-facing sides.
    auto add_box(const Vec3& min, const Vec3& max, bool with_bottom) -> void;

    // Upward-facing rectangle at height y split into cols x rows quads.
    auto add_ground(double min_x, double min_z, double max_x, double max_z, double y,
                    int cols, int rows) -> void;
};

struct SceneLibrary
{
    [[nodiscard]]
    static auto open_quad() -> Scene;

    [[nodiscard]]
    static auto enclosed_quad() -> Scene;

    [[nodiscard]]
    static auto pillars() -> Scene;

    [[nodiscard]]
    static auto by_name(std::string_view name) -> std::optional<Scene>;

    [[nodiscard]]
    static auto names() -> std::span<const std::string_view>;
};

struct SceneBuild
{
    BakeStatus status = BakeStatus::Ok;
    std::optional<CompiledLightmap> lightmap;
};

[[nodiscard]]
auto build_scene_lightmap(const Scene& scene, const AtlasSettings& atlas) -> SceneBuild;
