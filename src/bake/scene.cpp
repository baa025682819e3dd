#include "scene.h"

namespace {

constexpr std::array<std::string_view, 3> kSceneNames{"pillars", "open", "enclosed"};

struct BoxFace
{
    Vec3 origin;
    Vec3 edge_u;
    Vec3 edge_v;
};

} // namespace

auto Scene::cell_count() const -> size_t
{
    size_t count = 0;
    for (const SceneQuad& quad : quads)
    {
        count += quad.double_sided ? 2 : 1;
    }
    return count;
}

auto Scene::add_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> void
{
    quads.push_back({{a, b, c, d}, false});
}

auto Scene::add_double_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> void
{
    quads.push_back({{a, b, c, d}, true});
}

auto Scene::add_box(const Vec3& min, const Vec3& max, const bool with_bottom) -> void
{
    const Vec3 size = max - min;
    // edge_u x edge_v points out of the box.
    const std::array<BoxFace, 6> faces{{
        {{min.x, max.y, max.z}, {size.x, 0.0, 0.0}, {0.0, 0.0, -size.z}},  // +y
        {{max.x, min.y, max.z}, {0.0, 0.0, -size.z}, {0.0, size.y, 0.0}},  // +x
        {{min.x, min.y, min.z}, {0.0, 0.0, size.z}, {0.0, size.y, 0.0}},   // -x
        {{min.x, min.y, max.z}, {size.x, 0.0, 0.0}, {0.0, size.y, 0.0}},   // +z
        {{max.x, min.y, min.z}, {-size.x, 0.0, 0.0}, {0.0, size.y, 0.0}},  // -z
        {{min.x, min.y, min.z}, {size.x, 0.0, 0.0}, {0.0, 0.0, size.z}}    // -y
    }};

    const size_t face_count = with_bottom ? 6 : 5;
    for (size_t i = 0; i < face_count; ++i)
    {
        const BoxFace& f = faces[i];
        add_quad(f.origin, f.origin + f.edge_u, f.origin + f.edge_v, f.origin + f.edge_u + f.edge_v);
    }
}

auto Scene::add_ground(const double min_x, const double min_z, const double max_x, const double max_z,
                       const double y, const int cols, const int rows) -> void
{
    if (cols <= 0 || rows <= 0)
    {
        return;
    }
    const double step_x = (max_x - min_x) / cols;
    const double step_z = (max_z - min_z) / rows;
    for (int row = 0; row < rows; ++row)
    {
        const double z0 = min_z + step_z * row;
        const double z1 = z0 + step_z;
        for (int col = 0; col < cols; ++col)
        {
            const double x0 = min_x + step_x * col;
            const double x1 = x0 + step_x;
            add_quad({x0, y, z1}, {x1, y, z1}, {x0, y, z0}, {x1, y, z0});
        }
    }
}

auto SceneLibrary::open_quad() -> Scene
{
    Scene scene;
    scene.name = "open";
    scene.add_ground(-1.0, -1.0, 1.0, 1.0, 0.0, 1, 1);
    return scene;
}

auto SceneLibrary::enclosed_quad() -> Scene
{
    Scene scene = open_quad();
    scene.name = "enclosed";
    scene.add_box({-2.0, -1.0, -2.0}, {2.0, 1.5, 2.0}, true);
    return scene;
}

auto SceneLibrary::pillars() -> Scene
{
    Scene scene;
    scene.name = "pillars";
    scene.add_ground(-4.0, -4.0, 4.0, 4.0, 0.0, 8, 8);
    scene.add_box({-2.5, 0.0, -2.5}, {-1.5, 3.0, -1.5}, false);
    scene.add_box({1.5, 0.0, -2.5}, {2.5, 3.0, -1.5}, false);
    scene.add_box({-2.5, 3.0, -2.5}, {2.5, 3.5, -1.5}, true);
    scene.add_box({-1.0, 0.0, 0.5}, {0.5, 0.8, 2.5}, false);
    scene.add_double_quad({1.0, 1.6, 0.5}, {3.0, 1.6, 0.5}, {1.0, 2.0, 2.5}, {3.0, 2.0, 2.5});
    return scene;
}

auto SceneLibrary::by_name(const std::string_view name) -> std::optional<Scene>
{
    if (name == "pillars") return pillars();
    if (name == "open") return open_quad();
    if (name == "enclosed") return enclosed_quad();
    return std::nullopt;
}

auto SceneLibrary::names() -> std::span<const std::string_view>
{
    return kSceneNames;
}

auto build_scene_lightmap(const Scene& scene, const AtlasSettings& atlas) -> SceneBuild
{
    const size_t cells = scene.cell_count();
    if (cells == 0)
    {
        return {BakeStatus::EmptyMesh, std::nullopt};
    }
    if (atlas.texels_per_cell < 1)
    {
        return {BakeStatus::InvalidTexelsPerCell, std::nullopt};
    }

    const auto texels = static_cast<size_t>(atlas.texels_per_cell);
    const AtlasLayout layout = AtlasLayout::for_quads(cells, texels);
    if (layout.texture_size() > static_cast<size_t>(atlas.max_texture_size))
    {
        return {BakeStatus::TextureTooLarge, std::nullopt};
    }

    AtlasBuilder builder(cells, texels);
    for (const SceneQuad& quad : scene.quads)
    {
        const auto& [a, b, c, d] = quad.corners;
        const bool added = quad.double_sided ? builder.add_double_quad(a, b, c, d)
                                             : builder.add_quad(a, b, c, d);
        if (!added)
        {
            return {BakeStatus::AtlasOverflow, std::nullopt};
        }
    }

    auto compiled = builder.compile();
    if (!compiled)
    {
        return {BakeStatus::EmptyMesh, std::nullopt};
    }
    return {BakeStatus::Ok, std::move(compiled)};
}
