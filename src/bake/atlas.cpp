#include "atlas.h"

namespace {

constexpr std::array<Vec2, 4> kCornerParams{{
    {0.0, 0.0},
    {1.0, 0.0},
    {0.0, 1.0},
    {1.0, 1.0}
}};

} // namespace

auto AtlasLayout::for_quads(const size_t quad_count, const size_t texels_per_cell) -> AtlasLayout
{
    size_t side = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(quad_count))));
    while (side * side < quad_count)
    {
        ++side;
    }
    return {std::max<size_t>(side, 1), texels_per_cell};
}

AtlasBuilder::AtlasBuilder(const size_t quad_count, const size_t texels_per_cell):
    layout_(AtlasLayout::for_quads(quad_count, texels_per_cell))
{
    const size_t vertex_count = quad_count * 4;
    mesh_.positions.reserve(vertex_count);
    mesh_.normals.reserve(vertex_count);
    mesh_.atlas_uvs.reserve(vertex_count);
    mesh_.margin_positions.reserve(vertex_count);
    mesh_.margin_uvs.reserve(vertex_count);
    mesh_.triangles.reserve(quad_count * 2);
}

auto AtlasBuilder::add_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> bool
{
    if (quads_added_ >= layout_.capacity())
    {
        return false;
    }

    const size_t index = quads_added_++;
    const auto base = static_cast<uint32_t>(index * 4);
    mesh_.triangles.push_back({base, base + 1, base + 3});
    mesh_.triangles.push_back({base, base + 3, base + 2});

    const Vec3 normal = (b - a).cross(c - a).normalize();
    const std::array<Vec3, 4> corners{a, b, c, d};

    const double h = layout_.half_texel();
    const auto [s, t] = layout_.cell(index);
    const double inv_side = 1.0 / static_cast<double>(layout_.cells_per_side);
    const double cell_u = static_cast<double>(s);
    const double cell_v = static_cast<double>(t);

    for (size_t i = 0; i < 4; ++i)
    {
        const Vec2 param = kCornerParams[i];
        // Pushes 0 to -h and 1 to 1 + h.
        const double mu = param.x * (1.0 + 2.0 * h) - h;
        const double mv = param.y * (1.0 + 2.0 * h) - h;
        // Pulls 0 to h and 1 to 1 - h.
        const double iu = param.x * (1.0 - 2.0 * h) + h;
        const double iv = param.y * (1.0 - 2.0 * h) + h;

        mesh_.positions.push_back(corners[i]);
        mesh_.normals.push_back(normal);
        mesh_.margin_positions.push_back(Vec3::bilerp(a, b, c, d, mu, mv));
        mesh_.atlas_uvs.push_back({(cell_u + iu) * inv_side, (cell_v + iv) * inv_side});
        mesh_.margin_uvs.push_back({(cell_u + param.x) * inv_side, (cell_v + param.y) * inv_side});
    }
    return true;
}

auto AtlasBuilder::add_double_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> bool
{
    if (quads_added_ + 2 > layout_.capacity())
    {
        return false;
    }
    return add_quad(a, b, c, d) && add_quad(a, c, b, d);
}

auto AtlasBuilder::compile() -> std::optional<CompiledLightmap>
{
    if (quads_added_ == 0)
    {
        return std::nullopt;
    }

    Mesh mesh = std::move(mesh_);
    mesh_ = Mesh{};
    quads_added_ = 0;
    mesh.update_bounds();

    return CompiledLightmap{
        .mesh = std::move(mesh),
        .layout = layout_,
        .texture = LightmapTexture(layout_.texture_size())
    };
}
