#pragma once

#include "lightmap.h"
#include "mesh.h"

struct AtlasLayout
{
    size_t cells_per_side = 0;
    size_t texels_per_cell = 0;

    [[nodiscard]]
    static auto for_quads(size_t quad_count, size_t texels_per_cell) -> AtlasLayout;

    [[nodiscard]]
    auto capacity() const -> size_t
    {
        return cells_per_side * cells_per_side;
    }

    [[nodiscard]]
    auto texture_size() const -> size_t
    {
        return cells_per_side * texels_per_cell;
    }

    // Half a texel in cell-parameter units.
    [[nodiscard]]
    auto half_texel() const -> double
    {
        return 0.5 / static_cast<double>(texels_per_cell);
    }

    // Column and row of the cell holding quad `index`.
    [[nodiscard]]
    auto cell(size_t index) const -> std::pair<size_t, size_t>
    {
        return {index % cells_per_side, index / cells_per_side};
    }
};

struct CompiledLightmap
{
    Mesh mesh;
    AtlasLayout layout;
    LightmapTexture texture;
};

struct AtlasBuilder
{
    AtlasBuilder(size_t quad_count, size_t texels_per_cell);

    // Corners a, b, c, d sit at cell parameters (0,0), (1,0), (0,1), (1,1).
    [[nodiscard]]
    auto add_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> bool;

    // Both windings, each with its own cell.
    [[nodiscard]]
    auto add_double_quad(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) -> bool;

    [[nodiscard]]
    auto compile() -> std::optional<CompiledLightmap>;

    [[nodiscard]]
    auto layout() const -> const AtlasLayout&
    {
        return layout_;
    }

    [[nodiscard]]
    auto quads_added() const -> size_t
    {
        return quads_added_;
    }

private:
    AtlasLayout layout_;
    Mesh mesh_;
    size_t quads_added_ = 0;
};
