#pragma once

#include "../bake/lightmap.h"

// 8-bit greyscale PNG output for finished lightmaps.
struct PngWriter
{
    [[nodiscard]]
    static auto save_grayscale(const std::string& filename, size_t width, size_t height,
                               std::span<const uint8_t> pixels) -> bool;

    [[nodiscard]]
    static auto encode_grayscale(size_t width, size_t height, std::span<const uint8_t> pixels)
        -> std::optional<std::vector<uint8_t>>;

    [[nodiscard]]
    static auto save_lightmap(const std::string& filename, const LightmapTexture& lightmap) -> bool;

    // Clamps to [0, 1] and scales to 0..255, one byte per texel.
    [[nodiscard]]
    static auto quantize(const LightmapTexture& lightmap) -> std::vector<uint8_t>;

private:
    static auto write_chunk(std::vector<uint8_t>& out, const char name[4],
                            std::span<const uint8_t> data) -> void;
    static auto write_u32(std::vector<uint8_t>& out, uint32_t value) -> void;
};
