#include "png_writer.h"
#include "../log.h"

#include <zlib.h>

namespace {

constexpr std::array<uint8_t, 8> kPngMagic{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr uint8_t kColorTypeGray = 0;
constexpr uint8_t kFilterNone = 0;

} // namespace

auto PngWriter::write_u32(std::vector<uint8_t>& out, const uint32_t value) -> void
{
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>(value & 0xff));
}

auto PngWriter::write_chunk(std::vector<uint8_t>& out, const char name[4], const std::span<const uint8_t> data) -> void
{
    write_u32(out, static_cast<uint32_t>(data.size()));

    const size_t name_start = out.size();
    out.insert(out.end(), name, name + 4);
    out.insert(out.end(), data.begin(), data.end());

    // CRC covers the chunk name and payload.
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, out.data() + name_start, static_cast<uInt>(out.size() - name_start));
    write_u32(out, static_cast<uint32_t>(crc));
}

auto PngWriter::encode_grayscale(const size_t width, const size_t height, const std::span<const uint8_t> pixels)
    -> std::optional<std::vector<uint8_t>>
{
    if (width == 0 || height == 0 || pixels.size() != width * height ||
        width > 0x7fffffff || height > 0x7fffffff)
    {
        return std::nullopt;
    }

    std::vector<uint8_t> scanlines;
    scanlines.reserve((width + 1) * height);
    for (size_t y = 0; y < height; ++y)
    {
        scanlines.push_back(kFilterNone);
        const auto row = pixels.subspan(y * width, width);
        scanlines.insert(scanlines.end(), row.begin(), row.end());
    }

    uLongf compressed_size = compressBound(static_cast<uLong>(scanlines.size()));
    std::vector<uint8_t> idat(compressed_size);
    const int result = compress2(idat.data(), &compressed_size, scanlines.data(),
                                 static_cast<uLong>(scanlines.size()), Z_DEFAULT_COMPRESSION);
    if (result != Z_OK)
    {
        Log::error("zlib compress2 failed with code %d", result);
        return std::nullopt;
    }
    idat.resize(compressed_size);

    std::vector<uint8_t> ihdr;
    write_u32(ihdr, static_cast<uint32_t>(width));
    write_u32(ihdr, static_cast<uint32_t>(height));
    ihdr.push_back(8);
    ihdr.push_back(kColorTypeGray);
    ihdr.push_back(0); // compression method
    ihdr.push_back(0); // filter method
    ihdr.push_back(0); // interlace method

    std::vector<uint8_t> png(kPngMagic.begin(), kPngMagic.end());
    write_chunk(png, "IHDR", ihdr);
    write_chunk(png, "IDAT", idat);
    write_chunk(png, "IEND", {});
    return png;
}

auto PngWriter::save_grayscale(const std::string& filename, const size_t width, const size_t height,
                               const std::span<const uint8_t> pixels) -> bool
{
    const auto png = encode_grayscale(width, height, pixels);
    if (!png)
    {
        return false;
    }

    FILE* file = std::fopen(filename.c_str(), "wb");
    if (!file)
    {
        Log::error("cannot open %s for writing: %s", filename.c_str(), std::strerror(errno));
        return false;
    }
    const size_t written = std::fwrite(png->data(), 1, png->size(), file);
    const bool closed = std::fclose(file) == 0;
    if (written != png->size() || !closed)
    {
        Log::error("failed writing %s", filename.c_str());
        return false;
    }
    return true;
}

auto PngWriter::quantize(const LightmapTexture& lightmap) -> std::vector<uint8_t>
{
    std::vector<uint8_t> bytes(lightmap.texels.size());
    std::transform(lightmap.texels.begin(), lightmap.texels.end(), bytes.begin(), [](const float t) {
        return static_cast<uint8_t>(std::lround(std::clamp(t, 0.0f, 1.0f) * 255.0f));
    });
    return bytes;
}

auto PngWriter::save_lightmap(const std::string& filename, const LightmapTexture& lightmap) -> bool
{
    return save_grayscale(filename, lightmap.size, lightmap.size, quantize(lightmap));
}
