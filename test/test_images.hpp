#ifndef IMGFIT_TEST_IMAGES_HPP
#define IMGFIT_TEST_IMAGES_HPP

#include "../libimgfit/include/canvas.hpp"
#include "../libimgfit/include/jpeg_codec.hpp"
#include <png.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

// encoded fixtures built in memory, so the suite needs no data files
namespace test_images {

inline void put_le(std::vector<std::uint8_t>& out, std::uint32_t v, const int bytes)
{
    for (int i = 0; i < bytes; ++i)
    {
        out.push_back(static_cast<std::uint8_t>(v & 0xFF));
        v >>= 8;
    }
}

// 24-bit uncompressed BMP filled with one color
inline std::vector<std::uint8_t> bmp(const int width, const int height,
                                     const std::uint8_t r, const std::uint8_t g, const std::uint8_t b)
{
    const std::uint32_t row = (static_cast<std::uint32_t>(width) * 3 + 3) & ~3u;
    const std::uint32_t image_size = row * static_cast<std::uint32_t>(height);

    std::vector<std::uint8_t> out{'B', 'M'};
    put_le(out, 54 + image_size, 4);
    put_le(out, 0, 4);
    put_le(out, 54, 4);
    put_le(out, 40, 4);
    put_le(out, static_cast<std::uint32_t>(width), 4);
    put_le(out, static_cast<std::uint32_t>(height), 4);
    put_le(out, 1, 2);
    put_le(out, 24, 2);
    put_le(out, 0, 4);
    put_le(out, image_size, 4);
    put_le(out, 2835, 4);
    put_le(out, 2835, 4);
    put_le(out, 0, 4);
    put_le(out, 0, 4);

    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            out.push_back(b);
            out.push_back(g);
            out.push_back(r);
        }
        for (std::uint32_t pad = static_cast<std::uint32_t>(width) * 3; pad < row; ++pad)
            out.push_back(0);
    }
    return out;
}

// RGBA PNG written with libpng's simplified API
inline std::vector<std::uint8_t> png_rgba(const int width, const int height,
                                          const std::vector<std::uint8_t>& rgba)
{
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(width);
    image.height = static_cast<png_uint_32>(height);
    image.format = PNG_FORMAT_RGBA;

    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(&image, nullptr, &size, 0, rgba.data(), 0, nullptr))
        throw std::runtime_error(image.message);
    std::vector<std::uint8_t> out(size);
    if (!png_image_write_to_memory(&image, out.data(), &size, 0, rgba.data(), 0, nullptr))
        throw std::runtime_error(image.message);
    out.resize(size);
    return out;
}

inline std::vector<std::uint8_t> transparent_png(const int width, const int height)
{
    return png_rgba(width, height,
                    std::vector<std::uint8_t>(static_cast<std::size_t>(width) * height * 4, 0));
}

// PNG whose first IDAT checksum is wrong: libpng refuses it, readers
// that skip CRC checks still decode it
inline std::vector<std::uint8_t> png_with_bad_crc(const int width, const int height,
                                                  const std::uint8_t r, const std::uint8_t g, const std::uint8_t b)
{
    std::vector<std::uint8_t> rgba;
    for (int i = 0; i < width * height; ++i)
        rgba.insert(rgba.end(), {r, g, b, 255});
    auto out = png_rgba(width, height, rgba);

    // chunks: 4-byte big-endian length, 4-byte type, data, 4-byte CRC
    std::size_t pos = 8;
    while (pos + 8 <= out.size())
    {
        const std::uint32_t length = (std::uint32_t{out[pos]} << 24) | (std::uint32_t{out[pos + 1]} << 16) |
                                     (std::uint32_t{out[pos + 2]} << 8) | std::uint32_t{out[pos + 3]};
        if (std::equal(out.begin() + pos + 4, out.begin() + pos + 8, "IDAT"))
        {
            out[pos + 8 + length] ^= 0xFF;
            return out;
        }
        pos += 12 + length;
    }
    throw std::runtime_error("fixture has no IDAT chunk");
}

// baseline little-endian TIFF: one uncompressed RGB strip
inline std::vector<std::uint8_t> tiff_rgb(const int width, const int height,
                                          const std::uint8_t r, const std::uint8_t g, const std::uint8_t b)
{
    constexpr std::uint16_t kShort = 3;
    constexpr std::uint16_t kLong = 4;
    constexpr std::uint32_t kEntries = 10;
    constexpr std::uint32_t kIfdOffset = 8;
    constexpr std::uint32_t kBitsOffset = kIfdOffset + 2 + kEntries * 12 + 4;
    constexpr std::uint32_t kPixelOffset = kBitsOffset + 6;
    const auto w = static_cast<std::uint32_t>(width);
    const auto h = static_cast<std::uint32_t>(height);

    std::vector<std::uint8_t> out{'I', 'I', 42, 0};
    put_le(out, kIfdOffset, 4);
    put_le(out, kEntries, 2);
    auto entry = [&out](std::uint16_t tag, std::uint16_t type, std::uint32_t count, std::uint32_t value) {
        put_le(out, tag, 2);
        put_le(out, type, 2);
        put_le(out, count, 4);
        put_le(out, value, 4);
    };
    entry(256, kLong, 1, w);                 // ImageWidth
    entry(257, kLong, 1, h);                 // ImageLength
    entry(258, kShort, 3, kBitsOffset);      // BitsPerSample
    entry(259, kShort, 1, 1);                // Compression: none
    entry(262, kShort, 1, 2);                // Photometric: RGB
    entry(273, kLong, 1, kPixelOffset);      // StripOffsets
    entry(277, kShort, 1, 3);                // SamplesPerPixel
    entry(278, kLong, 1, h);                 // RowsPerStrip
    entry(279, kLong, 1, w * h * 3);         // StripByteCounts
    entry(284, kShort, 1, 1);                // PlanarConfiguration: contiguous
    put_le(out, 0, 4);

    for (int i = 0; i < 3; ++i)
        put_le(out, 8, 2);
    for (std::uint32_t i = 0; i < w * h; ++i)
        out.insert(out.end(), {r, g, b});
    return out;
}

// JPEG of a horizontal gradient
inline std::vector<std::uint8_t> jpeg(const int width, const int height, const double quality = 0.9)
{
    imgfit::Canvas canvas(width, height);
    imgfit::Bitmap gradient;
    gradient.width = width;
    gradient.height = height;
    gradient.pixels.resize(static_cast<std::size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            auto* p = gradient.pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4;
            p[0] = static_cast<std::uint8_t>(x * 255 / std::max(1, width - 1));
            p[1] = static_cast<std::uint8_t>(y * 255 / std::max(1, height - 1));
            p[2] = 128;
            p[3] = 255;
        }
    }
    canvas.draw(gradient);
    return imgfit::JpegCodec().encode(canvas, quality);
}

} // namespace test_images

#endif // IMGFIT_TEST_IMAGES_HPP
