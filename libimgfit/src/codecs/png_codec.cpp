#include "../../include/png_codec.hpp"
#include "../../include/canvas.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
}

// cursor over the encoded bytes handed to libpng
struct MemoryReader {
    std::span<const std::uint8_t> data;
    std::size_t offset = 0;
};

void png_read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
    auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
    if (reader->offset + length > reader->data.size()) {
        png_error(png, "unexpected end of PNG data");
    }
    std::memcpy(out, reader->data.data() + reader->offset, length);
    reader->offset += length;
}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 * Ensures png_destroy_read_struct is called even if exceptions occur.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngRead() = default;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }

    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;
};

} // namespace

namespace imgfit {

Bitmap PngCodec::decode(const std::span<const std::uint8_t> data) const {
    if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
        throw DecodeError("PNG: missing signature");
    }

    Bitmap bitmap;
    try {
        PngRead r;
        r.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!r.png) throw std::runtime_error("png_create_read_struct failed");
        r.info = png_create_info_struct(r.png);
        if (!r.info) throw std::runtime_error("png_create_info_struct failed");

        MemoryReader reader{data, 0};
        png_set_read_fn(r.png, &reader, png_read_from_memory);
        png_read_info(r.png, r.info);

        png_uint_32 width = 0, height = 0;
        int bit_depth = 0, color_type = 0;
        png_get_IHDR(r.png, r.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        const std::uint64_t pixels = static_cast<std::uint64_t>(width) * height;
        if (pixels == 0 || pixels > Canvas::kMaxPixels) {
            throw std::runtime_error("PNG dimensions out of range");
        }

        if (bit_depth == 16) png_set_strip_16(r.png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(r.png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(r.png);
        if (png_get_valid(r.png, r.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(r.png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(r.png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(r.png);
        png_set_interlace_handling(r.png);
        png_read_update_info(r.png, r.info);

        if (png_get_rowbytes(r.png, r.info) != static_cast<png_size_t>(width) * 4) {
            throw std::runtime_error("unexpected PNG row layout");
        }

        bitmap.width = static_cast<int>(width);
        bitmap.height = static_cast<int>(height);
        bitmap.pixels.resize(static_cast<std::size_t>(pixels) * 4);

        std::vector<png_bytep> rows(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            rows[y] = bitmap.pixels.data() + static_cast<std::size_t>(y) * width * 4;
        }
        png_read_image(r.png, rows.data());
        png_read_end(r.png, nullptr);
    } catch (const std::bad_alloc&) {
        throw DecodeError("PNG: out of memory");
    } catch (const std::runtime_error& e) {
        Logger::log(LogLevel::Debug, std::string("PNG decode failed: ") + e.what(), "png_codec");
        throw DecodeError(std::string("PNG: ") + e.what());
    }

    Logger::log(LogLevel::Debug,
                "PNG decoded " + std::to_string(bitmap.width) + "x" + std::to_string(bitmap.height),
                "png_codec");
    return bitmap;
}

} // namespace imgfit
