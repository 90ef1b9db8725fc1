/**
 * @file image_types.hpp
 * @brief Plain data types shared by the decoder, the optimizer and the encoders.
 */

#ifndef IMGFIT_IMAGE_TYPES_HPP
#define IMGFIT_IMAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgfit {

/**
 * @brief Output formats the optimizer can re-encode to.
 */
enum class OutputFormat {
    JPEG,
    WEBP
};

/**
 * @brief MIME type produced for an output format.
 */
[[nodiscard]] constexpr std::string_view output_format_mime(const OutputFormat fmt) noexcept {
    switch (fmt) {
        case OutputFormat::JPEG: return "image/jpeg";
        case OutputFormat::WEBP: return "image/webp";
    }
    return "application/octet-stream";
}

/**
 * @brief Encoded input image. Non-owning: the caller keeps the bytes alive
 * for the duration of the call.
 */
struct ImageBuffer {
    std::span<const std::uint8_t> bytes; ///< Encoded image data
    std::string mime_type;               ///< Declared format, may be empty if unknown

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

/**
 * @brief Decoded raster: RGBA8, straight (non-premultiplied) alpha,
 * rows top to bottom, stride width * 4.
 */
struct Bitmap {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] bool empty() const noexcept {
        return width <= 0 || height <= 0 || pixels.empty();
    }
};

/**
 * @brief Constraints and starting point for one optimization call.
 *
 * Every field has its own default, so any subset may be given:
 * @code
 * imgfit::OptimizeOptions opts{.max_bytes = 512 * 1024};
 * @endcode
 */
struct OptimizeOptions {
    int max_dimension = 2048;                          ///< Longest-edge cap in pixels
    std::size_t max_bytes = 6 * 1024 * 1024;           ///< Encoded-size cap
    OutputFormat output_format = OutputFormat::JPEG;   ///< Re-encode target
    double quality = 0.85;                             ///< Initial quality, clamped to [0.30, 0.95]
};

/**
 * @brief Encoder output: compressed bytes plus the MIME type they carry.
 */
struct EncodedImage {
    std::vector<std::uint8_t> bytes;
    std::string mime_type;
};

/**
 * @brief Outcome of an optimization call.
 *
 * When optimized is false, data is a byte-identical copy of the input and
 * width/height are the natural dimensions. When it is true, width/height
 * are the dimensions of the image actually encoded into data.
 */
struct OptimizedResult {
    std::vector<std::uint8_t> data;
    int width = 0;
    int height = 0;
    std::string mime_type;
    std::size_t original_bytes = 0;
    std::size_t output_bytes = 0;
    bool optimized = false;
    int attempts = 0; ///< Encode attempts performed (0 on passthrough)

    /**
     * @brief Self-describing form: "data:<mime_type>;base64,<payload>".
     */
    [[nodiscard]] std::string data_uri() const;
};

} // namespace imgfit

#endif // IMGFIT_IMAGE_TYPES_HPP
