/**
 * @file jpeg_codec.hpp
 * @brief Defines the ICodec implementation for JPEG.
 */

#ifndef IMGFIT_JPEG_CODEC_HPP
#define IMGFIT_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace imgfit {

    /**
     * @brief Implements ICodec for JPEG using libjpeg.
     *
     * @details Decoding converts any color space libjpeg can map to RGB
     * (grayscale, YCbCr) and reports alpha as opaque. Encoding drops the
     * canvas alpha channel, so callers composite onto an opaque background
     * first.
     */
    class JpegCodec final : public ICodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        // --- capabilities ---
        [[nodiscard]] bool can_decode() const noexcept override { return true; }
        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        // --- operations ---

        /**
         * @brief Decodes a baseline or progressive JPEG from memory.
         * @throws DecodeError on libjpeg errors, CMYK input or oversized images.
         */
        [[nodiscard]] Bitmap decode(std::span<const std::uint8_t> data) const override;

        /**
         * @brief Encodes the canvas as RGB JPEG with optimized Huffman tables.
         * @param quality Mapped to libjpeg quality round(quality * 100).
         * @throws EncodeError on libjpeg errors.
         */
        [[nodiscard]] std::vector<std::uint8_t> encode(const Canvas& canvas, double quality) const override;
    };

} // namespace imgfit

#endif // IMGFIT_JPEG_CODEC_HPP
