/**
 * @file webp_codec.hpp
 * @brief Defines the ICodec implementation for WebP.
 */

#ifndef IMGFIT_WEBP_CODEC_HPP
#define IMGFIT_WEBP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace imgfit {

    /**
     * @brief Implements ICodec for WebP using libwebp.
     *
     * @details Encoding is lossy and keeps the alpha channel of the canvas.
     */
    class WebpCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] bool can_decode() const noexcept override { return true; }
        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        /**
         * @brief Decodes a still WebP (lossy or lossless) to RGBA.
         * @throws DecodeError if libwebp rejects the bitstream.
         */
        [[nodiscard]] Bitmap decode(std::span<const std::uint8_t> data) const override;

        /**
         * @brief Encodes the canvas as lossy WebP.
         * @param quality Mapped to WebPConfig::quality = quality * 100.
         * @throws EncodeError on libwebp errors.
         */
        [[nodiscard]] std::vector<std::uint8_t> encode(const Canvas& canvas, double quality) const override;
    };

} // namespace imgfit

#endif // IMGFIT_WEBP_CODEC_HPP
