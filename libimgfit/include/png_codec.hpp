/**
 * @file png_codec.hpp
 * @brief Defines the decode-only ICodec implementation for PNG.
 */

#ifndef IMGFIT_PNG_CODEC_HPP
#define IMGFIT_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <stdexcept>
#include <string_view>
#include <span>

namespace imgfit {

    /**
     * @brief Implements ICodec for PNG using libpng (decode only).
     *
     * @details Every color type and bit depth is expanded to RGBA8:
     * palettes and tRNS become an alpha channel, 16-bit samples are
     * stripped and grayscale is widened to RGB. Interlaced images are
     * de-interlaced by libpng.
     */
    class PngCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/apng" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] bool can_decode() const noexcept override { return true; }
        [[nodiscard]] bool can_encode() const noexcept override { return false; }

        /**
         * @brief Decodes a PNG held in memory.
         * @throws DecodeError on libpng errors, truncated data or oversized images.
         */
        [[nodiscard]] Bitmap decode(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] std::vector<std::uint8_t> encode(const Canvas&, double) const override {
            throw std::logic_error("PngCodec: encoding is not supported");
        }
    };

} // namespace imgfit

#endif // IMGFIT_PNG_CODEC_HPP
