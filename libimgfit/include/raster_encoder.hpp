/**
 * @file raster_encoder.hpp
 * @brief Serializes a rendered canvas to one of the output formats.
 */

#ifndef IMGFIT_RASTER_ENCODER_HPP
#define IMGFIT_RASTER_ENCODER_HPP

#include "codec_registry.hpp"
#include "image_types.hpp"

namespace imgfit {

class Canvas;

/**
 * @brief Encoder seam of the optimizer loop.
 */
class IRasterEncoder {
public:
    virtual ~IRasterEncoder() = default;

    /**
     * @brief Encodes the canvas.
     * @param quality Clamped quality in [0.30, 0.95].
     * @return Non-empty bytes tagged with the output MIME type.
     * @throws EncodeError on failure.
     */
    [[nodiscard]] virtual EncodedImage encode(const Canvas& canvas, OutputFormat format, double quality) = 0;
};

/**
 * @brief IRasterEncoder backed by the codecs of a CodecRegistry.
 */
class CodecEncoder final : public IRasterEncoder {
public:
    explicit CodecEncoder(const CodecRegistry& registry = CodecRegistry::instance());

    [[nodiscard]] EncodedImage encode(const Canvas& canvas, OutputFormat format, double quality) override;

private:
    const CodecRegistry& registry_;
};

} // namespace imgfit

#endif // IMGFIT_RASTER_ENCODER_HPP
