/**
 * @file decoder.hpp
 * @brief Turns encoded image bytes into a RasterHandle.
 */

#ifndef IMGFIT_DECODER_HPP
#define IMGFIT_DECODER_HPP

#include "codec_registry.hpp"
#include "image_types.hpp"
#include "raster_source.hpp"

namespace imgfit {

/**
 * @brief Two-path image decoder.
 *
 * @details The signature of the input is sniffed first. When a registered
 * codec decodes that format in memory, its bitmap backs the handle
 * (BitmapSource). Otherwise, or when that codec rejects the data, the
 * bytes go through the file-backed UniversalSource. Callers only see the
 * resulting RasterHandle.
 */
class Decoder {
public:
    explicit Decoder(const CodecRegistry& registry = CodecRegistry::instance());

    /**
     * @brief Decodes an encoded buffer.
     * @param input Encoded bytes; the declared MIME type is not trusted for decoding.
     * @return A handle owning the decoded source.
     * @throws DecodeError if neither path can interpret the bytes.
     */
    [[nodiscard]] RasterHandle decode(const ImageBuffer& input) const;

private:
    const CodecRegistry& registry_;
};

} // namespace imgfit

#endif // IMGFIT_DECODER_HPP
