/**
 * @file codec.hpp
 * @brief Interface implemented by every in-memory image codec.
 */

#ifndef IMGFIT_CODEC_HPP
#define IMGFIT_CODEC_HPP

#include "image_types.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * @namespace imgfit
 * @brief The main namespace of the imgfit library.
 *
 * @details Contains the codec interface and its libjpeg/libpng/libwebp
 * implementations, the two-path decoder, the render surface, the
 * quality/scale search (Optimizer) and the public ImageOptimizer facade.
 */
namespace imgfit {

class Canvas;

/**
 * @brief Interface for an in-memory image codec.
 *
 * Each implementation targets a single format. It describes the MIME
 * types it handles and which directions it supports; the CodecRegistry
 * owns the instances and hands out non-owning pointers.
 *
 * Implementations are stateless: every call sets up and tears down its
 * own library context, so one instance serves concurrent calls.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "JpegCodec").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/jpeg").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;

    // --- capabilities ---

    /// @return True if decode() is implemented.
    [[nodiscard]] virtual bool can_decode() const noexcept = 0;

    /// @return True if encode() is implemented.
    [[nodiscard]] virtual bool can_encode() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decodes an encoded buffer to RGBA.
     * @param data Encoded bytes.
     * @return The decoded bitmap.
     * @throws DecodeError if the data is corrupt or unsupported.
     */
    [[nodiscard]] virtual Bitmap decode(std::span<const std::uint8_t> data) const = 0;

    /**
     * @brief Encodes a canvas.
     * @param canvas Pixels to encode.
     * @param quality Quality in [0, 1]; already clamped by the caller.
     * @return Encoded bytes, never empty.
     * @throws EncodeError if the library fails or produces no output.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode(const Canvas& canvas, double quality) const = 0;
};

} // namespace imgfit

#endif // IMGFIT_CODEC_HPP
