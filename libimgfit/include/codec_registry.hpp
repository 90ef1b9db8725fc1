/**
 * @file codec_registry.hpp
 * @brief Defines the registry owning every in-memory ICodec.
 */

#ifndef IMGFIT_CODEC_REGISTRY_HPP
#define IMGFIT_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include "image_types.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace imgfit {

/**
 * @brief Registry of the built-in codecs.
 *
 * @details Owns one instance of each ICodec implementation (JpegCodec,
 * PngCodec, WebpCodec) and answers "who decodes this MIME type" and
 * "who encodes this output format". Lookups only read the registry, so
 * one instance can be shared between threads.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register all built-in codecs.
     */
    CodecRegistry();

    /**
     * @brief Finds the first codec able to decode the given MIME type.
     * @param mime MIME type string (e.g. "image/png"), compared case-insensitively.
     * @return A non-owning pointer, or nullptr if no codec decodes it.
     */
    [[nodiscard]] const ICodec* find_decoder(std::string_view mime) const;

    /**
     * @brief Finds the codec that encodes an output format.
     * @return A non-owning pointer, or nullptr if none is registered.
     */
    [[nodiscard]] const ICodec* find_encoder(OutputFormat format) const;

    /**
     * @brief Access all registered codecs.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<ICodec>>& all() const { return codecs_; }

    /**
     * @brief Process-wide registry used when the caller does not supply one.
     */
    static const CodecRegistry& instance();

private:
    std::vector<std::unique_ptr<ICodec>> codecs_;
};

} // namespace imgfit

#endif // IMGFIT_CODEC_REGISTRY_HPP
