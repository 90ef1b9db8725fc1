#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>
#include <cctype>

namespace imgfit {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
}

const ICodec* CodecRegistry::find_decoder(const std::string_view mime) const {
    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_) {
        if (!codec->can_decode()) continue;
        for (const auto supported_mime : codec->get_supported_mime_types()) {
            if (iequals(supported_mime, mime)) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

const ICodec* CodecRegistry::find_encoder(const OutputFormat format) const {
    const std::string_view mime = output_format_mime(format);
    for (const auto& codec : codecs_) {
        if (!codec->can_encode()) continue;
        const auto mimes = codec->get_supported_mime_types();
        if (std::ranges::find(mimes, mime) != mimes.end()) {
            return codec.get();
        }
    }
    return nullptr;
}

const CodecRegistry& CodecRegistry::instance() {
    static const CodecRegistry registry;
    return registry;
}

} // namespace imgfit
