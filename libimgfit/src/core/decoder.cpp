#include "../../include/decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_type.hpp"
#include "../../include/logger.hpp"
#include "../../include/universal_source.hpp"
#include <memory>
#include <string>
#include <utility>

namespace imgfit {

Decoder::Decoder(const CodecRegistry& registry) : registry_(registry) {}

RasterHandle Decoder::decode(const ImageBuffer& input) const {
    if (input.bytes.empty()) {
        throw DecodeError("Cannot decode an empty buffer");
    }

    // a known signature with an in-memory codec takes the fast path
    const std::string sniffed = sniff_image_mime(input.bytes);
    if (const ICodec* codec = sniffed.empty() ? nullptr : registry_.find_decoder(sniffed)) {
        try {
            Bitmap bitmap = codec->decode(input.bytes);
            Logger::log(LogLevel::Debug, std::string(codec->get_name()) + " decoded " + sniffed, "decoder");
            return RasterHandle(std::make_unique<BitmapSource>(std::move(bitmap), sniffed));
        } catch (const DecodeError& e) {
            Logger::log(LogLevel::Info,
                        std::string(codec->get_name()) + " rejected input (" + e.what() +
                        "), falling back to the universal decoder",
                        "decoder");
        }
    } else {
        Logger::log(LogLevel::Debug,
                    "No in-memory codec for '" + (sniffed.empty() ? std::string("unknown") : sniffed) +
                    "', using the universal decoder",
                    "decoder");
    }

    try {
        return RasterHandle(std::make_unique<UniversalSource>(input.bytes));
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Error, std::string("Unable to decode image: ") + e.what(), "decoder");
        throw;
    }
}

} // namespace imgfit
