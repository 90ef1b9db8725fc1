#include "../../include/raster_encoder.hpp"
#include "../../include/canvas.hpp"
#include "../../include/errors.hpp"
#include <string>

namespace imgfit {

CodecEncoder::CodecEncoder(const CodecRegistry& registry) : registry_(registry) {}

EncodedImage CodecEncoder::encode(const Canvas& canvas, const OutputFormat format, const double quality) {
    const std::string_view mime = output_format_mime(format);
    const ICodec* codec = registry_.find_encoder(format);
    if (!codec) {
        throw EncodeError("No encoder registered for " + std::string(mime));
    }

    EncodedImage out;
    out.bytes = codec->encode(canvas, quality);
    if (out.bytes.empty()) {
        throw EncodeError(std::string(codec->get_name()) + " produced no data");
    }
    out.mime_type = mime;
    return out;
}

} // namespace imgfit
