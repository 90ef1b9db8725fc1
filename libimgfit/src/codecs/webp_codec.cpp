#include "../../include/webp_codec.hpp"
#include "../../include/canvas.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <algorithm>
#include <string>

namespace {

// owns a WebPPicture and the memory writer it feeds
struct WebpEncodeState {
    WebPPicture picture{};
    WebPMemoryWriter writer{};

    WebpEncodeState() { WebPMemoryWriterInit(&writer); }

    ~WebpEncodeState() {
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
    }

    WebpEncodeState(const WebpEncodeState&) = delete;
    WebpEncodeState& operator=(const WebpEncodeState&) = delete;
};

const char* encoding_error_name(const WebPEncodingError code) {
    switch (code) {
        case VP8_ENC_ERROR_OUT_OF_MEMORY: return "out of memory";
        case VP8_ENC_ERROR_BITSTREAM_OUT_OF_MEMORY: return "bitstream out of memory";
        case VP8_ENC_ERROR_NULL_PARAMETER: return "null parameter";
        case VP8_ENC_ERROR_INVALID_CONFIGURATION: return "invalid configuration";
        case VP8_ENC_ERROR_BAD_DIMENSION: return "bad dimension";
        case VP8_ENC_ERROR_PARTITION0_OVERFLOW: return "partition 0 overflow";
        case VP8_ENC_ERROR_PARTITION_OVERFLOW: return "partition overflow";
        case VP8_ENC_ERROR_BAD_WRITE: return "bad write";
        case VP8_ENC_ERROR_FILE_TOO_BIG: return "file too big";
        case VP8_ENC_ERROR_USER_ABORT: return "user abort";
        default: return "unknown error";
    }
}

} // namespace

namespace imgfit {

Bitmap WebpCodec::decode(const std::span<const std::uint8_t> data) const {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        Logger::log(LogLevel::Debug, "WebP feature detection failed", "webp_codec");
        throw DecodeError("WebP: feature detection failed");
    }
    if (features.has_animation) {
        throw DecodeError("WebP: animated images are not supported by the bitmap path");
    }
    const std::uint64_t pixels = static_cast<std::uint64_t>(features.width) * features.height;
    if (features.width <= 0 || features.height <= 0 || pixels > Canvas::kMaxPixels) {
        throw DecodeError("WebP: dimensions out of range");
    }

    int width = 0, height = 0;
    std::uint8_t* decoded = WebPDecodeRGBA(data.data(), data.size(), &width, &height);
    if (!decoded) {
        Logger::log(LogLevel::Debug, "WebP decode failed (RGBA)", "webp_codec");
        throw DecodeError("WebP: decode failed");
    }

    Bitmap bitmap;
    bitmap.width = width;
    bitmap.height = height;
    try {
        bitmap.pixels.assign(decoded, decoded + static_cast<std::size_t>(width) * height * 4);
    } catch (const std::bad_alloc&) {
        WebPFree(decoded);
        throw DecodeError("WebP: out of memory");
    }
    WebPFree(decoded);

    Logger::log(LogLevel::Debug,
                "WebP decoded " + std::to_string(width) + "x" + std::to_string(height),
                "webp_codec");
    return bitmap;
}

std::vector<std::uint8_t> WebpCodec::encode(const Canvas& canvas, const double quality) const {
    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        Logger::log(LogLevel::Error, "WebpCodec: WebPConfigInit failed", "webp_codec");
        throw EncodeError("WebP: WebPConfigInit failed");
    }
    config.lossless = 0;
    config.quality = static_cast<float>(std::clamp(quality, 0.0, 1.0) * 100.0);
    if (!WebPValidateConfig(&config)) {
        throw EncodeError("WebP: invalid configuration");
    }

    WebpEncodeState state;
    if (!WebPPictureInit(&state.picture)) {
        Logger::log(LogLevel::Error, "WebpCodec: WebPPictureInit failed", "webp_codec");
        throw EncodeError("WebP: WebPPictureInit failed");
    }
    state.picture.use_argb = 1;
    state.picture.width = canvas.width();
    state.picture.height = canvas.height();
    if (!WebPPictureImportRGBA(&state.picture, canvas.rgba().data(), canvas.width() * 4)) {
        Logger::log(LogLevel::Error, "WebpCodec: WebPPictureImportRGBA failed", "webp_codec");
        throw EncodeError("WebP: WebPPictureImportRGBA failed");
    }

    state.picture.writer = WebPMemoryWrite;
    state.picture.custom_ptr = &state.writer;
    if (!WebPEncode(&config, &state.picture)) {
        const std::string reason = encoding_error_name(state.picture.error_code);
        Logger::log(LogLevel::Error, "WebpCodec: WebPEncode failed: " + reason, "webp_codec");
        throw EncodeError("WebP: " + reason);
    }
    if (state.writer.size == 0) {
        throw EncodeError("WebP: encoder produced no data");
    }

    std::vector<std::uint8_t> result(state.writer.mem, state.writer.mem + state.writer.size);
    Logger::log(LogLevel::Debug,
                "WebP encoded " + std::to_string(canvas.width()) + "x" + std::to_string(canvas.height()) +
                " q=" + std::to_string(config.quality) + " -> " + std::to_string(result.size()) + " bytes",
                "webp_codec");
    return result;
}

} // namespace imgfit
