#include "../../include/jpeg_codec.hpp"
#include "../../include/canvas.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

// corrupt-data warnings are reported, not fatal
void jpeg_emit_message_log(const j_common_ptr cinfo, const int msg_level) {
    if (msg_level < 0) {
        char buffer[JMSG_LENGTH_MAX];
        (*cinfo->err->format_message)(cinfo, buffer);
        Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
    }
}

/**
 * @brief RAII wrapper for a libjpeg decompressor.
 * Ensures jpeg_destroy_decompress is called even if exceptions occur.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.emit_message = jpeg_emit_message_log;
        jpeg_create_decompress(&cinfo);
    }

    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief libjpeg destination manager appending to a std::vector.
 */
struct VectorDestination {
    jpeg_destination_mgr pub{};
    std::vector<std::uint8_t>* out = nullptr;
    std::vector<JOCTET> chunk = std::vector<JOCTET>(64 * 1024);

    static void init(const j_compress_ptr cinfo) {
        auto* self = reinterpret_cast<VectorDestination*>(cinfo->dest);
        self->pub.next_output_byte = self->chunk.data();
        self->pub.free_in_buffer = self->chunk.size();
    }

    static boolean empty(const j_compress_ptr cinfo) {
        auto* self = reinterpret_cast<VectorDestination*>(cinfo->dest);
        self->out->insert(self->out->end(), self->chunk.begin(), self->chunk.end());
        init(cinfo);
        return TRUE;
    }

    static void term(const j_compress_ptr cinfo) {
        auto* self = reinterpret_cast<VectorDestination*>(cinfo->dest);
        const std::size_t used = self->chunk.size() - self->pub.free_in_buffer;
        self->out->insert(self->out->end(), self->chunk.begin(),
                          self->chunk.begin() + static_cast<std::ptrdiff_t>(used));
    }
};

/**
 * @brief RAII wrapper for a libjpeg compressor.
 * Ensures jpeg_destroy_compress is called even if exceptions occur.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    VectorDestination dest{};

    explicit JpegCompress(std::vector<std::uint8_t>& out) {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_compress(&cinfo);

        dest.out = &out;
        dest.pub.init_destination = VectorDestination::init;
        dest.pub.empty_output_buffer = VectorDestination::empty;
        dest.pub.term_destination = VectorDestination::term;
        cinfo.dest = &dest.pub;
    }

    ~JpegCompress() { jpeg_destroy_compress(&cinfo); }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

} // namespace

namespace imgfit {

Bitmap JpegCodec::decode(const std::span<const std::uint8_t> data) const {
    if (data.empty()) {
        throw DecodeError("JPEG: empty input");
    }

    Bitmap bitmap;
    try {
        JpegDecompress d;
        // older libjpeg headers declare the input buffer non-const
        jpeg_mem_src(&d.cinfo, const_cast<unsigned char*>(data.data()), static_cast<unsigned long>(data.size()));

        if (jpeg_read_header(&d.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }
        if (d.cinfo.jpeg_color_space == JCS_CMYK || d.cinfo.jpeg_color_space == JCS_YCCK) {
            throw std::runtime_error("CMYK JPEG is not supported by the bitmap path");
        }

        const std::uint64_t pixels = static_cast<std::uint64_t>(d.cinfo.image_width) * d.cinfo.image_height;
        if (pixels == 0 || pixels > Canvas::kMaxPixels) {
            throw std::runtime_error("JPEG dimensions out of range");
        }

        d.cinfo.out_color_space = JCS_RGB;
        jpeg_start_decompress(&d.cinfo);

        bitmap.width = static_cast<int>(d.cinfo.output_width);
        bitmap.height = static_cast<int>(d.cinfo.output_height);
        bitmap.pixels.resize(static_cast<std::size_t>(bitmap.width) * bitmap.height * 4);

        std::vector<unsigned char> scanline(static_cast<std::size_t>(bitmap.width) * 3);
        while (d.cinfo.output_scanline < d.cinfo.output_height) {
            JSAMPROW row = scanline.data();
            const std::size_t y = d.cinfo.output_scanline;
            if (jpeg_read_scanlines(&d.cinfo, &row, 1) != 1) {
                throw std::runtime_error("Truncated JPEG scanline data");
            }
            std::uint8_t* out = bitmap.pixels.data() + y * bitmap.width * 4;
            for (int x = 0; x < bitmap.width; ++x) {
                out[x * 4] = scanline[x * 3];
                out[x * 4 + 1] = scanline[x * 3 + 1];
                out[x * 4 + 2] = scanline[x * 3 + 2];
                out[x * 4 + 3] = 255;
            }
        }

        jpeg_finish_decompress(&d.cinfo);
    } catch (const std::bad_alloc&) {
        throw DecodeError("JPEG: out of memory");
    } catch (const std::runtime_error& e) {
        Logger::log(LogLevel::Debug, std::string("JPEG decode failed: ") + e.what(), "jpeg_codec");
        throw DecodeError(std::string("JPEG: ") + e.what());
    }

    Logger::log(LogLevel::Debug,
                "JPEG decoded " + std::to_string(bitmap.width) + "x" + std::to_string(bitmap.height),
                "jpeg_codec");
    return bitmap;
}

std::vector<std::uint8_t> JpegCodec::encode(const Canvas& canvas, const double quality) const {
    const int q = std::clamp(static_cast<int>(std::lround(quality * 100.0)), 1, 100);
    const std::vector<std::uint8_t> rgb = canvas.to_rgb();

    std::vector<std::uint8_t> result;
    try {
        JpegCompress c(result);

        c.cinfo.image_width = static_cast<JDIMENSION>(canvas.width());
        c.cinfo.image_height = static_cast<JDIMENSION>(canvas.height());
        c.cinfo.input_components = 3;
        c.cinfo.in_color_space = JCS_RGB;
        jpeg_set_defaults(&c.cinfo);
        jpeg_set_quality(&c.cinfo, q, TRUE);
        c.cinfo.optimize_coding = TRUE;

        jpeg_start_compress(&c.cinfo, TRUE);
        const std::size_t stride = static_cast<std::size_t>(canvas.width()) * 3;
        while (c.cinfo.next_scanline < c.cinfo.image_height) {
            // libjpeg takes non-const rows but does not write through them
            auto row = const_cast<JSAMPROW>(rgb.data() + c.cinfo.next_scanline * stride);
            jpeg_write_scanlines(&c.cinfo, &row, 1);
        }
        jpeg_finish_compress(&c.cinfo);

        if (result.empty()) {
            throw EncodeError("JPEG: encoder produced no data");
        }
    } catch (const EncodeError&) {
        throw;
    } catch (const std::runtime_error& e) {
        Logger::log(LogLevel::Error, std::string("JPEG encode failed: ") + e.what(), "jpeg_codec");
        throw EncodeError(std::string("JPEG: ") + e.what());
    }

    Logger::log(LogLevel::Debug,
                "JPEG encoded " + std::to_string(canvas.width()) + "x" + std::to_string(canvas.height()) +
                " q=" + std::to_string(q) + " -> " + std::to_string(result.size()) + " bytes",
                "jpeg_codec");
    return result;
}

} // namespace imgfit
