#include "../../include/universal_source.hpp"
#include "../../include/canvas.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_type.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <tiffio.h>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// --- STB Implementation ---
// define implementations in this single .cpp file
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
// --------------------------

namespace {

constexpr const char* kTag = "universal_source";

void tiff_message(const LogLevel level, const char* module, const char* fmt, va_list ap) {
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    Logger::log(level, std::string("libtiff") + (module ? std::string(" ") + module : "") + ": " + buffer, "libtiff");
}

void tiff_error_handler(const char* module, const char* fmt, va_list ap) {
    tiff_message(LogLevel::Debug, module, fmt, ap);
}

void tiff_warning_handler(const char* module, const char* fmt, va_list ap) {
    tiff_message(LogLevel::Debug, module, fmt, ap);
}

// libtiff handlers are process-wide; route them to the logger once
void install_tiff_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        TIFFSetErrorHandler(tiff_error_handler);
        TIFFSetWarningHandler(tiff_warning_handler);
    });
}

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};
using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

unique_TIFF open_tiff(const std::filesystem::path& path) {
    install_tiff_handlers();
    return unique_TIFF(TIFFOpen(path.string().c_str(), "r"));
}

void check_dimensions(const std::uint64_t width, const std::uint64_t height) {
    if (width == 0 || height == 0 || width * height > imgfit::Canvas::kMaxPixels) {
        throw imgfit::DecodeError("Image dimensions out of range: " + std::to_string(width) + "x" +
                                  std::to_string(height));
    }
}

} // namespace

namespace imgfit {

UniversalSource::UniversalSource(const std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) {
        throw DecodeError("Universal decoder: empty input");
    }

    temp_dir_ = make_temp_dir("decode");
    try {
        file_ = temp_dir_ / "input.img";
        write_file_bytes(file_, bytes);

        mime_type_ = MimeDetector::detect(file_);
        if (mime_type_.rfind("image/", 0) != 0) {
            // libmagic may not know the format; trust the signature if it does
            if (const std::string sniffed = sniff_image_mime(bytes); !sniffed.empty()) {
                mime_type_ = sniffed;
            }
        }

        if (mime_type_ == "image/tiff") {
            read_tiff_header();
        } else {
            read_stb_header();
        }
    } catch (...) {
        cleanup_temp_dir(temp_dir_, kTag);
        throw;
    }

    Logger::log(LogLevel::Debug,
                "Universal decode of " + mime_type_ + " " + std::to_string(width_) + "x" +
                std::to_string(height_) + " via " + file_.string(),
                kTag);
}

UniversalSource::~UniversalSource() {
    release();
}

void UniversalSource::read_tiff_header() {
    const auto tif = open_tiff(file_);
    if (!tif) {
        throw DecodeError("TIFF: cannot open " + mime_type_ + " stream");
    }
    std::uint32_t w = 0, h = 0;
    if (!TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &w) ||
        !TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &h)) {
        throw DecodeError("TIFF: missing image dimensions");
    }
    check_dimensions(w, h);
    reader_ = Reader::Tiff;
    width_ = static_cast<int>(w);
    height_ = static_cast<int>(h);
}

void UniversalSource::read_stb_header() {
    const unique_FILE in(open_file(file_, "rb"));
    if (!in) {
        throw DecodeError("Universal decoder: cannot reopen " + file_.string());
    }
    int w = 0, h = 0, channels = 0;
    if (!stbi_info_from_file(in.get(), &w, &h, &channels)) {
        throw DecodeError(std::string("Unsupported image data: ") + stbi_failure_reason());
    }
    check_dimensions(static_cast<std::uint64_t>(w), static_cast<std::uint64_t>(h));
    reader_ = Reader::Stb;
    width_ = w;
    height_ = h;
}

Bitmap UniversalSource::load_tiff() const {
    const auto tif = open_tiff(file_);
    if (!tif) {
        throw DecodeError("TIFF: cannot reopen " + file_.string());
    }

    const std::size_t count = static_cast<std::size_t>(width_) * height_;
    std::vector<std::uint32_t> raster(count);
    if (!TIFFReadRGBAImageOriented(tif.get(), static_cast<std::uint32_t>(width_),
                                   static_cast<std::uint32_t>(height_), raster.data(),
                                   ORIENTATION_TOPLEFT, 0)) {
        throw DecodeError("TIFF: TIFFReadRGBAImageOriented failed");
    }

    Bitmap bitmap;
    bitmap.width = width_;
    bitmap.height = height_;
    bitmap.pixels.resize(count * 4);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint32_t p = raster[i];
        bitmap.pixels[i * 4] = static_cast<std::uint8_t>(TIFFGetR(p));
        bitmap.pixels[i * 4 + 1] = static_cast<std::uint8_t>(TIFFGetG(p));
        bitmap.pixels[i * 4 + 2] = static_cast<std::uint8_t>(TIFFGetB(p));
        bitmap.pixels[i * 4 + 3] = static_cast<std::uint8_t>(TIFFGetA(p));
    }
    return bitmap;
}

Bitmap UniversalSource::load_stb() const {
    const unique_FILE in(open_file(file_, "rb"));
    if (!in) {
        throw DecodeError("Universal decoder: cannot reopen " + file_.string());
    }
    int w = 0, h = 0, channels = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> data(
        stbi_load_from_file(in.get(), &w, &h, &channels, 4), &stbi_image_free);
    if (!data) {
        Logger::log(LogLevel::Error, std::string("stb_image load failed: ") + stbi_failure_reason(), kTag);
        throw DecodeError(std::string("Failed to load image data: ") + stbi_failure_reason());
    }
    if (w != width_ || h != height_) {
        throw DecodeError("Image dimensions changed between header and pixel read");
    }

    Bitmap bitmap;
    bitmap.width = w;
    bitmap.height = h;
    bitmap.pixels.assign(data.get(), data.get() + static_cast<std::size_t>(w) * h * 4);
    return bitmap;
}

void UniversalSource::render(Canvas& canvas) {
    if (released_) {
        throw std::logic_error("UniversalSource: render after release");
    }
    if (pixels_.empty()) {
        try {
            pixels_ = reader_ == Reader::Tiff ? load_tiff() : load_stb();
        } catch (const std::bad_alloc&) {
            throw DecodeError("Universal decoder: out of memory loading " + mime_type_);
        }
        Logger::log(LogLevel::Debug, "Loaded pixels from " + file_.string(), kTag);
    }
    canvas.draw(pixels_);
}

void UniversalSource::release() noexcept {
    if (released_) return;
    released_ = true;
    std::vector<std::uint8_t>().swap(pixels_.pixels);
    cleanup_temp_dir(temp_dir_, kTag);
}

} // namespace imgfit
