#include "../../include/raster_source.hpp"
#include "../../include/canvas.hpp"
#include <stdexcept>
#include <utility>

namespace imgfit {

BitmapSource::BitmapSource(Bitmap bitmap, std::string mime_type)
    : bitmap_(std::move(bitmap)), width_(bitmap_.width), height_(bitmap_.height),
      mime_type_(std::move(mime_type)) {
    if (bitmap_.empty()) {
        throw std::invalid_argument("BitmapSource: empty bitmap");
    }
}

void BitmapSource::render(Canvas& canvas) {
    canvas.draw(bitmap_);
}

void BitmapSource::release() noexcept {
    std::vector<std::uint8_t>().swap(bitmap_.pixels);
}

RasterHandle::RasterHandle(std::unique_ptr<IRasterSource> source) : source_(std::move(source)) {
    if (!source_) {
        throw std::invalid_argument("RasterHandle: null source");
    }
}

RasterHandle::~RasterHandle() {
    release();
}

RasterHandle& RasterHandle::operator=(RasterHandle&& other) noexcept {
    if (this != &other) {
        release();
        source_ = std::move(other.source_);
    }
    return *this;
}

IRasterSource& RasterHandle::checked() const {
    if (!source_) {
        throw std::logic_error("RasterHandle: used after release");
    }
    return *source_;
}

int RasterHandle::width() const { return checked().width(); }
int RasterHandle::height() const { return checked().height(); }
std::string_view RasterHandle::mime_type() const { return checked().mime_type(); }
std::string_view RasterHandle::path_name() const { return checked().path_name(); }

void RasterHandle::render(Canvas& canvas) {
    checked().render(canvas);
}

void RasterHandle::release() noexcept {
    if (source_) {
        source_->release();
        source_.reset();
    }
}

} // namespace imgfit
