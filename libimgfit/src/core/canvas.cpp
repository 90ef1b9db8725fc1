#include "../../include/canvas.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <new>
#include <stdexcept>
#include <string>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

namespace {

// area averaging when an axis shrinks, linear interpolation when it grows
stbir_filter filter_for(const int src, const int dst) {
    return dst < src ? STBIR_FILTER_BOX : STBIR_FILTER_TRIANGLE;
}

std::uint8_t to_byte(const float v) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

namespace imgfit {

Canvas::Canvas(const int width, const int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw ContextUnavailableError("Canvas: invalid size " + std::to_string(width) + "x" +
                                      std::to_string(height));
    }
    const std::uint64_t count = static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
    if (count > kMaxPixels) {
        throw ContextUnavailableError("Canvas: " + std::to_string(width) + "x" +
                                      std::to_string(height) + " exceeds the surface limit");
    }
    try {
        pixels_.assign(static_cast<std::size_t>(count) * 4, 0);
    } catch (const std::bad_alloc&) {
        Logger::log(LogLevel::Error, "Canvas allocation failed for " + std::to_string(width) + "x" +
                    std::to_string(height), "canvas");
        throw ContextUnavailableError("Canvas: out of memory");
    }
}

void Canvas::fill(const Rgba color) {
    for (std::size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
        pixels_[i + 3] = color.a;
    }
}

void Canvas::draw(const Bitmap& source) {
    if (source.empty() ||
        source.pixels.size() < static_cast<std::size_t>(source.width) * source.height * 4) {
        throw std::invalid_argument("Canvas::draw: empty or truncated bitmap");
    }

    // STBIR_RGBA weights color by alpha, so transparent pixels never bleed;
    // samples stay in their encoded space, the way a browser canvas scales
    std::vector<std::uint8_t> scaled(pixels_.size());
    STBIR_RESIZE resize;
    stbir_resize_init(&resize,
                      source.pixels.data(), source.width, source.height, source.width * 4,
                      scaled.data(), width_, height_, width_ * 4,
                      STBIR_RGBA, STBIR_TYPE_UINT8);
    stbir_set_edgemodes(&resize, STBIR_EDGE_CLAMP, STBIR_EDGE_CLAMP);
    stbir_set_filters(&resize, filter_for(source.width, width_), filter_for(source.height, height_));
    if (!stbir_resize_extended(&resize)) {
        throw ContextUnavailableError("Canvas: stb_image_resize failed for " +
                                      std::to_string(source.width) + "x" + std::to_string(source.height) +
                                      " -> " + std::to_string(width_) + "x" + std::to_string(height_));
    }

    // source-over onto the existing content
    for (std::size_t i = 0; i < pixels_.size(); i += 4) {
        const std::uint8_t* s = scaled.data() + i;
        std::uint8_t* d = pixels_.data() + i;

        const float sa = s[3] / 255.0f;
        const float da = d[3] / 255.0f;
        const float out_a = sa + da * (1.0f - sa);
        if (out_a <= 0.0f) {
            d[0] = d[1] = d[2] = d[3] = 0;
            continue;
        }
        for (int ch = 0; ch < 3; ++ch) {
            d[ch] = to_byte((s[ch] * sa + d[ch] * da * (1.0f - sa)) / out_a);
        }
        d[3] = to_byte(out_a * 255.0f);
    }
}

Rgba Canvas::pixel_at(const int x, const int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("Canvas::pixel_at: coordinates out of range");
    }
    const std::uint8_t* p = pixels_.data() + (static_cast<std::size_t>(y) * width_ + x) * 4;
    return {p[0], p[1], p[2], p[3]};
}

std::vector<std::uint8_t> Canvas::to_rgb() const {
    std::vector<std::uint8_t> rgb(static_cast<std::size_t>(width_) * height_ * 3);
    for (std::size_t i = 0, j = 0; i < pixels_.size(); i += 4, j += 3) {
        rgb[j] = pixels_[i];
        rgb[j + 1] = pixels_[i + 1];
        rgb[j + 2] = pixels_[i + 2];
    }
    return rgb;
}

} // namespace imgfit
