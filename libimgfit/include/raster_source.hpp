/**
 * @file raster_source.hpp
 * @brief Decoded image sources and the handle that owns them.
 */

#ifndef IMGFIT_RASTER_SOURCE_HPP
#define IMGFIT_RASTER_SOURCE_HPP

#include "image_types.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace imgfit {

class Canvas;

/**
 * @brief A decoded image that can be drawn into a Canvas.
 *
 * @details Implementations differ in where the pixels live (in memory,
 * or in a temporary file loaded on first use). The optimizer only sees
 * this interface through a RasterHandle.
 */
class IRasterSource {
public:
    virtual ~IRasterSource() = default;

    /// @return Natural width in pixels (> 0).
    [[nodiscard]] virtual int width() const noexcept = 0;

    /// @return Natural height in pixels (> 0).
    [[nodiscard]] virtual int height() const noexcept = 0;

    /// @return MIME type of the stream that was decoded (e.g. "image/png").
    [[nodiscard]] virtual std::string_view mime_type() const noexcept = 0;

    /// @return Short name of the decode path, for logs ("bitmap", "universal").
    [[nodiscard]] virtual std::string_view path_name() const noexcept = 0;

    /**
     * @brief Draws the image scaled to the canvas' exact dimensions.
     * @throws DecodeError if deferred pixel data cannot be loaded.
     */
    virtual void render(Canvas& canvas) = 0;

    /**
     * @brief Frees decoder-side resources. Called exactly once by RasterHandle.
     */
    virtual void release() noexcept = 0;
};

/**
 * @brief Source backed by a bitmap decoded up front by an in-memory codec.
 */
class BitmapSource final : public IRasterSource {
public:
    BitmapSource(Bitmap bitmap, std::string mime_type);

    [[nodiscard]] int width() const noexcept override { return width_; }
    [[nodiscard]] int height() const noexcept override { return height_; }
    [[nodiscard]] std::string_view mime_type() const noexcept override { return mime_type_; }
    [[nodiscard]] std::string_view path_name() const noexcept override { return "bitmap"; }

    void render(Canvas& canvas) override;
    void release() noexcept override;

private:
    Bitmap bitmap_;
    int width_;
    int height_;
    std::string mime_type_;
};

/**
 * @brief Move-only owner of a decoded image source.
 *
 * @details The handle releases its source exactly once: either through an
 * explicit release() (further calls are no-ops) or from the destructor.
 * Accessors throw std::logic_error once the handle has been released.
 */
class RasterHandle {
public:
    /**
     * @throws std::invalid_argument if source is null.
     */
    explicit RasterHandle(std::unique_ptr<IRasterSource> source);
    ~RasterHandle();

    RasterHandle(RasterHandle&& other) noexcept = default;
    RasterHandle& operator=(RasterHandle&& other) noexcept;

    RasterHandle(const RasterHandle&) = delete;
    RasterHandle& operator=(const RasterHandle&) = delete;

    [[nodiscard]] int width() const;
    [[nodiscard]] int height() const;
    [[nodiscard]] std::string_view mime_type() const;
    [[nodiscard]] std::string_view path_name() const;

    /**
     * @brief Draws the image scaled to the canvas' exact dimensions.
     */
    void render(Canvas& canvas);

    /**
     * @brief Releases the source. Idempotent.
     */
    void release() noexcept;

    [[nodiscard]] bool released() const noexcept { return source_ == nullptr; }

private:
    [[nodiscard]] IRasterSource& checked() const;

    std::unique_ptr<IRasterSource> source_;
};

} // namespace imgfit

#endif // IMGFIT_RASTER_SOURCE_HPP
