/**
 * @file canvas.hpp
 * @brief RGBA render surface the optimizer draws into before encoding.
 */

#ifndef IMGFIT_CANVAS_HPP
#define IMGFIT_CANVAS_HPP

#include "image_types.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace imgfit {

/**
 * @brief One straight-alpha RGBA8 pixel.
 */
struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    bool operator==(const Rgba&) const = default;
};

inline constexpr Rgba kOpaqueWhite{255, 255, 255, 255};

/**
 * @brief Fixed-size RGBA8 raster (straight alpha).
 *
 * @details A new canvas is fully transparent black. draw() scales a
 * bitmap to cover the whole canvas and composites it source-over, so
 * filling the canvas first (e.g. with opaque white for JPEG output)
 * determines what transparent source pixels turn into.
 */
class Canvas {
public:
    /// Largest surface, in pixels, a canvas may be created with.
    static constexpr std::uint64_t kMaxPixels = 16384ULL * 16384ULL;

    /**
     * @brief Allocates a width x height transparent surface.
     * @throws ContextUnavailableError if a dimension is not positive, the
     * surface exceeds kMaxPixels, or the allocation fails.
     */
    Canvas(int width, int height);

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }

    /**
     * @brief Overwrites every pixel with the given color.
     */
    void fill(Rgba color);

    /**
     * @brief Draws source scaled to exactly width() x height().
     *
     * Resampling goes through stb_image_resize2: a box filter on axes
     * that shrink, a triangle filter on axes that grow. Color is weighted
     * by alpha so transparent pixels never bleed into their neighbours.
     *
     * @throws std::invalid_argument if source is empty or malformed.
     */
    void draw(const Bitmap& source);

    /**
     * @brief Pixel at (x, y). Coordinates must be in range.
     */
    [[nodiscard]] Rgba pixel_at(int x, int y) const;

    /**
     * @brief Raw RGBA8 rows, stride width() * 4.
     */
    [[nodiscard]] std::span<const std::uint8_t> rgba() const noexcept { return pixels_; }

    /**
     * @brief Packed RGB8 copy (alpha dropped), for encoders without alpha.
     */
    [[nodiscard]] std::vector<std::uint8_t> to_rgb() const;

private:
    int width_;
    int height_;
    std::vector<std::uint8_t> pixels_;
};

} // namespace imgfit

#endif // IMGFIT_CANVAS_HPP
