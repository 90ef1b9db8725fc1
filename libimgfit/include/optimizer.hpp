/**
 * @file optimizer.hpp
 * @brief The size-constrained quality/scale search.
 */

#ifndef IMGFIT_OPTIMIZER_HPP
#define IMGFIT_OPTIMIZER_HPP

#include "image_types.hpp"
#include "raster_encoder.hpp"
#include "raster_source.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace imgfit {

class EventBus;

/// Hard cap on encode attempts per call.
inline constexpr int kMaxAttempts = 6;
/// Lowest and highest quality ever handed to an encoder.
inline constexpr double kMinQuality = 0.30;
inline constexpr double kMaxQuality = 0.95;
/// Quality used when the caller passes NaN.
inline constexpr double kDefaultQuality = 0.85;
/// Above this quality a rejected candidate is retried at lower quality first.
inline constexpr double kQualityThreshold = 0.65;
inline constexpr double kQualityStep = 0.10;
inline constexpr double kQualityFloor = 0.50;
/// Scale factor applied when quality can no longer be lowered.
inline constexpr double kScaleStep = 0.85;
/// The search stops shrinking once the longest rendered side is at or below this.
inline constexpr int kMinLongestSide = 512;

/**
 * @brief Clamps a quality value to [kMinQuality, kMaxQuality]; NaN becomes kDefaultQuality.
 */
[[nodiscard]] double clamp_quality(double quality) noexcept;

/**
 * @brief Finds an encoding that fits the byte and dimension budget.
 *
 * @details run() first decides whether the input needs any work. When
 * the longest side fits max_dimension and the input fits max_bytes the
 * original bytes are returned untouched. Otherwise the image is rendered
 * at scale min(1, max_dimension / longest) and encoded at the clamped
 * quality. Each rejected candidate lowers the quality by 0.1 (not below
 * 0.5) while it is above 0.65, then shrinks the scale by 0.85, until a
 * candidate fits, the longest rendered side is at most 512, or
 * kMaxAttempts have run. The last candidate is returned in every
 * non-fatal case, even if it is still over budget.
 *
 * An Optimizer holds no per-call state; one instance may serve
 * concurrent calls if its encoder does.
 */
class Optimizer {
public:
    /**
     * @param encoder Encoder used for every candidate; must outlive the optimizer.
     * @param bus Optional sink for AttemptEvent notifications.
     */
    explicit Optimizer(IRasterEncoder& encoder, const EventBus* bus = nullptr);

    /**
     * @brief Runs the search on a decoded image.
     *
     * @param handle The decoded image. It is released before run() returns
     * or throws.
     * @param original The encoded input, returned as-is on passthrough.
     * @param declared_mime MIME type the caller declared for the input, may be empty.
     * @param options Budget and output settings.
     * @param label Name used in events and log lines.
     *
     * @throws std::invalid_argument if max_dimension or max_bytes is not positive.
     * @throws ContextUnavailableError if a canvas cannot be created.
     * @throws EncodeError if the encoder fails.
     * @throws DecodeError if deferred pixel data cannot be loaded.
     */
    [[nodiscard]] OptimizedResult run(RasterHandle handle,
                                      std::span<const std::uint8_t> original,
                                      std::string_view declared_mime,
                                      const OptimizeOptions& options,
                                      std::string_view label = "<memory>") const;

private:
    IRasterEncoder& encoder_;
    const EventBus* bus_;
};

} // namespace imgfit

#endif // IMGFIT_OPTIMIZER_HPP
