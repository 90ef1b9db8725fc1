#include "../../include/optimizer.hpp"
#include "../../include/canvas.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_type.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

int scaled_dimension(const int natural, const double scale) {
    return std::max(1, static_cast<int>(std::lround(natural * scale)));
}

} // namespace

namespace imgfit {

double clamp_quality(const double quality) noexcept {
    if (std::isnan(quality)) return kDefaultQuality;
    return std::clamp(quality, kMinQuality, kMaxQuality);
}

Optimizer::Optimizer(IRasterEncoder& encoder, const EventBus* bus) : encoder_(encoder), bus_(bus) {}

OptimizedResult Optimizer::run(RasterHandle handle,
                               const std::span<const std::uint8_t> original,
                               const std::string_view declared_mime,
                               const OptimizeOptions& options,
                               const std::string_view label) const {
    if (options.max_dimension <= 0) {
        throw std::invalid_argument("max_dimension must be positive");
    }
    if (options.max_bytes == 0) {
        throw std::invalid_argument("max_bytes must be positive");
    }

    const int width = handle.width();
    const int height = handle.height();
    const int longest = std::max(width, height);
    const double initial_scale =
        longest > options.max_dimension ? static_cast<double>(options.max_dimension) / longest : 1.0;

    const bool needs_resize = initial_scale < 1.0;
    const bool needs_reencode = original.size() > options.max_bytes;

    if (!needs_resize && !needs_reencode) {
        OptimizedResult result;
        result.data.assign(original.begin(), original.end());
        result.width = width;
        result.height = height;
        if (!declared_mime.empty()) {
            result.mime_type = declared_mime;
        } else if (!handle.mime_type().empty()) {
            result.mime_type = handle.mime_type();
        } else {
            result.mime_type = kFallbackMime;
        }
        result.original_bytes = original.size();
        result.output_bytes = original.size();
        result.optimized = false;
        handle.release();

        Logger::log(LogLevel::Debug,
                    std::format("{}: {}x{}, {} bytes within budget, passthrough",
                                label, width, height, original.size()),
                    "optimizer");
        return result;
    }

    Logger::log(LogLevel::Debug,
                std::format("{}: {}x{}, {} bytes; resize={} reencode={} initial scale {:.4f}",
                            label, width, height, original.size(), needs_resize, needs_reencode,
                            initial_scale),
                "optimizer");

    double scale = initial_scale;
    double quality = clamp_quality(options.quality);
    AttemptState entered = AttemptState::Initial;

    EncodedImage best;
    int best_width = 0;
    int best_height = 0;
    int attempts = 0;

    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        const int target_width = scaled_dimension(width, scale);
        const int target_height = scaled_dimension(height, scale);

        Canvas canvas(target_width, target_height);
        if (options.output_format == OutputFormat::JPEG) {
            // jpeg has no alpha: transparent areas must end up white, not black
            canvas.fill(kOpaqueWhite);
        }
        handle.render(canvas);

        best = encoder_.encode(canvas, options.output_format, quality);
        best_width = target_width;
        best_height = target_height;
        attempts = attempt;

        AttemptState next;
        if (best.bytes.size() <= options.max_bytes) {
            next = AttemptState::Accepted;
        } else if (attempt == kMaxAttempts) {
            next = AttemptState::Exhausted;
        } else if (quality > kQualityThreshold) {
            next = AttemptState::RetryQuality;
        } else if (std::max(target_width, target_height) <= kMinLongestSide) {
            next = AttemptState::Exhausted;
        } else {
            next = AttemptState::RetryScale;
        }

        Logger::log(LogLevel::Debug,
                    std::format("{}: attempt {} [{}] {}x{} q={:.2f} -> {} bytes, {}",
                                label, attempt, attempt_state_name(entered), target_width,
                                target_height, quality, best.bytes.size(), attempt_state_name(next)),
                    "optimizer");
        if (bus_) {
            bus_->publish(AttemptEvent{std::string(label), attempt, target_width, target_height,
                                       quality, best.bytes.size(), entered, next});
        }

        if (next == AttemptState::Accepted || next == AttemptState::Exhausted) {
            break;
        }
        if (next == AttemptState::RetryQuality) {
            quality = clamp_quality(std::max(kQualityFloor, quality - kQualityStep));
        } else {
            scale *= kScaleStep;
        }
        entered = next;
    }

    handle.release();

    if (best.bytes.size() > options.max_bytes) {
        Logger::log(LogLevel::Warning,
                    std::format("{}: budget of {} bytes not reached after {} attempts, returning {} bytes",
                                label, options.max_bytes, attempts, best.bytes.size()),
                    "optimizer");
    }

    OptimizedResult result;
    result.output_bytes = best.bytes.size();
    result.data = std::move(best.bytes);
    result.width = best_width;
    result.height = best_height;
    result.mime_type = std::move(best.mime_type);
    result.original_bytes = original.size();
    result.optimized = true;
    result.attempts = attempts;
    return result;
}

} // namespace imgfit
