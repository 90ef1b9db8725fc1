/**
 * @file events.hpp
 * @brief Events published on the EventBus while an image is optimized.
 */

#ifndef IMGFIT_EVENTS_HPP
#define IMGFIT_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace imgfit {

/**
 * @brief States of the quality/scale search.
 *
 * Every attempt is entered in Initial, RetryQuality or RetryScale and
 * leaves towards Accepted, Exhausted, RetryQuality or RetryScale.
 */
enum class AttemptState {
    Initial,
    RetryQuality,
    RetryScale,
    Accepted,
    Exhausted
};

[[nodiscard]] constexpr std::string_view attempt_state_name(const AttemptState state) noexcept {
    switch (state) {
        case AttemptState::Initial: return "initial";
        case AttemptState::RetryQuality: return "retry-quality";
        case AttemptState::RetryScale: return "retry-scale";
        case AttemptState::Accepted: return "accepted";
        case AttemptState::Exhausted: return "exhausted";
    }
    return "unknown";
}

/**
 * @brief Emitted when an optimization call starts, before decoding.
 */
struct OptimizeStartEvent {
    std::string source;             ///< Caller-supplied label (file name, "<memory>", ...)
    std::size_t original_bytes = 0; ///< Encoded input size
};

/**
 * @brief Emitted after every encode attempt of the search loop.
 */
struct AttemptEvent {
    std::string source;
    int attempt = 0;                            ///< 1-based attempt number
    int width = 0;                              ///< Rendered width
    int height = 0;                             ///< Rendered height
    double quality = 0.0;                       ///< Quality the candidate was encoded at
    std::size_t bytes = 0;                      ///< Candidate size
    AttemptState entered = AttemptState::Initial; ///< Why this attempt ran
    AttemptState next = AttemptState::Accepted;   ///< What the loop does after it
};

/**
 * @brief Emitted when an optimization call returns a result.
 */
struct OptimizeCompleteEvent {
    std::string source;
    std::size_t original_bytes = 0;
    std::size_t output_bytes = 0;
    int width = 0;
    int height = 0;
    bool optimized = false;  ///< False for passthrough
    int attempts = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an optimization call fails.
 */
struct OptimizeErrorEvent {
    std::string source;
    std::string error_message;
};

} // namespace imgfit

#endif // IMGFIT_EVENTS_HPP
