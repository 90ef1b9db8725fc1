/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef IMGFIT_LOG_SINK_HPP
#define IMGFIT_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Levels are ordered: a sink configured for a given level accepts that
 * level and everything more severe.
 */
enum class LogLevel {
    Debug,   ///< Per-attempt diagnostics (scale, quality, candidate size)
    Info,    ///< One line per optimized image
    Warning, ///< Best-effort outcomes, e.g. byte budget not met
    Error,   ///< Decode, render or encode failures
    None     ///< Sink threshold only: suppress everything
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where log lines go (console, file, an
 * observer callback). The Logger facade fans every message out to all
 * installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "optimizer").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // IMGFIT_LOG_SINK_HPP
