/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger::log() with a short
 * component tag. Where the lines end up is decided by the sinks the
 * embedding application installs.
 */

#ifndef IMGFIT_LOGGER_HPP
#define IMGFIT_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for imgfit.
 *
 * Delegates log messages to all registered ILogSink implementations.
 * With no sink installed, messages are dropped. Sinks are called without
 * the registry lock held and possibly from several threads at once, so
 * each sink serializes its own output.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     * @return Raw pointer identifying the sink, usable with remove_sink().
     */
    static ILogSink* add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove a sink previously returned by add_sink().
     * Unknown pointers are ignored. A log() call already dispatching to
     * the sink finishes first; the sink is destroyed after it.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "imgfit").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "imgfit");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive, accepts both "WARN" and "WARNING".
     * Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        if (level == "NONE")
            return LogLevel::None;
        return LogLevel::Error;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::shared_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // IMGFIT_LOGGER_HPP
