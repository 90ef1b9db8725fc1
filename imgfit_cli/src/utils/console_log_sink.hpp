#ifndef IMGFIT_CONSOLE_LOG_SINK_HPP
#define IMGFIT_CONSOLE_LOG_SINK_HPP

#include "../../../libimgfit/include/log_sink.hpp"
#include "../../../libimgfit/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes log lines at or above log_level to stderr, colored by severity.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (log_level == LogLevel::None || level < log_level) return;

        const char* color = GRAY;
        switch (level) {
            case LogLevel::Error:   color = RED; break;
            case LogLevel::Warning: color = YELLOW; break;
            case LogLevel::Info:    color = CYAN; break;
            default: break;
        }

        std::lock_guard lock(mtx_);
        std::cerr << color << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << RESET << "\n";
    }

private:
    std::mutex mtx_;
};

#endif // IMGFIT_CONSOLE_LOG_SINK_HPP
