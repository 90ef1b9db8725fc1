#ifndef IMGFIT_FILE_LOG_SINK_HPP
#define IMGFIT_FILE_LOG_SINK_HPP

#include "../../../libimgfit/include/log_sink.hpp"
#include "../../../libimgfit/include/logger.hpp"
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

/**
 * @brief Appends every log line, timestamped, to a file.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::lock_guard lock(mtx_);
        out_ << std::format("{:%F %T}", now) << " [" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // IMGFIT_FILE_LOG_SINK_HPP
