#include "../../include/logger.hpp"
#include <algorithm>

std::vector<std::shared_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

ILogSink* Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (!sink) {
        return nullptr;
    }
    ILogSink* raw = sink.get();
    sinks_.push_back(std::move(sink));
    return raw;
}

void Logger::remove_sink(const ILogSink* sink) {
    std::lock_guard lock(mtx_);
    std::erase_if(sinks_, [sink](const auto& s) { return s.get() == sink; });
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (level == LogLevel::None) {
        return;
    }
    // sinks run outside the lock, so one may log or detach itself;
    // the snapshot keeps a sink removed meanwhile alive until it returns
    std::vector<std::shared_ptr<ILogSink>> targets;
    {
        std::lock_guard lock(mtx_);
        targets = sinks_;
    }
    for (const auto& sink : targets) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}
