/**
 * @file imgfit.cpp
 * @brief Implementation of the public imgfit API.
 */

#include "../../include/imgfit.hpp"

#include "../../include/data_uri.hpp"
#include "../../include/decoder.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_type.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/optimizer.hpp"
#include "../../include/raster_encoder.hpp"
#include "../../include/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace imgfit {

namespace {

OptimizedResult run_pipeline(const ImageBuffer& input, const OptimizeOptions& options,
                             const EventBus* bus, const std::string& label) {
    if (bus) bus->publish(OptimizeStartEvent{label, input.size()});
    const auto start = std::chrono::steady_clock::now();

    try {
        CodecEncoder encoder;
        const Optimizer optimizer(encoder, bus);
        RasterHandle handle = Decoder().decode(input);
        const int natural_width = handle.width();
        const int natural_height = handle.height();

        OptimizedResult result = optimizer.run(std::move(handle), input.bytes, input.mime_type, options, label);

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (result.optimized) {
            Logger::log(LogLevel::Info,
                        std::format("{}: {}x{} -> {}x{} {}, {} -> {} bytes in {} attempt(s)",
                                    label, natural_width, natural_height, result.width, result.height,
                                    result.mime_type, result.original_bytes, result.output_bytes,
                                    result.attempts),
                        "imgfit");
        } else {
            Logger::log(LogLevel::Info,
                        std::format("{}: {}x{}, {} bytes already within budget",
                                    label, result.width, result.height, result.original_bytes),
                        "imgfit");
        }
        if (bus) {
            bus->publish(OptimizeCompleteEvent{label, result.original_bytes, result.output_bytes,
                                               result.width, result.height, result.optimized,
                                               result.attempts, duration});
        }
        return result;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, label + ": " + e.what(), "imgfit");
        if (bus) bus->publish(OptimizeErrorEvent{label, e.what()});
        throw;
    }
}

// libmagic answer, else the extension, kept only if it names an image type
std::string declared_mime_of(const std::filesystem::path& path, const std::span<const std::uint8_t> bytes) {
    std::string mime = MimeDetector::detect(bytes);
    if (mime.rfind("image/", 0) != 0) {
        mime = mime_from_extension(path.extension().string());
    }
    return mime.rfind("image/", 0) == 0 ? mime : std::string{};
}

} // namespace

OptimizedResult optimize_image(const ImageBuffer& input, const OptimizeOptions& options) {
    return run_pipeline(input, options, nullptr, "<memory>");
}

OptimizedResult optimize_image_file(const std::filesystem::path& path, const OptimizeOptions& options) {
    const std::vector<std::uint8_t> bytes = read_file_bytes(path);
    return run_pipeline(ImageBuffer{bytes, declared_mime_of(path, bytes)}, options, nullptr, path.string());
}

OptimizedResult optimize_image_data_uri(const std::string_view data_uri, const OptimizeOptions& options) {
    const DataUri parsed = parse_data_uri(data_uri);
    return run_pipeline(ImageBuffer{parsed.bytes, parsed.mime_type}, options, nullptr, "<data-uri>");
}

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    OptimizerObserver* observer_;
public:
    explicit BridgeLogSink(OptimizerObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct ImageOptimizer::Impl {
    OptimizeOptions options;
    unsigned numThreads = 0;

    EventBus eventBus;
    std::atomic<OptimizerObserver*> observer = nullptr;
    ILogSink* bridgeSink = nullptr;

    std::mutex poolMutex;
    bool stopped = false;

    // shared so wait() can block on a pool that threads() swaps out meanwhile
    std::shared_ptr<ThreadPool> pool;

    Impl() {
        eventBus.subscribe<OptimizeStartEvent>([this](const OptimizeStartEvent& e) {
            if (auto* obs = observer.load()) obs->onStart(e.source, e.original_bytes);
        });
        eventBus.subscribe<AttemptEvent>([this](const AttemptEvent& e) {
            if (auto* obs = observer.load()) {
                obs->onAttempt(e.source, e.attempt, e.width, e.height, e.quality, e.bytes);
            }
        });
        eventBus.subscribe<OptimizeCompleteEvent>([this](const OptimizeCompleteEvent& e) {
            if (auto* obs = observer.load()) {
                obs->onFinish(e.source, e.original_bytes, e.output_bytes, e.optimized,
                              static_cast<double>(e.duration.count()) / 1000.0);
            }
        });
        eventBus.subscribe<OptimizeErrorEvent>([this](const OptimizeErrorEvent& e) {
            if (auto* obs = observer.load()) obs->onError(e.source, e.error_message);
        });
    }

    ~Impl() {
        // join the workers before the bus and the observer go away
        pool.reset();
        if (bridgeSink) Logger::remove_sink(bridgeSink);
    }

    template <class F>
    std::future<OptimizedResult> schedule(F&& task) {
        std::lock_guard lock(poolMutex);
        if (stopped) throw std::runtime_error("ImageOptimizer has been stopped");
        if (!pool) pool = std::make_shared<ThreadPool>(numThreads);
        return pool->enqueue(std::forward<F>(task));
    }

    OptimizedResult run(const ImageBuffer& input, const OptimizeOptions& opts, const std::string& label) const {
        return run_pipeline(input, opts, &eventBus, label);
    }
};

ImageOptimizer::ImageOptimizer() : impl_(std::make_unique<Impl>()) {}

ImageOptimizer::~ImageOptimizer() = default;

ImageOptimizer::ImageOptimizer(ImageOptimizer&&) noexcept = default;
ImageOptimizer& ImageOptimizer::operator=(ImageOptimizer&&) noexcept = default;

ImageOptimizer& ImageOptimizer::maxDimension(const int val) {
    if (val <= 0) throw std::invalid_argument("maxDimension must be positive");
    impl_->options.max_dimension = val;
    return *this;
}

ImageOptimizer& ImageOptimizer::maxBytes(const std::size_t val) {
    if (val == 0) throw std::invalid_argument("maxBytes must be positive");
    impl_->options.max_bytes = val;
    return *this;
}

ImageOptimizer& ImageOptimizer::outputFormat(const OutputFormat fmt) {
    impl_->options.output_format = fmt;
    return *this;
}

ImageOptimizer& ImageOptimizer::quality(const double val) {
    impl_->options.quality = val;
    return *this;
}

ImageOptimizer& ImageOptimizer::threads(const unsigned val) {
    std::shared_ptr<ThreadPool> retired;
    {
        std::lock_guard lock(impl_->poolMutex);
        if (val == impl_->numThreads) return *this;
        impl_->numThreads = val;
        // the next submit() starts a pool of the new size
        retired = std::move(impl_->pool);
    }
    // joins the old workers, unless a wait() still holds them
    retired.reset();
    return *this;
}

const OptimizeOptions& ImageOptimizer::options() const noexcept {
    return impl_->options;
}

void ImageOptimizer::setObserver(OptimizerObserver* observer) {
    impl_->observer.store(observer);
    if (impl_->bridgeSink) {
        Logger::remove_sink(impl_->bridgeSink);
        impl_->bridgeSink = nullptr;
    }
    if (observer) {
        impl_->bridgeSink = Logger::add_sink(std::make_unique<BridgeLogSink>(observer));
    }
}

OptimizedResult ImageOptimizer::optimize(const std::span<const std::uint8_t> bytes,
                                         const std::string_view mime_type,
                                         const std::string_view label) {
    return impl_->run(ImageBuffer{bytes, std::string(mime_type)}, impl_->options, std::string(label));
}

OptimizedResult ImageOptimizer::optimizeFile(const std::filesystem::path& path) {
    const std::vector<std::uint8_t> bytes = read_file_bytes(path);
    return impl_->run(ImageBuffer{bytes, declared_mime_of(path, bytes)}, impl_->options, path.string());
}

OptimizedResult ImageOptimizer::optimizeDataUri(const std::string_view data_uri) {
    const DataUri parsed = parse_data_uri(data_uri);
    return impl_->run(ImageBuffer{parsed.bytes, parsed.mime_type}, impl_->options, "<data-uri>");
}

std::future<OptimizedResult> ImageOptimizer::submit(std::vector<std::uint8_t> bytes,
                                                    std::string mime_type,
                                                    std::string label) {
    return impl_->schedule(
        [impl = impl_.get(), opts = impl_->options, bytes = std::move(bytes),
         mime = std::move(mime_type), label = std::move(label)](std::stop_token) {
            return impl->run(ImageBuffer{bytes, mime}, opts, label);
        });
}

std::future<OptimizedResult> ImageOptimizer::submitFile(std::filesystem::path path) {
    return impl_->schedule(
        [impl = impl_.get(), opts = impl_->options, path = std::move(path)](std::stop_token) {
            const std::vector<std::uint8_t> bytes = read_file_bytes(path);
            return impl->run(ImageBuffer{bytes, declared_mime_of(path, bytes)}, opts, path.string());
        });
}

void ImageOptimizer::wait() {
    std::shared_ptr<ThreadPool> pool;
    {
        std::lock_guard lock(impl_->poolMutex);
        pool = impl_->pool;
    }
    if (pool) pool->wait_idle();
}

void ImageOptimizer::stop() {
    std::lock_guard lock(impl_->poolMutex);
    impl_->stopped = true;
    if (impl_->pool) impl_->pool->request_stop();
}

} // namespace imgfit
