/**
 * @file imgfit.hpp
 * @brief Public API for the imgfit library.
 */

#ifndef IMGFIT_HPP
#define IMGFIT_HPP

#include "errors.hpp"
#include "image_types.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgfit {

/**
 * @brief Decodes, optimizes and releases an in-memory image.
 *
 * @param input Encoded bytes and declared MIME type (may be empty).
 * @param options Budget and output settings.
 * @return The passthrough or re-encoded result.
 * @throws DecodeError, ContextUnavailableError, EncodeError, std::invalid_argument.
 */
[[nodiscard]] OptimizedResult optimize_image(const ImageBuffer& input,
                                             const OptimizeOptions& options = {});

/**
 * @brief Reads a file and optimizes it.
 *
 * The declared MIME type is detected from the file contents with libmagic
 * (falling back to the extension).
 *
 * @throws std::runtime_error if the file cannot be read, plus everything optimize_image() throws.
 */
[[nodiscard]] OptimizedResult optimize_image_file(const std::filesystem::path& path,
                                                  const OptimizeOptions& options = {});

/**
 * @brief Optimizes the payload of a "data:<mime>;base64,..." URI.
 * @throws DataUriError if the URI is malformed, plus everything optimize_image() throws.
 */
[[nodiscard]] OptimizedResult optimize_image_data_uri(std::string_view data_uri,
                                                      const OptimizeOptions& options = {});

/**
 * @brief Interface for receiving progress of ImageOptimizer calls.
 *
 * Callbacks run on the thread performing the call (a pool worker for
 * submit()), so implementations must be thread-safe when submit() is used.
 */
struct OptimizerObserver {
    virtual ~OptimizerObserver() = default;

    virtual void onStart(const std::string& source, std::size_t original_bytes) {}

    virtual void onAttempt(const std::string& source, int attempt,
                           int width, int height, double quality, std::size_t bytes) {}

    virtual void onFinish(const std::string& source, std::size_t original_bytes,
                          std::size_t output_bytes, bool optimized, double seconds) {}

    virtual void onError(const std::string& source, const std::string& error) {}

    /// Every Logger line while attached, from any call in the process.
    /// May log itself; that line comes back through onLog too.
    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Configurable front end over the optimization pipeline.
 *
 * @details Holds an OptimizeOptions built with fluent setters, an optional
 * observer, and a worker pool for asynchronous calls. Calls do not share
 * mutable state, so optimize() and submit() may be mixed freely. Uses the
 * PIMPL idiom to keep codec and threading headers out of the public API.
 */
class ImageOptimizer {
public:
    ImageOptimizer();
    ~ImageOptimizer();

    ImageOptimizer(const ImageOptimizer&) = delete;
    ImageOptimizer& operator=(const ImageOptimizer&) = delete;
    ImageOptimizer(ImageOptimizer&&) noexcept;
    ImageOptimizer& operator=(ImageOptimizer&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Longest-edge cap in pixels. Default: 2048.
     * @throws std::invalid_argument if not positive.
     */
    ImageOptimizer& maxDimension(int val);

    /**
     * @brief Encoded-size cap in bytes. Default: 6 MiB.
     * @throws std::invalid_argument if zero.
     */
    ImageOptimizer& maxBytes(std::size_t val);

    /**
     * @brief Re-encode target. Default: JPEG.
     */
    ImageOptimizer& outputFormat(OutputFormat fmt);

    /**
     * @brief Initial quality, clamped to [0.30, 0.95] when used. Default: 0.85.
     */
    ImageOptimizer& quality(double val);

    /**
     * @brief Worker threads used by submit(). Default: hardware concurrency.
     *
     * Thread-safe. A new count retires the current pool once its calls
     * have finished; the next submit() starts a pool of the new size.
     */
    ImageOptimizer& threads(unsigned val);

    [[nodiscard]] const OptimizeOptions& options() const noexcept;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events, nullptr to detach.
     * The caller retains ownership of the observer.
     */
    void setObserver(OptimizerObserver* observer);

    // --- Execution ---

    /**
     * @brief Optimizes an in-memory image. Blocks until completion.
     */
    [[nodiscard]] OptimizedResult optimize(std::span<const std::uint8_t> bytes,
                                           std::string_view mime_type = {},
                                           std::string_view label = "<memory>");

    [[nodiscard]] OptimizedResult optimizeFile(const std::filesystem::path& path);

    [[nodiscard]] OptimizedResult optimizeDataUri(std::string_view data_uri);

    /**
     * @brief Schedules an optimization on the worker pool.
     * @return Future holding the result or the exception the call threw.
     */
    [[nodiscard]] std::future<OptimizedResult> submit(std::vector<std::uint8_t> bytes,
                                                      std::string mime_type = {},
                                                      std::string label = "<memory>");

    [[nodiscard]] std::future<OptimizedResult> submitFile(std::filesystem::path path);

    /**
     * @brief Blocks until every submitted call has finished. Thread-safe.
     */
    void wait();

    // --- Control ---

    /**
     * @brief Drops submitted calls that have not started yet. Thread-safe.
     *
     * Their futures report std::future_errc::broken_promise; running calls
     * finish normally. The optimizer accepts no further submit() calls.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace imgfit

#endif // IMGFIT_HPP
