#include <drogon/drogon_test.h>
#include "test_images.hpp"
#include "../libimgfit/include/errors.hpp"
#include "../libimgfit/include/imgfit.hpp"
#include "../libimgfit/include/logger.hpp"
#include "../libimgfit/include/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace imgfit;

namespace {

struct RecordingObserver : OptimizerObserver
{
    void onStart(const std::string& source, std::size_t) override
    {
        std::lock_guard lock(mutex);
        started.push_back(source);
    }

    void onAttempt(const std::string&, int, int, int, double, std::size_t) override { ++attempts; }

    void onFinish(const std::string&, std::size_t, std::size_t, bool, double seconds) override
    {
        ++finished;
        if (seconds < 0.0)
            negative_duration = true;
    }

    void onError(const std::string& source, const std::string&) override
    {
        std::lock_guard lock(mutex);
        failed.push_back(source);
    }

    std::mutex mutex;
    std::vector<std::string> started;
    std::vector<std::string> failed;
    std::atomic<int> attempts{0};
    std::atomic<int> finished{0};
    std::atomic<bool> negative_duration{false};
};

// forwards library lines back into the logger under its own tag
struct EchoingObserver : OptimizerObserver
{
    void onLog(int, const std::string& msg, const std::string& tag) override
    {
        if (tag == "echo")
        {
            std::lock_guard lock(mutex);
            echoed.push_back(msg);
            return;
        }
        Logger::log(LogLevel::Info, "seen: " + msg, "echo");
    }

    std::mutex mutex;
    std::vector<std::string> echoed;
};

} // namespace

DROGON_TEST(ObserverMayLogFromLogCallback)
{
    EchoingObserver observer;
    ImageOptimizer optimizer;
    optimizer.setObserver(&observer);

    const OptimizedResult result = optimizer.optimize(test_images::jpeg(16, 16), "image/jpeg", "echo.jpg");
    CHECK(!result.optimized);
    optimizer.setObserver(nullptr);

    std::lock_guard lock(observer.mutex);
    CHECK(!observer.echoed.empty());
}

DROGON_TEST(SettersValidate)
{
    ImageOptimizer optimizer;
    CHECK_THROWS_AS(optimizer.maxDimension(0), std::invalid_argument);
    CHECK_THROWS_AS(optimizer.maxBytes(0), std::invalid_argument);

    optimizer.maxDimension(800).maxBytes(1024).outputFormat(OutputFormat::WEBP).quality(0.7);
    CHECK(optimizer.options().max_dimension == 800);
    CHECK(optimizer.options().max_bytes == 1024);
    CHECK(optimizer.options().output_format == OutputFormat::WEBP);
    CHECK(optimizer.options().quality == 0.7);
}

DROGON_TEST(SubmitResolvesFutures)
{
    RecordingObserver observer;
    ImageOptimizer optimizer;
    optimizer.maxDimension(32).threads(2);
    optimizer.setObserver(&observer);

    auto resized = optimizer.submit(test_images::jpeg(100, 50), "image/jpeg", "wide.jpg");
    auto kept = optimizer.submit(test_images::jpeg(20, 20), "", "small.jpg");
    auto broken = optimizer.submit(std::vector<std::uint8_t>(32, 0x42), "", "broken.bin");

    const OptimizedResult a = resized.get();
    CHECK(a.optimized);
    CHECK(a.width == 32);
    CHECK(a.height == 16);

    const OptimizedResult b = kept.get();
    CHECK(!b.optimized);
    CHECK(b.width == 20);

    CHECK_THROWS_AS(broken.get(), DecodeError);

    optimizer.wait();
    CHECK(observer.started.size() == 3);
    CHECK(observer.finished == 2);
    CHECK(observer.attempts >= 1);
    CHECK(!observer.negative_duration);
    REQUIRE(observer.failed.size() == 1);
    CHECK(observer.failed[0] == "broken.bin");

    optimizer.setObserver(nullptr);
}

DROGON_TEST(StoppedOptimizerRefusesWork)
{
    ImageOptimizer optimizer;
    optimizer.stop();
    CHECK_THROWS(optimizer.submit(test_images::jpeg(8, 8)));
    // synchronous calls do not use the pool
    CHECK(!optimizer.optimize(test_images::jpeg(8, 8)).optimized);
}

DROGON_TEST(MissingFileFails)
{
    ImageOptimizer optimizer;
    CHECK_THROWS(optimizer.optimizeFile("/nonexistent/imgfit/photo.jpg"));
}

DROGON_TEST(ThreadPoolRunsTasks)
{
    ThreadPool pool(3);
    CHECK(pool.size() == 3);

    std::atomic<int> sum{0};
    std::vector<std::future<int>> futures;
    for (int i = 1; i <= 20; ++i)
    {
        futures.push_back(pool.enqueue([i, &sum](std::stop_token) {
            sum += i;
            return i * 2;
        }));
    }
    pool.wait_idle();
    CHECK(sum == 210);
    CHECK(futures[4].get() == 10);

    auto failing = pool.enqueue([](std::stop_token) -> int { throw std::runtime_error("task failed"); });
    CHECK_THROWS_AS(failing.get(), std::runtime_error);
}

DROGON_TEST(ThreadPoolStopDropsQueuedTasks)
{
    ThreadPool pool(1);
    std::promise<void> started;
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto running = pool.enqueue([&started, gate](std::stop_token st) {
        started.set_value();
        gate.wait();
        return st.stop_requested();
    });
    auto queued = pool.enqueue([](std::stop_token) { return false; });

    started.get_future().wait();
    pool.request_stop();
    release.set_value();

    // the running task completes and only sees the request through its token
    CHECK(running.get());
    try
    {
        (void)queued.get();
        CHECK(false);
    }
    catch (const std::future_error& e)
    {
        CHECK(e.code() == std::future_errc::broken_promise);
    }
    CHECK_THROWS_AS(pool.enqueue([](std::stop_token) { return 0; }), std::runtime_error);
}

DROGON_TEST(ThreadCountChangesWhileWaiting)
{
    ImageOptimizer optimizer;
    optimizer.maxDimension(16).threads(2);

    std::vector<std::future<OptimizedResult>> futures;
    for (int i = 0; i < 4; ++i)
        futures.push_back(optimizer.submit(test_images::jpeg(64, 32), "image/jpeg"));

    std::thread waiter([&optimizer] { optimizer.wait(); });
    optimizer.threads(3);
    for (int i = 0; i < 4; ++i)
        futures.push_back(optimizer.submit(test_images::jpeg(64, 32), "image/jpeg"));
    optimizer.threads(1);
    optimizer.wait();
    waiter.join();

    for (auto& f : futures)
    {
        REQUIRE(f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        const OptimizedResult r = f.get();
        CHECK(r.width == 16);
        CHECK(r.height == 8);
    }
}
