#include <drogon/drogon_test.h>
#include "../libimgfit/include/canvas.hpp"
#include "../libimgfit/include/errors.hpp"
#include "../libimgfit/include/event_bus.hpp"
#include "../libimgfit/include/events.hpp"
#include "../libimgfit/include/optimizer.hpp"
#include <cmath>
#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace imgfit;

namespace {

// dimensions only; rendering leaves the canvas untouched
class CountingSource final : public IRasterSource
{
  public:
    CountingSource(int width, int height, std::string mime, int& releases)
        : width_(width), height_(height), mime_(std::move(mime)), releases_(releases)
    {
    }

    int width() const noexcept override { return width_; }
    int height() const noexcept override { return height_; }
    std::string_view mime_type() const noexcept override { return mime_; }
    std::string_view path_name() const noexcept override { return "counting"; }
    void render(Canvas&) override {}
    void release() noexcept override { ++releases_; }

  private:
    int width_;
    int height_;
    std::string mime_;
    int& releases_;
};

struct Call
{
    int width;
    int height;
    double quality;
    Rgba corner;
    std::size_t bytes;
};

// output size modelled as width * height * quality * bytes_per_pixel
class ModelEncoder final : public IRasterEncoder
{
  public:
    explicit ModelEncoder(double bytes_per_pixel) : bytes_per_pixel_(bytes_per_pixel) {}

    EncodedImage encode(const Canvas& canvas, OutputFormat format, double quality) override
    {
        if (fail)
            throw EncodeError("model encoder failure");
        const double size = canvas.width() * static_cast<double>(canvas.height()) * quality * bytes_per_pixel_;
        EncodedImage out;
        out.bytes.assign(static_cast<std::size_t>(std::max(1.0, size)), 0xAB);
        calls.push_back({canvas.width(), canvas.height(), quality, canvas.pixel_at(0, 0), out.bytes.size()});
        out.mime_type = output_format_mime(format);
        return out;
    }

    std::vector<Call> calls;
    bool fail = false;

  private:
    double bytes_per_pixel_;
};

RasterHandle handle_for(int width, int height, int& releases, std::string mime = "image/jpeg")
{
    return RasterHandle(std::make_unique<CountingSource>(width, height, std::move(mime), releases));
}

bool same(double a, double b)
{
    return std::abs(a - b) < 1e-9;
}

constexpr std::size_t kMB = 1024 * 1024;

} // namespace

DROGON_TEST(ClampQuality)
{
    CHECK(same(clamp_quality(std::numeric_limits<double>::quiet_NaN()), 0.85));
    CHECK(same(clamp_quality(2.0), 0.95));
    CHECK(same(clamp_quality(0.1), 0.30));
    CHECK(same(clamp_quality(0.7), 0.7));
}

DROGON_TEST(PassthroughWithinBudget)
{
    int releases = 0;
    ModelEncoder encoder(1.0);
    const std::vector<std::uint8_t> original(500 * 1024, 7);

    const auto result = Optimizer(encoder).run(handle_for(1024, 768, releases), original, "", OptimizeOptions{});
    CHECK(!result.optimized);
    CHECK(result.attempts == 0);
    CHECK(result.data == original);
    CHECK(result.mime_type == "image/jpeg");
    CHECK(result.width == 1024);
    CHECK(result.height == 768);
    CHECK(result.original_bytes == original.size());
    CHECK(result.output_bytes == original.size());
    CHECK(encoder.calls.empty());
    CHECK(releases == 1);
}

DROGON_TEST(PassthroughMimeFallbacks)
{
    int releases = 0;
    ModelEncoder encoder(1.0);
    const std::vector<std::uint8_t> original(16, 1);
    const Optimizer optimizer(encoder);

    CHECK(optimizer.run(handle_for(8, 8, releases, "image/gif"), original, "image/x-custom", {}).mime_type ==
          "image/x-custom");
    CHECK(optimizer.run(handle_for(8, 8, releases, "image/gif"), original, "", {}).mime_type == "image/gif");
    CHECK(optimizer.run(handle_for(8, 8, releases, ""), original, "", {}).mime_type == "image/png");
    CHECK(releases == 3);
}

DROGON_TEST(LargePhotoIsResizedOnce)
{
    int releases = 0;
    ModelEncoder encoder(1.0);
    const std::vector<std::uint8_t> original(10 * kMB, 3);

    const auto result = Optimizer(encoder).run(handle_for(4000, 3000, releases), original, "image/jpeg", {});
    CHECK(result.optimized);
    CHECK(result.attempts == 1);
    CHECK(result.width == 2048);
    CHECK(result.height == 1536);
    CHECK(result.mime_type == "image/jpeg");
    CHECK(result.output_bytes <= 6 * kMB);
    CHECK(result.output_bytes == result.data.size());
    REQUIRE(encoder.calls.size() == 1);
    CHECK(same(encoder.calls[0].quality, 0.85));
    CHECK(releases == 1);
}

DROGON_TEST(QualityDropsBeforeScale)
{
    int releases = 0;
    ModelEncoder encoder(8.0);
    const std::vector<std::uint8_t> original(10 * kMB, 3);

    const auto result = Optimizer(encoder).run(handle_for(2000, 2000, releases), original, "", {});
    REQUIRE(encoder.calls.size() == static_cast<std::size_t>(kMaxAttempts));
    CHECK(result.attempts == kMaxAttempts);

    CHECK(same(encoder.calls[0].quality, 0.85));
    CHECK(encoder.calls[0].width == 2000);
    CHECK(same(encoder.calls[1].quality, 0.75));
    CHECK(encoder.calls[1].width == 2000);
    CHECK(same(encoder.calls[2].quality, 0.65));
    CHECK(encoder.calls[2].width == 2000);
    CHECK(encoder.calls[3].width == 1700);
    CHECK(same(encoder.calls[3].quality, 0.65));
    CHECK(encoder.calls[4].width == 1445);
    CHECK(encoder.calls[5].width == 1228);

    for (std::size_t i = 0; i < encoder.calls.size(); ++i)
    {
        CHECK(std::max(encoder.calls[i].width, encoder.calls[i].height) <= std::max(2048, kMinLongestSide));
        if (i > 0)
            CHECK(encoder.calls[i].bytes <= encoder.calls[i - 1].bytes);
    }

    // best effort: the last candidate is returned even though it is over budget
    CHECK(result.optimized);
    CHECK(result.width == 1228);
    CHECK(result.output_bytes > 6 * kMB);
    CHECK(releases == 1);
}

DROGON_TEST(StopsAtMinimumLongestSide)
{
    int releases = 0;
    ModelEncoder encoder(1000.0);
    const std::vector<std::uint8_t> original(10 * kMB, 3);
    OptimizeOptions options;
    options.quality = 0.5;

    const auto result = Optimizer(encoder).run(handle_for(600, 600, releases), original, "", options);
    REQUIRE(encoder.calls.size() == 2);
    CHECK(encoder.calls[0].width == 600);
    CHECK(encoder.calls[1].width == 510);
    CHECK(result.attempts == 2);
    CHECK(result.width == 510);
    CHECK(result.height == 510);
}

DROGON_TEST(InitialQualityIsClamped)
{
    const std::vector<std::uint8_t> original(10 * kMB, 3);
    for (const auto& [requested, used] : std::vector<std::pair<double, double>>{
             {std::numeric_limits<double>::quiet_NaN(), 0.85}, {2.0, 0.95}, {0.1, 0.30}})
    {
        int releases = 0;
        ModelEncoder encoder(0.001);
        OptimizeOptions options;
        options.quality = requested;
        (void)Optimizer(encoder).run(handle_for(100, 100, releases), original, "", options);
        REQUIRE(encoder.calls.size() == 1);
        CHECK(same(encoder.calls[0].quality, used));
    }
}

DROGON_TEST(EncodeFailureReleasesOnce)
{
    int releases = 0;
    ModelEncoder encoder(1.0);
    encoder.fail = true;
    const std::vector<std::uint8_t> original(10 * kMB, 3);

    CHECK_THROWS_AS((void)Optimizer(encoder).run(handle_for(3000, 3000, releases), original, "", {}),
                    EncodeError);
    CHECK(releases == 1);
}

DROGON_TEST(InvalidOptionsReleaseOnce)
{
    ModelEncoder encoder(1.0);
    const std::vector<std::uint8_t> original(16, 1);

    int releases = 0;
    OptimizeOptions no_dimension;
    no_dimension.max_dimension = 0;
    CHECK_THROWS_AS((void)Optimizer(encoder).run(handle_for(8, 8, releases), original, "", no_dimension),
                    std::invalid_argument);
    CHECK(releases == 1);

    releases = 0;
    OptimizeOptions no_bytes;
    no_bytes.max_bytes = 0;
    CHECK_THROWS_AS((void)Optimizer(encoder).run(handle_for(8, 8, releases), original, "", no_bytes),
                    std::invalid_argument);
    CHECK(releases == 1);
}

DROGON_TEST(OversizedSurfaceIsReported)
{
    int releases = 0;
    ModelEncoder encoder(1.0);
    const std::vector<std::uint8_t> original(10 * kMB, 3);
    OptimizeOptions options;
    options.max_dimension = 30000;

    CHECK_THROWS_AS((void)Optimizer(encoder).run(handle_for(20000, 20000, releases), original, "", options),
                    ContextUnavailableError);
    CHECK(encoder.calls.empty());
    CHECK(releases == 1);
}

DROGON_TEST(AttemptEventsTrackStates)
{
    int releases = 0;
    ModelEncoder encoder(8.0);
    const std::vector<std::uint8_t> original(10 * kMB, 3);
    EventBus bus;
    std::vector<AttemptEvent> events;
    CHECK(!bus.has_subscribers<AttemptEvent>());
    bus.subscribe<AttemptEvent>([&events](const AttemptEvent& e) { events.push_back(e); });
    CHECK(bus.has_subscribers<AttemptEvent>());
    CHECK(!bus.has_subscribers<OptimizeErrorEvent>());

    (void)Optimizer(encoder, &bus).run(handle_for(2000, 2000, releases), original, "", {}, "photo.jpg");
    REQUIRE(events.size() == 6);
    CHECK(events[0].source == "photo.jpg");
    CHECK(events[0].attempt == 1);
    CHECK(events[0].entered == AttemptState::Initial);
    CHECK(events[0].next == AttemptState::RetryQuality);
    CHECK(events[1].entered == AttemptState::RetryQuality);
    CHECK(events[2].next == AttemptState::RetryScale);
    CHECK(events[3].entered == AttemptState::RetryScale);
    CHECK(events[5].next == AttemptState::Exhausted);
    CHECK(events[5].width == encoder.calls[5].width);
    CHECK(events[5].bytes > 6 * kMB);
    CHECK(attempt_state_name(AttemptState::RetryQuality) == "retry-quality");
}

DROGON_TEST(AcceptedAttemptEndsSearch)
{
    int releases = 0;
    ModelEncoder encoder(1.0);
    const std::vector<std::uint8_t> original(10 * kMB, 3);
    EventBus bus;
    std::vector<AttemptState> states;
    bus.subscribe<AttemptEvent>([&states](const AttemptEvent& e) { states.push_back(e.next); });

    (void)Optimizer(encoder, &bus).run(handle_for(1000, 1000, releases), original, "", {});
    REQUIRE(states.size() == 1);
    CHECK(states[0] == AttemptState::Accepted);
}

DROGON_TEST(JpegCanvasIsWhiteWebpStaysTransparent)
{
    const std::vector<std::uint8_t> original(10 * kMB, 3);

    int releases = 0;
    ModelEncoder jpeg(0.001);
    (void)Optimizer(jpeg).run(handle_for(100, 100, releases), original, "", {});
    REQUIRE(jpeg.calls.size() == 1);
    CHECK(jpeg.calls[0].corner == kOpaqueWhite);

    ModelEncoder webp(0.001);
    OptimizeOptions options;
    options.output_format = OutputFormat::WEBP;
    const auto result = Optimizer(webp).run(handle_for(100, 100, releases), original, "", options);
    REQUIRE(webp.calls.size() == 1);
    CHECK(webp.calls[0].corner == (Rgba{0, 0, 0, 0}));
    CHECK(result.mime_type == "image/webp");
}
