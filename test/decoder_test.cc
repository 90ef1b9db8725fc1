#include <drogon/drogon_test.h>
#include "test_images.hpp"
#include "../libimgfit/include/canvas.hpp"
#include "../libimgfit/include/data_uri.hpp"
#include "../libimgfit/include/decoder.hpp"
#include "../libimgfit/include/errors.hpp"
#include "../libimgfit/include/imgfit.hpp"
#include "../libimgfit/include/jpeg_codec.hpp"
#include "../libimgfit/include/png_codec.hpp"
#include "../libimgfit/include/universal_source.hpp"
#include <filesystem>
#include <vector>

using namespace imgfit;

namespace {
// resampling may move a channel by a rounding step
bool close_to(const Rgba a, const Rgba b)
{
    auto near = [](int x, int y) { return x - y <= 1 && y - x <= 1; };
    return near(a.r, b.r) && near(a.g, b.g) && near(a.b, b.b) && near(a.a, b.a);
}
} // namespace

DROGON_TEST(DecoderRejectsEmptyAndGarbage)
{
    const Decoder decoder;
    CHECK_THROWS_AS((void)decoder.decode(ImageBuffer{}), DecodeError);

    const std::vector<std::uint8_t> garbage(256, 0x5A);
    CHECK_THROWS_AS((void)decoder.decode(ImageBuffer{garbage, ""}), DecodeError);
}

DROGON_TEST(JpegTakesBitmapPath)
{
    const auto bytes = test_images::jpeg(40, 30);
    RasterHandle handle = Decoder().decode(ImageBuffer{bytes, ""});
    CHECK(handle.path_name() == "bitmap");
    CHECK(handle.mime_type() == "image/jpeg");
    CHECK(handle.width() == 40);
    CHECK(handle.height() == 30);

    handle.release();
    CHECK(handle.released());
    handle.release();
    CHECK_THROWS_AS((void)handle.width(), std::logic_error);
}

DROGON_TEST(BmpTakesUniversalPath)
{
    const auto bytes = test_images::bmp(10, 6, 255, 0, 0);
    RasterHandle handle = Decoder().decode(ImageBuffer{bytes, ""});
    CHECK(handle.path_name() == "universal");
    CHECK(handle.width() == 10);
    CHECK(handle.height() == 6);

    Canvas canvas(10, 6);
    handle.render(canvas);
    CHECK(close_to(canvas.pixel_at(3, 3), Rgba{255, 0, 0, 255}));
}

DROGON_TEST(RejectedPngFallsBackToUniversalPath)
{
    const auto bytes = test_images::png_with_bad_crc(12, 7, 0, 128, 255);
    CHECK_THROWS_AS((void)PngCodec().decode(bytes), DecodeError);

    RasterHandle handle = Decoder().decode(ImageBuffer{bytes, "image/png"});
    CHECK(handle.path_name() == "universal");
    CHECK(handle.mime_type() == "image/png");
    CHECK(handle.width() == 12);
    CHECK(handle.height() == 7);

    Canvas canvas(12, 7);
    handle.render(canvas);
    CHECK(close_to(canvas.pixel_at(6, 3), Rgba{0, 128, 255, 255}));
}

DROGON_TEST(TiffTakesUniversalPath)
{
    const auto bytes = test_images::tiff_rgb(9, 5, 10, 220, 40);
    RasterHandle handle = Decoder().decode(ImageBuffer{bytes, ""});
    CHECK(handle.path_name() == "universal");
    CHECK(handle.mime_type() == "image/tiff");
    CHECK(handle.width() == 9);
    CHECK(handle.height() == 5);

    Canvas canvas(9, 5);
    handle.render(canvas);
    CHECK(close_to(canvas.pixel_at(0, 0), Rgba{10, 220, 40, 255}));
    CHECK(close_to(canvas.pixel_at(8, 4), Rgba{10, 220, 40, 255}));
}

DROGON_TEST(TiffIsResizedToJpeg)
{
    const auto bytes = test_images::tiff_rgb(80, 40, 200, 30, 30);
    OptimizeOptions options;
    options.max_dimension = 40;

    const OptimizedResult result = optimize_image(ImageBuffer{bytes, "image/tiff"}, options);
    CHECK(result.optimized);
    CHECK(result.width == 40);
    CHECK(result.height == 20);
    CHECK(result.mime_type == "image/jpeg");
}

DROGON_TEST(UniversalSourceRemovesTempFileOnRelease)
{
    const auto bytes = test_images::bmp(4, 4, 0, 0, 255);
    UniversalSource source(bytes);
    const auto file = source.temp_file();
    CHECK(std::filesystem::exists(file));

    source.release();
    CHECK(!std::filesystem::exists(file));
    source.release();
}

DROGON_TEST(UniversalSourceCleansUpAfterUnreadableHeader)
{
    const std::vector<std::uint8_t> garbage(64, 0x01);
    CHECK_THROWS_AS(UniversalSource{garbage}, DecodeError);
}

DROGON_TEST(TransparentPngBecomesWhiteJpeg)
{
    const auto bytes = test_images::transparent_png(64, 64);
    OptimizeOptions options;
    options.max_dimension = 32;

    const OptimizedResult result = optimize_image(ImageBuffer{bytes, "image/png"}, options);
    CHECK(result.optimized);
    CHECK(result.mime_type == "image/jpeg");
    CHECK(result.width == 32);
    CHECK(result.height == 32);
    CHECK(result.attempts == 1);
    CHECK(result.output_bytes == result.data.size());

    const Bitmap decoded = JpegCodec().decode(result.data);
    REQUIRE(decoded.width == 32);
    for (const std::size_t i : {std::size_t{0}, decoded.pixels.size() / 2, decoded.pixels.size() - 4})
    {
        CHECK(decoded.pixels[i] >= 250);
        CHECK(decoded.pixels[i + 1] >= 250);
        CHECK(decoded.pixels[i + 2] >= 250);
    }
}

DROGON_TEST(SmallImagePassesThrough)
{
    const auto bytes = test_images::jpeg(64, 64);
    const OptimizedResult result = optimize_image(ImageBuffer{bytes, ""});
    CHECK(!result.optimized);
    CHECK(result.attempts == 0);
    CHECK(result.data == bytes);
    CHECK(result.mime_type == "image/jpeg");
    CHECK(result.width == 64);
}

DROGON_TEST(DataUriEntryPoint)
{
    const auto bytes = test_images::jpeg(48, 48);
    const OptimizedResult result = optimize_image_data_uri(make_data_uri("image/jpeg", bytes));
    CHECK(!result.optimized);
    CHECK(result.data == bytes);

    CHECK_THROWS_AS((void)optimize_image_data_uri("data:image/png,raw"), DataUriError);
}
