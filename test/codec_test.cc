#include <drogon/drogon_test.h>
#include "test_images.hpp"
#include "../libimgfit/include/canvas.hpp"
#include "../libimgfit/include/codec_registry.hpp"
#include "../libimgfit/include/errors.hpp"
#include "../libimgfit/include/png_codec.hpp"
#include "../libimgfit/include/webp_codec.hpp"
#include <cstdlib>
#include <vector>

using namespace imgfit;

DROGON_TEST(RegistryLookups)
{
    const auto& registry = CodecRegistry::instance();
    CHECK(registry.all().size() == 3);

    const ICodec* png = registry.find_decoder("IMAGE/PNG");
    REQUIRE(png != nullptr);
    CHECK(png->get_name() == "PngCodec");
    CHECK(!png->can_encode());

    CHECK(registry.find_decoder("image/pjpeg") != nullptr);
    CHECK(registry.find_decoder("image/webp") != nullptr);
    CHECK(registry.find_decoder("image/bmp") == nullptr);
    CHECK(registry.find_decoder("") == nullptr);

    const ICodec* jpeg = registry.find_encoder(OutputFormat::JPEG);
    REQUIRE(jpeg != nullptr);
    CHECK(jpeg->get_name() == "JpegCodec");
    const ICodec* webp = registry.find_encoder(OutputFormat::WEBP);
    REQUIRE(webp != nullptr);
    CHECK(webp->get_name() == "WebpCodec");
}

DROGON_TEST(JpegEncodeDecode)
{
    const auto bytes = test_images::jpeg(120, 80);
    REQUIRE(bytes.size() > 2);
    CHECK(bytes[0] == 0xFF);
    CHECK(bytes[1] == 0xD8);

    const Bitmap decoded = JpegCodec().decode(bytes);
    CHECK(decoded.width == 120);
    CHECK(decoded.height == 80);
    CHECK(decoded.pixels.size() == 120u * 80u * 4u);
    CHECK(decoded.pixels[3] == 255);
}

DROGON_TEST(JpegQualityShrinksOutput)
{
    const auto high = test_images::jpeg(256, 256, 0.95);
    const auto low = test_images::jpeg(256, 256, 0.30);
    CHECK(low.size() < high.size());
}

DROGON_TEST(JpegRejectsGarbage)
{
    const std::vector<std::uint8_t> garbage{0xFF, 0xD8, 0xFF, 0x00, 0x01, 0x02, 0x03};
    CHECK_THROWS_AS((void)JpegCodec().decode(garbage), DecodeError);
    CHECK_THROWS_AS((void)JpegCodec().decode({}), DecodeError);
}

DROGON_TEST(PngDecodeKeepsAlpha)
{
    std::vector<std::uint8_t> rgba;
    for (int i = 0; i < 4; ++i)
        rgba.insert(rgba.end(), {200, 100, 50, static_cast<std::uint8_t>(i * 80)});
    const auto bytes = test_images::png_rgba(2, 2, rgba);

    const Bitmap decoded = PngCodec().decode(bytes);
    REQUIRE(decoded.width == 2);
    REQUIRE(decoded.height == 2);
    REQUIRE(decoded.pixels.size() == rgba.size());
    for (std::size_t i = 3; i < rgba.size(); i += 4)
        CHECK(decoded.pixels[i] == rgba[i]);
    CHECK(decoded.pixels[12] == 200);
    CHECK(decoded.pixels[13] == 100);

    Canvas canvas(2, 2);
    CHECK_THROWS_AS((void)PngCodec().encode(canvas, 0.8), std::logic_error);
}

DROGON_TEST(PngRejectsTruncatedData)
{
    auto bytes = test_images::transparent_png(16, 16);
    bytes.resize(bytes.size() / 2);
    CHECK_THROWS_AS((void)PngCodec().decode(bytes), DecodeError);

    const std::vector<std::uint8_t> not_png{'G', 'I', 'F', '8', '9', 'a', 0, 0, 0};
    CHECK_THROWS_AS((void)PngCodec().decode(not_png), DecodeError);
}

DROGON_TEST(WebpEncodeDecode)
{
    Canvas canvas(64, 48);
    canvas.fill(Rgba{30, 60, 90, 255});

    const auto bytes = WebpCodec().encode(canvas, 0.8);
    REQUIRE(bytes.size() > 12);
    CHECK(bytes[0] == 'R');
    CHECK(bytes[8] == 'W');

    const Bitmap decoded = WebpCodec().decode(bytes);
    CHECK(decoded.width == 64);
    CHECK(decoded.height == 48);
    // lossy, so only approximately the fill color
    CHECK(std::abs(decoded.pixels[0] - 30) < 12);
    CHECK(std::abs(decoded.pixels[2] - 90) < 12);
}

DROGON_TEST(WebpKeepsTransparency)
{
    Canvas canvas(16, 16);
    const auto bytes = WebpCodec().encode(canvas, 0.8);
    const Bitmap decoded = WebpCodec().decode(bytes);
    REQUIRE(!decoded.empty());
    CHECK(decoded.pixels[3] == 0);
}
