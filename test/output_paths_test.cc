#include <drogon/drogon_test.h>
#include "../imgfit_cli/src/utils/output_paths.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

DROGON_TEST(OutputKeepsDirectoryLayout)
{
    OutputPlanner planner("out");
    const InputFile first{"photos/a/photo.png", "a/photo.png"};
    const InputFile second{"photos/b/photo.png", "b/photo.png"};

    CHECK(planner.claim(first, "image/jpeg") == fs::path("out/a/photo.jpg"));
    CHECK(planner.claim(second, "image/jpeg") == fs::path("out/b/photo.jpg"));
}

DROGON_TEST(OutputExtensionFollowsFormat)
{
    OutputPlanner planner("out");
    CHECK(planner.claim({"x/shot.PNG", "shot.PNG"}, "image/webp") == fs::path("out/shot.webp"));
    // passthrough of a format without a known extension keeps the input's
    CHECK(planner.claim({"x/scan.jp2", "scan.jp2"}, "image/jp2") == fs::path("out/scan.jp2"));
}

DROGON_TEST(SameTargetIsNotOverwritten)
{
    OutputPlanner planner("out");
    CHECK(planner.claim({"dir/photo.png", "photo.png"}, "image/jpeg") == fs::path("out/photo.jpg"));
    CHECK_THROWS_AS(planner.claim({"dir/photo.jpg", "photo.jpg"}, "image/jpeg"), std::runtime_error);
    // two explicit files from different folders collide on the bare name too
    CHECK_THROWS_AS(planner.claim({"other/photo.jpeg", "photo.jpeg"}, "image/jpeg"), std::runtime_error);
    CHECK(planner.claim({"dir/photo.png", "photo.png"}, "image/webp") == fs::path("out/photo.webp"));
}
