#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/file_type.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace {

#ifndef _WIN32
struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

unique_magic open_magic() {
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed", "mime_detector");
        return nullptr;
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Warning,
                    std::string("magic_load failed: ") + magic_error(magic.get()),
                    "mime_detector");
        return nullptr;
    }
    return magic;
}
#endif

} // namespace

std::string imgfit::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    if (const auto magic = open_magic()) {
        const char* mime = magic_file(magic.get(), path.string().c_str());
        std::string result = mime ? mime : "";
        // libmagic answers octet-stream for formats it has no rule for
        if (!result.empty() && result != "application/octet-stream") {
            return result;
        }
    }
#endif
    return mime_from_extension(path.extension().string());
}

std::string imgfit::MimeDetector::detect(const std::span<const std::uint8_t> data)
{
#ifndef _WIN32
    if (const auto magic = open_magic()) {
        const char* mime = magic_buffer(magic.get(), data.data(), data.size());
        return mime ? mime : "";
    }
    return {};
#else
    return sniff_image_mime(data);
#endif
}
