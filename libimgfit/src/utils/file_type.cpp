#include "../../include/file_type.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <initializer_list>

namespace {

bool starts_with(const std::span<const std::uint8_t> data, const std::initializer_list<std::uint8_t> sig) {
    return data.size() >= sig.size() && std::equal(sig.begin(), sig.end(), data.begin());
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

namespace imgfit {

std::string sniff_image_mime(const std::span<const std::uint8_t> data) {
    if (starts_with(data, {0xFF, 0xD8, 0xFF})) {
        return "image/jpeg";
    }
    if (starts_with(data, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) {
        return "image/png";
    }
    // RIFF....WEBP
    if (data.size() >= 12 && starts_with(data, {'R', 'I', 'F', 'F'}) &&
        std::memcmp(data.data() + 8, "WEBP", 4) == 0) {
        return "image/webp";
    }
    if (starts_with(data, {'G', 'I', 'F', '8'})) {
        return "image/gif";
    }
    if (starts_with(data, {'B', 'M'})) {
        return "image/bmp";
    }
    if (starts_with(data, {'I', 'I', 0x2A, 0x00}) || starts_with(data, {'M', 'M', 0x00, 0x2A})) {
        return "image/tiff";
    }
    return {};
}

std::string mime_from_extension(const std::string_view ext) {
    const auto it = image_ext_to_mime.find(to_lower(ext));
    return it != image_ext_to_mime.end() ? it->second : "application/octet-stream";
}

} // namespace imgfit
