/**
 * @file file_type.hpp
 * @brief Image format identification: signature sniffing and extension maps.
 *
 * Sniffing looks at the leading bytes only and is what the decoder
 * uses to pick a fast in-memory codec. The extension map is the
 * fallback used for files whose type libmagic cannot tell.
 */

#ifndef IMGFIT_FILE_TYPE_HPP
#define IMGFIT_FILE_TYPE_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace imgfit {

/// MIME type reported for passthrough results whose format is unknown.
inline constexpr std::string_view kFallbackMime = "image/png";

/**
 * @brief Identifies an encoded image from its signature.
 * @param data The leading bytes of the image (the whole buffer is fine).
 * @return The MIME type ("image/jpeg", "image/png", "image/webp",
 * "image/gif", "image/bmp", "image/tiff"), or an empty string.
 */
[[nodiscard]] std::string sniff_image_mime(std::span<const std::uint8_t> data);

/**
 * @brief Extension (lowercase) based MIME lookup.
 * @param ext Extension including the dot, any case (e.g. ".JPG").
 * @return MIME type or "application/octet-stream".
 */
[[nodiscard]] std::string mime_from_extension(std::string_view ext);

///< Map linking common image file extensions (lowercase) to their MIME type.
inline const std::unordered_map<std::string, std::string> image_ext_to_mime = {
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".jpe",  "image/jpeg"},
    {".jfif", "image/jpeg"},
    {".png",  "image/png"},
    {".webp", "image/webp"},
    {".gif",  "image/gif"},
    {".bmp",  "image/bmp"},
    {".tif",  "image/tiff"},
    {".tiff", "image/tiff"},
    {".tga",  "image/x-tga"},
    {".psd",  "image/vnd.adobe.photoshop"},
    {".hdr",  "image/vnd.radiance"},
    {".pnm",  "image/x-portable-anymap"},
    {".pbm",  "image/x-portable-bitmap"},
    {".pgm",  "image/x-portable-graymap"},
    {".ppm",  "image/x-portable-pixmap"},
};

///< Map linking output MIME types to the extension used when writing them.
inline const std::unordered_map<std::string, std::string> mime_to_image_ext = {
    {"image/jpeg", ".jpg"},
    {"image/webp", ".webp"},
    {"image/png",  ".png"},
    {"image/gif",  ".gif"},
    {"image/bmp",  ".bmp"},
    {"image/tiff", ".tiff"},
};

} // namespace imgfit

#endif // IMGFIT_FILE_TYPE_HPP
