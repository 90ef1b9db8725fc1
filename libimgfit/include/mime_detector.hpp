/**
 * @file mime_detector.hpp
 * @brief Content-based MIME detection backed by libmagic.
 */

#ifndef IMGFIT_MIME_DETECTOR_HPP
#define IMGFIT_MIME_DETECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace imgfit {

    /**
     * @brief Detects MIME types from file or buffer contents.
     *
     * Each call opens its own libmagic cookie, so the detector is safe to
     * use from concurrent optimization calls.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type (e.g. "image/tiff"). Falls back to the
         * extension map when libmagic is unavailable or unsure.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @return A MIME type, or an empty string if libmagic could not
         * be loaded.
         */
        static std::string detect(std::span<const std::uint8_t> data);
    };

} // namespace imgfit

#endif // IMGFIT_MIME_DETECTOR_HPP
