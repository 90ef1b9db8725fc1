/**
 * @file universal_source.hpp
 * @brief File-backed raster source used when no in-memory codec applies.
 */

#ifndef IMGFIT_UNIVERSAL_SOURCE_HPP
#define IMGFIT_UNIVERSAL_SOURCE_HPP

#include "raster_source.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace imgfit {

/**
 * @brief Decodes through a temporary file.
 *
 * @details The constructor writes the encoded bytes to a fresh temporary
 * directory, identifies them with libmagic and reads only the header
 * (libtiff for TIFF, stb_image for JPEG, PNG, BMP, GIF, TGA, PSD, HDR and
 * PNM). Pixels are loaded from the file on the first render() and kept
 * for later renders. release() deletes the temporary directory; until
 * then the file stays on disk.
 */
class UniversalSource final : public IRasterSource {
public:
    /**
     * @throws DecodeError if the bytes are not a readable image.
     * @throws std::runtime_error if the temporary file cannot be created.
     */
    explicit UniversalSource(std::span<const std::uint8_t> bytes);
    ~UniversalSource() override;

    UniversalSource(const UniversalSource&) = delete;
    UniversalSource& operator=(const UniversalSource&) = delete;

    [[nodiscard]] int width() const noexcept override { return width_; }
    [[nodiscard]] int height() const noexcept override { return height_; }
    [[nodiscard]] std::string_view mime_type() const noexcept override { return mime_type_; }
    [[nodiscard]] std::string_view path_name() const noexcept override { return "universal"; }

    void render(Canvas& canvas) override;
    void release() noexcept override;

    /// @return Path of the temporary file holding the encoded bytes.
    [[nodiscard]] const std::filesystem::path& temp_file() const noexcept { return file_; }

private:
    enum class Reader { Tiff, Stb };

    void read_tiff_header();
    void read_stb_header();
    [[nodiscard]] Bitmap load_tiff() const;
    [[nodiscard]] Bitmap load_stb() const;

    std::filesystem::path temp_dir_;
    std::filesystem::path file_;
    std::string mime_type_;
    Reader reader_ = Reader::Stb;
    int width_ = 0;
    int height_ = 0;
    Bitmap pixels_;
    bool released_ = false;
};

} // namespace imgfit

#endif // IMGFIT_UNIVERSAL_SOURCE_HPP
