/**
 * @file file_utils.hpp
 * @brief Small filesystem helpers: stdio handles, whole-file I/O, temp dirs.
 */

#ifndef IMGFIT_FILE_UTILS_HPP
#define IMGFIT_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgfit {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes (truncating) a whole buffer to a file.
     * @throws std::runtime_error if the file cannot be opened or fully written.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const std::uint8_t> data);

    /**
     * @brief Creates a unique temporary directory.
     *
     * The directory is created inside the system temp path as
     * "imgfit-{prefix}/{prefix}_{random_suffix}".
     *
     * @param prefix A short prefix (e.g., "decode").
     * @return Path of the newly created directory.
     * @throws std::runtime_error if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir(const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils") noexcept;
} // namespace imgfit

#endif // IMGFIT_FILE_UTILS_HPP
