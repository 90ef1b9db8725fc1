#ifndef IMGFIT_FILE_SCANNER_HPP
#define IMGFIT_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

struct Settings; // forward declaration

/**
 * @brief One file to optimize.
 */
struct InputFile {
    std::filesystem::path path;     ///< As found on disk
    std::filesystem::path relative; ///< Below the directory input it came from, or the bare file name
};

/**
 * @brief Expands the positional inputs into the list of files to optimize.
 *
 * Files named explicitly are always kept (unless filtered); directory
 * entries are kept only if their extension names an image format.
 * Include/exclude regexes apply to both. The result is sorted by path
 * and free of duplicates.
 */
std::vector<InputFile>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

#endif // IMGFIT_FILE_SCANNER_HPP
