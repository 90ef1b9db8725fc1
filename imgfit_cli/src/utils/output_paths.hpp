#ifndef IMGFIT_OUTPUT_PATHS_HPP
#define IMGFIT_OUTPUT_PATHS_HPP

#include "file_scanner.hpp"
#include <filesystem>
#include <map>
#include <string>

/**
 * @brief Maps optimized inputs to files under the output directory.
 *
 * An input keeps its position below the directory it was found in and
 * takes the extension of the format it was written as. Two inputs that
 * land on the same file (a/x.png and a/x.jpg both becoming a/x.jpg)
 * are not allowed to overwrite each other: the second claim fails.
 * Not thread-safe; the CLI claims from its collecting loop only.
 */
class OutputPlanner {
public:
    explicit OutputPlanner(std::filesystem::path output_dir);

    /**
     * @brief Reserves the output file for an input.
     * @param mime MIME type of the data that will be written.
     * @throws std::runtime_error if another input already claimed that file.
     */
    std::filesystem::path claim(const InputFile& input, const std::string& mime);

private:
    std::filesystem::path output_dir_;
    std::map<std::filesystem::path, std::filesystem::path> claimed_; ///< target -> input
};

#endif // IMGFIT_OUTPUT_PATHS_HPP
