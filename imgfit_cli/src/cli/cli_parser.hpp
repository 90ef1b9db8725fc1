#ifndef IMGFIT_CLI_PARSER_HPP
#define IMGFIT_CLI_PARSER_HPP

#include "../../../libimgfit/include/image_types.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;
    bool data_uri = false;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    int max_dimension = 2048;
    std::size_t max_bytes = 6 * 1024 * 1024;
    imgfit::OutputFormat output_format = imgfit::OutputFormat::JPEG;
    double quality = 0.85;

    std::vector<std::filesystem::path> inputs;

    bool is_pipe = false;

    [[nodiscard]] imgfit::OptimizeOptions options() const {
        return {max_dimension, max_bytes, output_format, quality};
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // IMGFIT_CLI_PARSER_HPP
