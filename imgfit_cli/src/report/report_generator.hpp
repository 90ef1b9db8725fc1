#ifndef IMGFIT_REPORT_GENERATOR_HPP
#define IMGFIT_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Outcome of one input, as shown in the console table and the CSV report.
 */
struct Result {
    std::filesystem::path path;
    std::string mime;              ///< MIME type of the output
    std::uintmax_t size_before = 0;
    std::uintmax_t size_after = 0;
    int width = 0;                 ///< Output dimensions
    int height = 0;
    int attempts = 0;
    bool success = false;
    bool optimized = false;        ///< False for passthrough
    double seconds = 0.0;
    std::string error_msg;
};

/**
 * @brief Width of the attached terminal in columns (80 if unknown).
 */
unsigned get_terminal_width();

/**
 * @brief Prints the results table and totals to stderr.
 */
void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes the results as CSV.
 * @return False if the file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // IMGFIT_REPORT_GENERATOR_HPP
