#include "report_generator.hpp"
#include "../../../libimgfit/include/logger.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

namespace {

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (const char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

double reduction_pct(const Result& r) {
    return r.success && r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

std::string outcome_of(const Result& r) {
    if (!r.success) return "FAIL";
    return r.optimized ? "OK (optimized)" : "OK (passthrough)";
}

std::string dimensions_of(const Result& r) {
    return r.success ? std::format("{}x{}", r.width, r.height) : "-";
}

} // namespace

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    std::size_t max_mime = 12;
    std::size_t max_dims = 12;
    std::size_t max_before = 12;
    std::size_t max_after = 12;
    std::size_t max_delta = 10;
    std::size_t max_time = 9;
    std::size_t max_result = 18;
    for (const auto& r : results) {
        max_mime = std::max(max_mime, r.mime.size() + 2);
        max_dims = std::max(max_dims, dimensions_of(r).size() + 2);
        max_before = std::max(max_before, std::to_string(r.size_before / 1024).size() + 2);
        max_after = std::max(max_after, std::to_string(r.size_after / 1024).size() + 2);
    }

    const std::size_t fixed_cols_width = max_mime + max_dims + max_before + max_after +
                                         max_delta + max_time + max_result + 5;
    const std::size_t file_col_width = term_width > fixed_cols_width + 10
                                           ? term_width - fixed_cols_width
                                           : 20;

    auto truncate = [](const std::string& s, const std::size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_mime)) << "MIME type"
              << std::setw(static_cast<int>(max_dims)) << "Size(px)"
              << std::setw(static_cast<int>(max_before)) << "Before(KB)"
              << std::setw(static_cast<int>(max_after)) << "After(KB)"
              << std::setw(static_cast<int>(max_delta)) << "Delta(%)"
              << std::setw(static_cast<int>(max_time)) << "Time(s)"
              << std::setw(static_cast<int>(max_result)) << "Result"
              << "Error\n";

    std::uintmax_t total_original = 0;
    std::uintmax_t total_saved = 0;
    std::size_t failures = 0;
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string delta = r.success ? std::format("{:.2f}%", reduction_pct(r)) : "-";
        const std::string outcome = outcome_of(r);
        const char* color = !r.success ? "\033[1;31m" : r.optimized ? "\033[1;32m" : "\033[1;33m";

        total_original += r.size_before;
        if (r.success && r.size_before > r.size_after)
            total_saved += r.size_before - r.size_after;
        if (!r.success) ++failures;

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(static_cast<int>(max_mime)) << (r.success ? r.mime : "-")
                  << std::setw(static_cast<int>(max_dims)) << dimensions_of(r)
                  << std::setw(static_cast<int>(max_before)) << r.size_before / 1024
                  << std::setw(static_cast<int>(max_after)) << r.size_after / 1024
                  << std::setw(static_cast<int>(max_delta)) << delta
                  << std::setw(static_cast<int>(max_time)) << std::format("{:.2f}", r.seconds)
                  << (use_colors ? color : "")
                  << std::setw(static_cast<int>(max_result)) << outcome
                  << (use_colors ? "\033[0m" : "")
                  << r.error_msg << "\n";
    }

    std::cerr << "\nImages: " << results.size() << " (" << failures << " failed)\n";
    std::cerr << "Total saved space: " << (total_saved / 1024) << " KB\n";
    if (total_original > 0) {
        const double total_pct = 100.0 * (static_cast<double>(total_saved) / static_cast<double>(total_original));
        std::cerr << "Total reduction: " << std::format("{:.2f}", total_pct) << "%\n";
    }
    std::cerr << "Total time: " << std::format("{:.2f}", total_seconds) << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    out << "File,MIME,Width,Height,Before(B),After(B),Delta(%),Attempts,Time(s),Result,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.mime) << ","
            << r.width << ","
            << r.height << ","
            << r.size_before << ","
            << r.size_after << ","
            << std::format("{:.2f}", reduction_pct(r)) << ","
            << r.attempts << ","
            << std::format("{:.2f}", r.seconds) << ","
            << csv_escape(outcome_of(r)) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << std::format("{:.2f}", total_seconds) << " seconds\n";
    return static_cast<bool>(out);
}
