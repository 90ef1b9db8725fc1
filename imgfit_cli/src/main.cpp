#include <atomic>
#include <chrono>
#include <csignal>
#include <clocale>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <string_view>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "utils/output_paths.hpp"
#include "../../libimgfit/include/imgfit.hpp"
#include "../../libimgfit/include/file_type.hpp"
#include "../../libimgfit/include/file_utils.hpp"
#include "../../libimgfit/include/logger.hpp"

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

// one-line progress: "[#####.....]  50.0%  3/6 images  1.2s"
void print_progress(const std::size_t done, const std::size_t total, const double elapsed_seconds) {
    const unsigned columns = get_terminal_width();
    const unsigned cells = columns > 60u ? columns - 45u : 15u;
    const double fraction = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);
    const auto filled = static_cast<unsigned>(fraction * cells);

    std::cerr << '\r' << CYAN << '[' << std::string(filled, '#') << std::string(cells - filled, '.') << ']'
              << RESET << ' ' << std::setw(5) << std::fixed << std::setprecision(1) << fraction * 100.0
              << "%  " << done << '/' << total << " images  " << elapsed_seconds << 's' << std::flush;
}

namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the main loop notices the flag
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

// file names are printed as-is, so prefer a UTF-8 console locale
void init_utf8_locale() {
    if (const char* current = std::setlocale(LC_ALL, "");
        current && std::string_view(current).find("UTF-8") != std::string_view::npos) {
        return;
    }
    for (const char* name : {"C.UTF-8", "en_US.UTF-8"}) {
        if (std::setlocale(LC_ALL, name)) {
            Logger::log(LogLevel::Debug, std::string("locale switched to ") + name, "main");
            return;
        }
    }
    Logger::log(LogLevel::Warning, "no UTF-8 locale available", "main");
}

// collects per-call timings reported by the library
class TimingObserver final : public imgfit::OptimizerObserver {
public:
    void onFinish(const std::string& source, std::size_t, std::size_t, bool, const double seconds) override {
        std::lock_guard lock(mtx_);
        seconds_[source] = seconds;
    }

    double seconds_for(const std::string& source) {
        std::lock_guard lock(mtx_);
        const auto it = seconds_.find(source);
        return it != seconds_.end() ? it->second : 0.0;
    }

private:
    std::mutex mtx_;
    std::map<std::string, double> seconds_;
};

int run_stdin(imgfit::ImageOptimizer& optimizer, const Settings& settings) {
#ifdef _WIN32
    _setmode(_fileno(stdin), _O_BINARY);
#endif
    const std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(std::cin),
                                          std::istreambuf_iterator<char>()};
    try {
        const imgfit::OptimizedResult result = optimizer.optimize(bytes, {}, "<stdin>");
        if (settings.data_uri) {
            std::cout << result.data_uri() << std::endl;
        } else {
            imgfit::write_file_bytes(settings.output_path, result.data);
        }
        if (!settings.quiet) {
            std::cerr << (result.optimized ? GREEN : YELLOW)
                      << "[DONE] <stdin> " << result.width << "x" << result.height << " "
                      << result.mime_type << " (" << result.original_bytes << " -> "
                      << result.output_bytes << " bytes)"
                      << (result.optimized ? "" : " [passthrough]")
                      << RESET << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"imgfit: fits images into a byte and pixel budget."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
        }
    }
    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    if (settings.log_level == "NONE") consoleSink->log_level = LogLevel::None;
    Logger::add_sink(std::move(consoleSink));

    init_utf8_locale();

    // outlives the optimizer, whose workers report to it
    TimingObserver timings;
    imgfit::ImageOptimizer optimizer;
    optimizer.maxDimension(settings.max_dimension)
             .maxBytes(settings.max_bytes)
             .outputFormat(settings.output_format)
             .quality(settings.quality)
             .threads(settings.num_threads);

    if (settings.is_pipe) {
        return run_stdin(optimizer, settings);
    }

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, settings);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    if (!settings.output_path.empty()) {
        std::error_code ec;
        fs::create_directories(settings.output_path, ec);
        if (ec) {
            std::cerr << RED << "Cannot create output directory " << settings.output_path.string()
                      << ": " << ec.message() << RESET << std::endl;
            return 1;
        }
    }

    optimizer.setObserver(&timings);

    const auto start_total = std::chrono::steady_clock::now();

    std::vector<std::pair<InputFile, std::future<imgfit::OptimizedResult>>> jobs;
    jobs.reserve(inputs.size());
    for (const auto& input : inputs) {
        jobs.emplace_back(input, optimizer.submitFile(input.path));
    }
    OutputPlanner planner(settings.output_path);

    std::vector<Result> results;
    results.reserve(jobs.size());
    bool any_failed = false;

    for (auto& [input, future] : jobs) {
        const fs::path& path = input.path;
        while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (interrupted.load()) break;
        }
        if (interrupted.load()) {
            std::cerr << CYAN
                      << "\n[INTERRUPT] Stop detected. Waiting for running images to finish..."
                      << RESET << std::endl;
            optimizer.stop();
            break;
        }

        Result r;
        r.path = path;
        try {
            const imgfit::OptimizedResult res = future.get();
            if (settings.data_uri) {
                std::cout << res.data_uri() << "\n";
            } else if (!settings.output_path.empty()) {
                const fs::path target = planner.claim(input, res.mime_type);
                fs::create_directories(target.parent_path());
                imgfit::write_file_bytes(target, res.data);
            }
            r.mime = res.mime_type;
            r.size_before = res.original_bytes;
            r.size_after = res.output_bytes;
            r.width = res.width;
            r.height = res.height;
            r.attempts = res.attempts;
            r.optimized = res.optimized;
            r.success = true;
        } catch (const std::exception& e) {
            std::error_code size_ec;
            const auto size = fs::file_size(path, size_ec);
            r.size_before = size_ec ? 0 : size;
            r.error_msg = e.what();
            any_failed = true;
        }
        r.seconds = timings.seconds_for(path.string());

        if (!settings.quiet) {
            if (r.success) {
                std::cerr << (r.optimized ? GREEN : YELLOW)
                          << "\r[DONE] " << path.filename().string()
                          << " (" << r.size_before << " -> " << r.size_after << " bytes, "
                          << r.width << "x" << r.height << ")"
                          << (r.optimized ? "" : " [passthrough]")
                          << RESET << "\n";
            } else {
                std::cerr << RED << "\r[FAIL] " << path.filename().string() << ": " << r.error_msg
                          << RESET << "\n";
            }
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress(results.size() + 1, jobs.size(), elapsed);
        }
        results.push_back(std::move(r));
    }
    if (!settings.quiet) std::cerr << std::endl;

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, settings.num_threads, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty() && !export_csv_report(results, settings.report_path, total_seconds)) {
        any_failed = true;
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return any_failed ? 1 : 0;
}
