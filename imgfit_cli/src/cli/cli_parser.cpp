#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <map>
#include <thread>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Print usage and exit.");
    app.set_version_flag("--version", "imgfit 1.0.0");

    app.add_flag("-r,--recursive", settings.recursive,
                 "Descend into subdirectories of directory inputs.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, results table).");

    auto* data_uri = app.add_flag("--data-uri", settings.data_uri,
                                  "Print each result as a data URI on stdout instead of writing files.");

    app.add_option("-o,--output", settings.output_path,
                   "Write optimized images to PATH.\n"
                   "(If input is stdin, PATH is a file. Otherwise, PATH is a directory).\n"
                   "Without -o or --data-uri only the report is printed.")
                   ->excludes(data_uri);

    app.add_option("--report", settings.report_path,
                   "Also write the per-image summary as CSV to PATH.")
                   ->take_last();

    // --- Optimization budget ---
    app.add_option("--max-dimension", settings.max_dimension,
                   "Longest edge of the output, in pixels.")
                   ->default_val(settings.max_dimension)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-bytes", settings.max_bytes,
                   "Encoded size budget (accepts suffixes such as 512KB or 6MB, binary units).")
                   ->default_str("6MB")
                   ->transform(CLI::AsSizeValue(false))
                   ->check(CLI::PositiveNumber);

    app.add_option("--format", settings.output_format, "Output format when re-encoding: 'jpeg' (default) or 'webp'.")
        ->default_val(imgfit::OutputFormat::JPEG)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, imgfit::OutputFormat>{
                {"jpeg", imgfit::OutputFormat::JPEG},
                {"jpg", imgfit::OutputFormat::JPEG},
                {"webp", imgfit::OutputFormat::WEBP}
            }, CLI::ignore_case));

    app.add_option("--quality", settings.quality,
                   "Initial encoder quality; clamped to [0.30, 0.95].")
                   ->default_val(settings.quality)
                   ->check(CLI::Range(0.0, 1.0));

    settings.num_threads = std::max(1U, std::thread::hardware_concurrency());
    app.add_option("--threads", settings.num_threads,
                   "Images optimized in parallel.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Minimum severity logged to the console (ERROR, WARNING, INFO, DEBUG or NONE).")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append every log line, at any level, to PATH.");

    app.add_option("--include", settings.include_patterns,
                   "Only optimize files whose path matches this regex. Repeatable.");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Skip files whose path matches this regex. Repeatable.");

    // --- Inputs ---
    app.add_option("inputs", settings.inputs, "One or more image files or directories (use '-' for stdin)")
        ->required()
        ->check([](const std::string& input) {
            if (input != "-" && !std::filesystem::exists(input)) {
                return "No such file or directory: '" + input + "'";
            }
            return std::string();
        });

    // options that constrain each other
    app.callback([&settings]() {
        settings.is_pipe = std::ranges::any_of(settings.inputs,
                                               [](const auto& path) { return path == "-"; });

        if (settings.is_pipe && settings.inputs.size() > 1) {
            throw CLI::ValidationError("'-' (stdin) must be the only input.");
        }

        if (settings.is_pipe && settings.output_path.empty() && !settings.data_uri) {
            throw CLI::ValidationError("Option '-o, --output' or '--data-uri' is required when using stdin ('-').");
        }

        const bool output_is_dir = !settings.output_path.empty() &&
                                   std::filesystem::is_directory(settings.output_path);
        if (settings.is_pipe && output_is_dir) {
            throw CLI::ValidationError("'-o' names a directory; stdin input needs an output file.");
        }

        if (!settings.is_pipe && !settings.output_path.empty() &&
            std::filesystem::exists(settings.output_path) && !std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory when optimizing files.");
        }
    });
}
