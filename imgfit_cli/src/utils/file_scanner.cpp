#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libimgfit/include/file_type.hpp"
#include "../../../libimgfit/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });
    return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

bool has_image_extension(const fs::path& p) {
    return imgfit::mime_from_extension(p.extension().string()).starts_with("image/");
}

bool matches_any(const std::string& path_str, const std::vector<std::string>& patterns, const char* kind) {
    for (const auto& pattern : patterns) {
        try {
            if (std::regex_search(path_str, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning,
                        std::string("Invalid ") + kind + " regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }
    return false;
}

bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.string();
    if (matches_any(path_str, settings.exclude_patterns, "exclude")) {
        return true;
    }
    return !settings.include_patterns.empty() && !matches_any(path_str, settings.include_patterns, "include");
}

template <class Iterator>
void collect_directory(const fs::path& dir, const Settings& settings, std::vector<InputFile>& result) {
    std::error_code ec;
    for (Iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && has_image_extension(p) && !is_junk(p) && !is_filtered(p, settings)) {
            result.push_back({p, p.lexically_relative(dir)});
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Error scanning " + dir.string() + ": " + ec.message(), "scanner");
    }
}

} // namespace

std::vector<InputFile>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings) {
    std::vector<InputFile> result;

    for (const auto& in : inputs) {
        if (!fs::exists(in)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in)) {
            if (settings.recursive) {
                collect_directory<fs::recursive_directory_iterator>(in, settings, result);
            } else {
                collect_directory<fs::directory_iterator>(in, settings, result);
            }
        } else if (fs::is_regular_file(in) && !is_junk(in) && !is_filtered(in, settings)) {
            result.push_back({in, in.filename()});
        }
    }

    std::ranges::sort(result, {}, &InputFile::path);
    const auto duplicates = std::ranges::unique(result, {}, &InputFile::path);
    result.erase(duplicates.begin(), duplicates.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
