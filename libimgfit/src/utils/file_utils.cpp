#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <random>
#include <stdexcept>
#include <system_error>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;

    std::string random_suffix() {
        return std::to_string(dist(rng));
    }
} // namespace

namespace imgfit {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char (UTF-16) paths
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);
        return _wfopen(path.wstring().c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path) {
        const unique_FILE in(open_file(path, "rb"));
        if (!in) {
            Logger::log(LogLevel::Error, "Cannot open input: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open input: " + path.string());
        }

        std::vector<std::uint8_t> data;
        std::uint8_t chunk[64 * 1024];
        std::size_t n = 0;
        while ((n = std::fread(chunk, 1, sizeof(chunk), in.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(in.get())) {
            Logger::log(LogLevel::Error, "Read error on: " + path.string(), "file_utils");
            throw std::runtime_error("Read error on: " + path.string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const std::uint8_t> data) {
        unique_FILE out(open_file(path, "wb"));
        if (!out) {
            Logger::log(LogLevel::Error, "Cannot open output: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open output: " + path.string());
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), out.get()) != data.size()) {
            throw std::runtime_error("Short write on: " + path.string());
        }
        // close explicitly so a failing flush is reported instead of lost in the destructor
        if (std::fclose(out.release()) != 0) {
            throw std::runtime_error("Failed to flush: " + path.string());
        }
    }

    std::filesystem::path make_temp_dir(const std::string& prefix) {
        const auto base_tmp = std::filesystem::temp_directory_path() / ("imgfit-" + prefix);

        std::error_code ec;
        std::filesystem::create_directories(base_tmp, ec);

        auto dir = base_tmp / (prefix + "_" + random_suffix());
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::runtime_error("Failed to create temp dir: " + dir.string());
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) noexcept {
        if (dir.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace imgfit
