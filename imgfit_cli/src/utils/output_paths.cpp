#include "output_paths.hpp"
#include "../../../libimgfit/include/file_type.hpp"
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

OutputPlanner::OutputPlanner(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

fs::path OutputPlanner::claim(const InputFile& input, const std::string& mime) {
    const auto ext = imgfit::mime_to_image_ext.find(mime);
    fs::path target = output_dir_ / input.relative;
    target.replace_extension(ext != imgfit::mime_to_image_ext.end() ? fs::path(ext->second)
                                                                    : input.path.extension());
    target = target.lexically_normal();

    if (const auto [it, inserted] = claimed_.emplace(target, input.path); !inserted) {
        throw std::runtime_error("output " + target.string() + " was already written for " +
                                 it->second.string());
    }
    return target;
}
