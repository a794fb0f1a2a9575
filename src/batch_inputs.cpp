#include "ocr_layout/batch_inputs.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ocr_layout {

namespace {

bool has_json_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

} // namespace

fs::path layout_output_name(const fs::path& input, bool text_only) {
    return input.stem().string() + (text_only ? "_layout.txt" : "_layout.json");
}

bool is_within_directory(const fs::path& path, const fs::path& directory) {
    auto target = fs::weakly_canonical(path);
    auto root = fs::weakly_canonical(directory);

    auto root_end = root.end();
    if (!root.empty() && root.filename().empty()) {
        --root_end;  // trailing separator
    }
    auto mismatch = std::mismatch(root.begin(), root_end, target.begin(), target.end());
    return mismatch.first == root_end;
}

std::vector<BatchInput> plan_batch(const fs::path& input_dir, const fs::path& output_dir,
                                   bool text_only) {
    std::vector<fs::path> sources;
    for (auto it = fs::recursive_directory_iterator(input_dir);
         it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_directory() && is_within_directory(it->path(), output_dir)) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file() && has_json_extension(it->path()) &&
            !is_within_directory(it->path(), output_dir)) {
            sources.push_back(it->path());
        }
    }
    std::sort(sources.begin(), sources.end());

    std::vector<BatchInput> inputs;
    std::map<fs::path, fs::path> claimed;
    for (const auto& source : sources) {
        auto relative_dir = fs::relative(source, input_dir).parent_path();
        auto output = (output_dir / relative_dir / layout_output_name(source, text_only)).lexically_normal();

        auto inserted = claimed.emplace(output, source);
        if (!inserted.second) {
            throw std::runtime_error("Inputs " + inserted.first->second.string() + " and " +
                                     source.string() + " both map to " + output.string());
        }
        inputs.push_back({source, output});
    }
    return inputs;
}

} // namespace ocr_layout
