#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ocr_layout {

struct BatchInput {
    std::filesystem::path source;
    std::filesystem::path output;
};

// "<stem>_layout.json", or "<stem>_layout.txt" for text-only output
std::filesystem::path layout_output_name(const std::filesystem::path& input, bool text_only);

bool is_within_directory(const std::filesystem::path& path, const std::filesystem::path& directory);

// Collects every .json file under input_dir, sorted by path. The relative
// directory of each input is mirrored under output_dir, and nothing inside
// output_dir is picked up as input. Throws std::runtime_error when two inputs
// would be written to the same output file.
std::vector<BatchInput> plan_batch(const std::filesystem::path& input_dir,
                                   const std::filesystem::path& output_dir,
                                   bool text_only = false);

} // namespace ocr_layout
