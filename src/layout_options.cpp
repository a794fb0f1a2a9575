#include "ocr_layout/layout_options.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ocr_layout {

namespace {

template<typename T>
void read_if_present(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("config value '") + key + "' must be a number");
    }
    target = it->get<T>();
}

} // namespace

LayoutOptions load_layout_options(const std::string& config_path, const LayoutOptions& defaults) {
    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path);
    }

    std::ifstream in(config_path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + config_path);
    }

    nlohmann::json config;
    try {
        in >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + config_path + ": " + e.what());
    }

    LayoutOptions options = defaults;
    apply_layout_config(options, config);
    return options;
}

void apply_layout_config(LayoutOptions& options, const nlohmann::json& config) {
    if (!config.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }

    auto layout = config.find("layout");
    if (layout != config.end() && layout->is_object()) {
        read_if_present(*layout, "column_gap_threshold", options.column_gap_threshold);
        read_if_present(*layout, "paragraph_gap_threshold", options.paragraph_gap_threshold);

        auto threads = layout->find("threads");
        if (threads != layout->end() && !threads->is_null()) {
            if (!threads->is_number_integer() || threads->get<int64_t>() < 0) {
                throw std::invalid_argument("config value 'threads' must be a non-negative integer");
            }
            if (threads->get<int64_t>() > 0) {
                options.thread_count = static_cast<size_t>(threads->get<int64_t>());
            }
        }
    }

    auto quality = config.find("quality");
    if (quality != config.end() && quality->is_object()) {
        read_if_present(*quality, "calibration_factor", options.calibration_factor);
        read_if_present(*quality, "base_font_size", options.base_font_size);
        read_if_present(*quality, "max_font_size", options.max_font_size);
    }

    validate_layout_options(options);
}

void validate_layout_options(const LayoutOptions& options) {
    if (!(options.calibration_factor > 0.0)) {
        throw std::invalid_argument("calibration_factor must be positive");
    }
    if (!(options.base_font_size > 0.0) || !(options.max_font_size > 0.0)) {
        throw std::invalid_argument("font sizes must be positive");
    }
    if (options.base_font_size * 0.7 > options.max_font_size) {
        throw std::invalid_argument("max_font_size is below the minimum derived from base_font_size");
    }
    if (!(options.column_gap_threshold >= 0.0)) {
        throw std::invalid_argument("column_gap_threshold cannot be negative");
    }
    if (!(options.paragraph_gap_threshold >= 0.0)) {
        throw std::invalid_argument("paragraph_gap_threshold cannot be negative");
    }
}

} // namespace ocr_layout
