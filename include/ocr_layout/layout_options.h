#pragma once

#include <string>
#include <thread>
#include <functional>
#include <nlohmann/json.hpp>

namespace ocr_layout {

constexpr double COLUMN_GAP_THRESHOLD = 0.2;      // 20% of page width
constexpr double PARAGRAPH_GAP_THRESHOLD = 0.05;  // 5% of page height
constexpr double DEFAULT_BASE_FONT_SIZE = 11.0;
constexpr double DEFAULT_MAX_FONT_SIZE = 48.0;
constexpr double DEFAULT_CALIBRATION_FACTOR = 400.0;

// Called once per composed page with the page number and its column count.
// LayoutReconstructor::analyze_batch invokes it concurrently from worker threads.
using PageObserver = std::function<void(int page_number, size_t column_count)>;

struct LayoutOptions {
    double column_gap_threshold = COLUMN_GAP_THRESHOLD;
    double paragraph_gap_threshold = PARAGRAPH_GAP_THRESHOLD;
    double base_font_size = DEFAULT_BASE_FONT_SIZE;
    double max_font_size = DEFAULT_MAX_FONT_SIZE;
    double calibration_factor = DEFAULT_CALIBRATION_FACTOR;
    size_t thread_count = std::thread::hardware_concurrency();
    bool verbose = false;
    bool quiet = false;
    PageObserver page_observer;
};

// Load options from a JSON config file with "layout" and "quality" sections.
// Throws std::runtime_error if the file is missing or not valid JSON.
LayoutOptions load_layout_options(const std::string& config_path,
                                  const LayoutOptions& defaults = LayoutOptions{});

// Apply an already parsed config document on top of `options`
void apply_layout_config(LayoutOptions& options, const nlohmann::json& config);

// Throws std::invalid_argument on out-of-range values
void validate_layout_options(const LayoutOptions& options);

} // namespace ocr_layout
