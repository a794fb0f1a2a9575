#include "ocr_layout/font_size_classifier.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <iostream>

namespace ocr_layout {

const char* text_type_name(TextType type) {
    switch (type) {
        case TextType::SMALL: return "small";
        case TextType::BODY: return "body";
        case TextType::HEADING: return "heading";
        case TextType::SUBHEADING: return "subheading";
        case TextType::TITLE: return "title";
        case TextType::LARGE_TITLE: return "large_title";
    }
    return "body";
}

FontSizeClassifier::FontSizeClassifier(double calibration_factor, double base_size, double max_size)
    : calibration_factor_(calibration_factor),
      base_size_(base_size),
      max_size_(max_size) {}

FontSizeClassifier FontSizeClassifier::from_options(const LayoutOptions& options) {
    return FontSizeClassifier(options.calibration_factor, options.base_font_size, options.max_font_size);
}

double FontSizeClassifier::estimate_size(double height) const {
    double estimated = height * calibration_factor_;

    // Slightly smaller than body text is still allowed
    double min_size = base_size_ * 0.7;
    estimated = std::max(min_size, std::min(estimated, max_size_));

    // Half-point steps, ties to even (11.25 -> 11.0)
    return std::nearbyint(estimated * 2.0) / 2.0;
}

TextType FontSizeClassifier::type_for_size(double font_size) {
    if (font_size < 10.0) return TextType::SMALL;
    if (font_size < 13.0) return TextType::BODY;
    if (font_size < 18.0) return TextType::HEADING;
    if (font_size < 24.0) return TextType::SUBHEADING;
    if (font_size < 36.0) return TextType::TITLE;
    return TextType::LARGE_TITLE;
}

FontClassification FontSizeClassifier::classify(double height) const {
    FontClassification result;
    result.font_size = estimate_size(height);
    result.text_type = type_for_size(result.font_size);
    return result;
}

FontClassification FontSizeClassifier::classify(const TextFragment& fragment) const {
    return classify(fragment.box.height());
}

std::vector<FontClassification> FontSizeClassifier::classify_all(
    const std::vector<TextFragment>& fragments) const {
    std::vector<FontClassification> results;
    results.reserve(fragments.size());
    for (const auto& fragment : fragments) {
        results.push_back(classify(fragment));
    }
    return results;
}

HeightStats analyze_heights(const std::vector<TextFragment>& fragments, bool quiet) {
    HeightStats stats;

    std::vector<double> heights;
    heights.reserve(fragments.size());
    for (const auto& fragment : fragments) {
        double height = fragment.box.height();
        if (height > 0.0) {
            heights.push_back(height);
        }
    }

    if (heights.empty()) {
        if (!quiet) {
            std::cerr << "[analyze_heights] No valid bounding box heights found" << std::endl;
        }
        return stats;
    }

    std::sort(heights.begin(), heights.end());
    size_t n = heights.size();

    stats.count = n;
    stats.min = heights.front();
    stats.max = heights.back();
    stats.mean = std::accumulate(heights.begin(), heights.end(), 0.0) / static_cast<double>(n);
    stats.median = (n % 2 == 1) ? heights[n / 2]
                                : (heights[n / 2 - 1] + heights[n / 2]) / 2.0;
    stats.p25 = heights[n / 4];
    stats.p75 = heights[3 * n / 4];
    stats.p90 = n >= 10 ? heights[9 * n / 10] : stats.max;

    return stats;
}

double suggest_calibration_factor(const std::vector<TextFragment>& fragments,
                                  double expected_body_pt, bool quiet) {
    HeightStats stats = analyze_heights(fragments, quiet);
    if (stats.count == 0) {
        if (!quiet) {
            std::cerr << "[suggest_calibration_factor] No height data, using default calibration" << std::endl;
        }
        return DEFAULT_CALIBRATION_FACTOR;
    }

    // The 25th percentile stands in for body text; the median may include headings
    double body_height = stats.p25;
    if (body_height == 0.0) {
        return DEFAULT_CALIBRATION_FACTOR;
    }
    return expected_body_pt / body_height;
}

} // namespace ocr_layout
