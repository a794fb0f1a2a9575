#pragma once

#include "ocr_layout/geometry.h"
#include "ocr_layout/layout_options.h"
#include <string>
#include <vector>

namespace ocr_layout {

enum class TextType {
    SMALL,        // footnotes, captions
    BODY,
    HEADING,
    SUBHEADING,
    TITLE,
    LARGE_TITLE
};

const char* text_type_name(TextType type);

struct FontClassification {
    double font_size = DEFAULT_BASE_FONT_SIZE;
    TextType text_type = TextType::BODY;
};

// Distribution of positive bounding-box heights
struct HeightStats {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double p25 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
};

/**
 * Infers a point size from normalized bounding-box height and maps it to a
 * semantic text type. With the default factor of 400 a height of 0.025 gives
 * 10pt body text and 0.1 gives a 40pt title.
 */
class FontSizeClassifier {
public:
    explicit FontSizeClassifier(double calibration_factor = DEFAULT_CALIBRATION_FACTOR,
                                double base_size = DEFAULT_BASE_FONT_SIZE,
                                double max_size = DEFAULT_MAX_FONT_SIZE);

    static FontSizeClassifier from_options(const LayoutOptions& options);

    double estimate_size(double height) const;
    FontClassification classify(double height) const;
    FontClassification classify(const TextFragment& fragment) const;

    // Aligned 1:1 with `fragments`
    std::vector<FontClassification> classify_all(const std::vector<TextFragment>& fragments) const;

    static TextType type_for_size(double font_size);

    double calibration_factor() const { return calibration_factor_; }

private:
    double calibration_factor_;
    double base_size_;
    double max_size_;
};

HeightStats analyze_heights(const std::vector<TextFragment>& fragments, bool quiet = false);

// expected_body_pt / p25 height, or the default factor when there is no data
double suggest_calibration_factor(const std::vector<TextFragment>& fragments,
                                  double expected_body_pt = DEFAULT_BASE_FONT_SIZE,
                                  bool quiet = false);

} // namespace ocr_layout
