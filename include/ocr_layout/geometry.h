#pragma once

#include <string>
#include <vector>

namespace ocr_layout {

// Normalized (0-1) page coordinates. Inverted boxes are allowed.
struct BoundingBox {
    double left = 0.0;
    double top = 0.0;
    double right = 1.0;
    double bottom = 1.0;

    double width() const { return right - left; }
    double height() const { return bottom - top; }
    double center_x() const { return (left + right) / 2.0; }
    double center_y() const { return (top + bottom) / 2.0; }

    bool operator==(const BoundingBox& other) const {
        return left == other.left && top == other.top &&
               right == other.right && bottom == other.bottom;
    }
};

// One OCR text fragment with its grounding data
struct TextFragment {
    std::string text;
    int page = 0;
    BoundingBox box;
};

struct Page {
    int page_number = 0;
    std::vector<TextFragment> fragments;
};

using Column = std::vector<TextFragment>;

} // namespace ocr_layout
