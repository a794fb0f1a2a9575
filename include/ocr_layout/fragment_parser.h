#pragma once

#include "ocr_layout/geometry.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ocr_layout {

struct ParseReport {
    size_t total_records = 0;
    size_t dropped_empty = 0;
    size_t missing_grounding = 0;
};

class FragmentParser {
public:
    // Normalize raw OCR records into fragments. Never throws on malformed
    // records; missing geometry falls back to the full-page box on page 0.
    static std::vector<TextFragment> parse(const nlohmann::json& records,
                                           ParseReport* report = nullptr);

    // Returns false when the record carries no usable text
    static bool parse_record(const nlohmann::json& record, TextFragment& out,
                             bool* missing_grounding = nullptr);

    static std::string trim(const std::string& text);

private:
    static double number_or(const nlohmann::json& object, const char* key, double fallback);
    static int page_or_zero(const nlohmann::json& grounding);
};

} // namespace ocr_layout
