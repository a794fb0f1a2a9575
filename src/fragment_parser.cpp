#include "ocr_layout/fragment_parser.h"
#include <cmath>
#include <cstdint>
#include <limits>

namespace ocr_layout {

std::vector<TextFragment> FragmentParser::parse(const nlohmann::json& records, ParseReport* report) {
    std::vector<TextFragment> fragments;
    ParseReport local;

    if (!records.is_array()) {
        if (report) *report = local;
        return fragments;
    }

    fragments.reserve(records.size());
    local.total_records = records.size();

    for (const auto& record : records) {
        TextFragment fragment;
        bool missing_grounding = false;
        if (!parse_record(record, fragment, &missing_grounding)) {
            local.dropped_empty++;
            continue;
        }
        if (missing_grounding) {
            local.missing_grounding++;
        }
        fragments.push_back(std::move(fragment));
    }

    if (report) *report = local;
    return fragments;
}

bool FragmentParser::parse_record(const nlohmann::json& record, TextFragment& out,
                                  bool* missing_grounding) {
    if (!record.is_object()) {
        return false;
    }

    auto text_it = record.find("text");
    if (text_it == record.end() || !text_it->is_string()) {
        return false;
    }
    std::string text = trim(text_it->get<std::string>());
    if (text.empty()) {
        return false;
    }

    TextFragment fragment;
    fragment.text = std::move(text);

    auto grounding_it = record.find("grounding");
    bool has_grounding = grounding_it != record.end() && grounding_it->is_object() &&
                         !grounding_it->empty();
    if (missing_grounding) {
        *missing_grounding = !has_grounding;
    }

    if (has_grounding) {
        const auto& grounding = *grounding_it;
        fragment.page = page_or_zero(grounding);

        auto box_it = grounding.find("box");
        if (box_it != grounding.end() && box_it->is_object()) {
            const auto& box = *box_it;
            fragment.box.left = number_or(box, "left", 0.0);
            fragment.box.top = number_or(box, "top", 0.0);
            fragment.box.right = number_or(box, "right", 1.0);
            fragment.box.bottom = number_or(box, "bottom", 1.0);
        }
    }

    out = std::move(fragment);
    return true;
}

std::string FragmentParser::trim(const std::string& text) {
    static const char* whitespace = " \t\r\n\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

double FragmentParser::number_or(const nlohmann::json& object, const char* key, double fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return fallback;
    }
    double value = it->get<double>();
    return std::isfinite(value) ? value : fallback;
}

int FragmentParser::page_or_zero(const nlohmann::json& grounding) {
    auto it = grounding.find("page");
    if (it == grounding.end()) {
        return 0;
    }

    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        return value > static_cast<uint64_t>(std::numeric_limits<int>::max())
                   ? std::numeric_limits<int>::max()
                   : static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        auto value = it->get<int64_t>();
        if (value < 0) return 0;
        return value > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max()
                                                        : static_cast<int>(value);
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value) || value < 0.0) return 0;
        if (value > static_cast<double>(std::numeric_limits<int>::max())) {
            return std::numeric_limits<int>::max();
        }
        return static_cast<int>(value);
    }
    return 0;
}

} // namespace ocr_layout
