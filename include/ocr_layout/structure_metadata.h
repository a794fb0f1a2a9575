#pragma once

#include "ocr_layout/geometry.h"
#include "ocr_layout/layout_options.h"
#include <map>
#include <vector>
#include <nlohmann/json.hpp>

namespace ocr_layout {

struct PageStructure {
    size_t chunk_count = 0;
    size_t column_count = 0;
    bool has_multi_column = false;
};

struct StructureMetadata {
    size_t total_pages = 0;
    size_t total_chunks = 0;
    std::map<int, PageStructure> pages;

    nlohmann::json to_json() const;
};

StructureMetadata extract_structure(const std::vector<TextFragment>& fragments,
                                    double column_gap_threshold = COLUMN_GAP_THRESHOLD);

} // namespace ocr_layout
