#include "ocr_layout/structure_metadata.h"
#include "ocr_layout/reading_order.h"
#include <string>

namespace ocr_layout {

StructureMetadata extract_structure(const std::vector<TextFragment>& fragments, double column_gap_threshold) {
    StructureMetadata structure;
    auto pages = group_by_page(fragments);

    structure.total_pages = pages.size();
    structure.total_chunks = fragments.size();

    for (const auto& page : pages) {
        PageStructure info;
        info.chunk_count = page.fragments.size();
        info.column_count = detect_columns(page.fragments, column_gap_threshold).size();
        info.has_multi_column = info.column_count > 1;
        structure.pages[page.page_number] = info;
    }
    return structure;
}

nlohmann::json StructureMetadata::to_json() const {
    nlohmann::json result;
    result["total_pages"] = total_pages;
    result["total_chunks"] = total_chunks;
    result["pages"] = nlohmann::json::object();

    for (const auto& [page_number, info] : pages) {
        result["pages"][std::to_string(page_number)] = {
            {"chunks", info.chunk_count},
            {"columns", info.column_count},
            {"has_multi_column", info.has_multi_column}
        };
    }
    return result;
}

} // namespace ocr_layout
