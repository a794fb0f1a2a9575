#include "ocr_layout/report_serializer.h"
#include <algorithm>
#include <cstdint>
#include <string>

namespace ocr_layout {

std::string ReportSerializer::to_json(const DocumentLayout& layout, bool pretty) {
    JsonBuilder builder;
    auto& allocator = builder.allocator();

    JsonValue text = builder.make_string(layout.reconstruction.text);
    builder.add("text", text);

    JsonValue used_fallback(layout.reconstruction.used_fallback);
    builder.add("used_fallback", used_fallback);

    if (!layout.reconstruction.error.empty()) {
        JsonValue error = builder.make_string(layout.reconstruction.error);
        builder.add("error", error);
    }

    JsonValue structure = structure_to_json(layout.structure, allocator);
    builder.add("structure", structure);

    JsonValue fragments(rapidjson::kArrayType);
    size_t count = std::min(layout.fragments.size(), layout.classifications.size());
    fragments.Reserve(static_cast<rapidjson::SizeType>(count), allocator);
    for (size_t i = 0; i < count; ++i) {
        JsonValue item = fragment_to_json(layout.fragments[i], layout.classifications[i], allocator);
        fragments.PushBack(item, allocator);
    }
    builder.add("fragments", fragments);

    return builder.serialize(pretty);
}

JsonValue ReportSerializer::structure_to_json(const StructureMetadata& structure, JsonAllocator& allocator) {
    JsonValue result(rapidjson::kObjectType);
    result.AddMember("total_pages", static_cast<uint64_t>(structure.total_pages), allocator);
    result.AddMember("total_chunks", static_cast<uint64_t>(structure.total_chunks), allocator);

    JsonValue pages(rapidjson::kObjectType);
    for (const auto& [page_number, info] : structure.pages) {
        JsonValue page(rapidjson::kObjectType);
        page.AddMember("chunks", static_cast<uint64_t>(info.chunk_count), allocator);
        page.AddMember("columns", static_cast<uint64_t>(info.column_count), allocator);
        page.AddMember("has_multi_column", info.has_multi_column, allocator);

        std::string key_text = std::to_string(page_number);
        JsonValue key;
        key.SetString(key_text.c_str(), static_cast<rapidjson::SizeType>(key_text.size()), allocator);
        pages.AddMember(key, page, allocator);
    }
    result.AddMember("pages", pages, allocator);

    return result;
}

JsonValue ReportSerializer::fragment_to_json(const TextFragment& fragment,
                                             const FontClassification& font,
                                             JsonAllocator& allocator) {
    JsonValue item(rapidjson::kObjectType);

    JsonValue text;
    text.SetString(fragment.text.c_str(), static_cast<rapidjson::SizeType>(fragment.text.size()), allocator);
    item.AddMember("text", text, allocator);
    item.AddMember("page", fragment.page, allocator);

    JsonValue box(rapidjson::kObjectType);
    box.AddMember("left", fragment.box.left, allocator);
    box.AddMember("top", fragment.box.top, allocator);
    box.AddMember("right", fragment.box.right, allocator);
    box.AddMember("bottom", fragment.box.bottom, allocator);
    item.AddMember("box", box, allocator);

    item.AddMember("font_size", font.font_size, allocator);
    item.AddMember("text_type", rapidjson::StringRef(text_type_name(font.text_type)), allocator);

    return item;
}

} // namespace ocr_layout
