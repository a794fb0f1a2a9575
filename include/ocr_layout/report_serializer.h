#pragma once

#include "ocr_layout/layout_reconstructor.h"
#include "ocr_layout/json_types.h"
#include <string>

namespace ocr_layout {

class ReportSerializer {
public:
    // Diagnostic report of one run: text, structure and per-fragment fonts
    static std::string to_json(const DocumentLayout& layout, bool pretty = false);

    static JsonValue structure_to_json(const StructureMetadata& structure, JsonAllocator& allocator);

private:
    static JsonValue fragment_to_json(const TextFragment& fragment,
                                      const FontClassification& font,
                                      JsonAllocator& allocator);
};

} // namespace ocr_layout
