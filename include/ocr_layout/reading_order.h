#pragma once

#include "ocr_layout/geometry.h"
#include "ocr_layout/layout_options.h"
#include <string>
#include <vector>

namespace ocr_layout {

extern const char* const COLUMN_BREAK;
extern const char* const PAGE_BREAK;

// Partition fragments by page number, pages ascending, input order kept per page
std::vector<Page> group_by_page(const std::vector<TextFragment>& fragments);

// Single-pass 1-D clustering on center_x. Each fragment is compared with the
// first fragment of the current column, never with its neighbour.
std::vector<Column> detect_columns(const std::vector<TextFragment>& fragments,
                                   double gap_threshold = COLUMN_GAP_THRESHOLD);

// Top-to-bottom text of one column with blank lines on paragraph gaps
std::string segment_paragraphs(const Column& column,
                               double gap_threshold = PARAGRAPH_GAP_THRESHOLD);

std::string compose_page(const std::vector<Column>& columns,
                         double paragraph_gap_threshold = PARAGRAPH_GAP_THRESHOLD);

// Full reading-order stream. page_observer may be empty.
std::string compose_document(const std::vector<TextFragment>& fragments,
                             const LayoutOptions& options = LayoutOptions{});

// Plain concatenation in input order, no markers
std::string concatenate_fragments(const std::vector<TextFragment>& fragments);

} // namespace ocr_layout
