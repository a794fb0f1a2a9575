#include "ocr_layout/reading_order.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace ocr_layout {

const char* const COLUMN_BREAK = "\n\n[Column Break]\n\n";
const char* const PAGE_BREAK = "\n\n--- Page Break ---\n\n";

std::vector<Page> group_by_page(const std::vector<TextFragment>& fragments) {
    std::map<int, std::vector<TextFragment>> by_page;
    for (const auto& fragment : fragments) {
        by_page[fragment.page].push_back(fragment);
    }

    std::vector<Page> pages;
    pages.reserve(by_page.size());
    for (auto& [page_number, page_fragments] : by_page) {
        pages.push_back(Page{page_number, std::move(page_fragments)});
    }
    return pages;
}

std::vector<Column> detect_columns(const std::vector<TextFragment>& fragments, double gap_threshold) {
    std::vector<Column> columns;
    if (fragments.empty()) {
        return columns;
    }

    Column sorted = fragments;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TextFragment& a, const TextFragment& b) {
                         return a.box.center_x() < b.box.center_x();
                     });

    Column current;
    double anchor_x = sorted.front().box.center_x();
    for (auto& fragment : sorted) {
        double x = fragment.box.center_x();
        if (!current.empty() && std::fabs(x - anchor_x) > gap_threshold) {
            columns.push_back(std::move(current));
            current.clear();
        }
        if (current.empty()) {
            anchor_x = x;
        }
        current.push_back(std::move(fragment));
    }
    columns.push_back(std::move(current));

    return columns;
}

std::string segment_paragraphs(const Column& column, double gap_threshold) {
    Column sorted = column;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TextFragment& a, const TextFragment& b) {
                         return a.box.top < b.box.top;
                     });

    std::string text;
    const TextFragment* previous = nullptr;
    for (const auto& fragment : sorted) {
        // The first fragment of a column gets no leading blank line, whatever its top
        if (previous) {
            text += '\n';
            if (fragment.box.top - previous->box.bottom > gap_threshold) {
                text += '\n';
            }
        }
        text += fragment.text;
        previous = &fragment;
    }
    return text;
}

std::string compose_page(const std::vector<Column>& columns, double paragraph_gap_threshold) {
    std::string text;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            text += COLUMN_BREAK;
        }
        text += segment_paragraphs(columns[i], paragraph_gap_threshold);
    }
    return text;
}

std::string compose_document(const std::vector<TextFragment>& fragments, const LayoutOptions& options) {
    std::string text;
    auto pages = group_by_page(fragments);

    for (size_t i = 0; i < pages.size(); ++i) {
        const auto& page = pages[i];
        auto columns = detect_columns(page.fragments, options.column_gap_threshold);

        if (options.page_observer) {
            options.page_observer(page.page_number, columns.size());
        }

        if (i > 0) {
            text += PAGE_BREAK;
        }
        text += compose_page(columns, options.paragraph_gap_threshold);
    }
    return text;
}

std::string concatenate_fragments(const std::vector<TextFragment>& fragments) {
    std::string text;
    for (size_t i = 0; i < fragments.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += fragments[i].text;
    }
    return text;
}

} // namespace ocr_layout
