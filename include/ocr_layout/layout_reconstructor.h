#pragma once

#include "ocr_layout/geometry.h"
#include "ocr_layout/layout_options.h"
#include "ocr_layout/font_size_classifier.h"
#include "ocr_layout/structure_metadata.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

namespace ocr_layout {

struct ReconstructionResult {
    std::string text;
    size_t page_count = 0;
    size_t fragment_count = 0;
    bool used_fallback = false;
    std::string error;  // Empty unless the fallback was used
    double processing_time_ms = 0.0;
};

// Everything one run produces for a document
struct DocumentLayout {
    std::vector<TextFragment> fragments;
    ReconstructionResult reconstruction;
    std::vector<FontClassification> classifications;
    StructureMetadata structure;
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;

class LayoutReconstructor {
public:
    explicit LayoutReconstructor(const LayoutOptions& options = LayoutOptions{});
    ~LayoutReconstructor();

    // Reading-order text. Never throws: internal failures degrade to plain
    // concatenation and are reported through used_fallback/error.
    ReconstructionResult reconstruct(const nlohmann::json& records);
    ReconstructionResult reconstruct(const std::vector<TextFragment>& fragments);

    std::vector<FontClassification> classify(const std::vector<TextFragment>& fragments) const;

    // Parse, reconstruct, classify and summarize one document
    DocumentLayout analyze(const nlohmann::json& records);

    // One task per document on the thread pool, results in input order
    std::vector<DocumentLayout> analyze_batch(const std::vector<nlohmann::json>& documents,
                                              ProgressCallback progress = nullptr);

    nlohmann::json get_stats() const;

    const LayoutOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Calibration suggested by the fragments of every layout pooled together
double suggest_batch_calibration_factor(const std::vector<DocumentLayout>& layouts,
                                        double expected_body_pt = DEFAULT_BASE_FONT_SIZE,
                                        bool quiet = false);

} // namespace ocr_layout
