#include "ocr_layout/layout_reconstructor.h"
#include "ocr_layout/fragment_parser.h"
#include "ocr_layout/reading_order.h"
#include "ocr_layout/thread_pool.h"
#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <set>

namespace ocr_layout {

class LayoutReconstructor::Impl {
public:
    explicit Impl(const LayoutOptions& options)
        : options_(options),
          classifier_(FontSizeClassifier::from_options(options)) {
        validate_layout_options(options_);
    }

    ReconstructionResult reconstruct(const nlohmann::json& records) {
        return reconstruct(parse(records));
    }

    ReconstructionResult reconstruct(const std::vector<TextFragment>& fragments) {
        auto start_time = std::chrono::high_resolution_clock::now();

        ReconstructionResult result;
        result.fragment_count = fragments.size();

        if (fragments.empty()) {
            warn("reconstruct", "No valid text fragments to reconstruct");
            record(result);
            return result;
        }

        info("reconstruct", "Reconstructing layout from " + std::to_string(fragments.size()) + " fragments");

        std::set<int> page_numbers;
        for (const auto& fragment : fragments) {
            page_numbers.insert(fragment.page);
        }
        result.page_count = page_numbers.size();

        // The only place where a layout failure is allowed to degrade
        try {
            result.text = compose_document(fragments, options_);
        } catch (const std::exception& e) {
            warn("reconstruct", std::string("Layout reconstruction failed, using simple concatenation: ") + e.what());
            result.text = concatenate_fragments(fragments);
            result.used_fallback = true;
            result.error = e.what();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        result.processing_time_ms =
            std::chrono::duration<double, std::milli>(end_time - start_time).count();

        info("reconstruct", "Layout reconstruction complete (" + std::to_string(result.page_count) +
                            " pages, " + std::to_string(result.text.size()) + " characters)");
        record(result);
        return result;
    }

    std::vector<FontClassification> classify(const std::vector<TextFragment>& fragments) const {
        return classifier_.classify_all(fragments);
    }

    DocumentLayout analyze(const nlohmann::json& records) {
        DocumentLayout layout;
        layout.fragments = parse(records);
        layout.reconstruction = reconstruct(layout.fragments);
        layout.classifications = classify(layout.fragments);
        layout.structure = extract_structure(layout.fragments, options_.column_gap_threshold);

        info("analyze", "Structure metadata: " + std::to_string(layout.structure.total_pages) +
                        " pages, " + std::to_string(layout.structure.total_chunks) + " total chunks");
        return layout;
    }

    std::vector<DocumentLayout> analyze_batch(const std::vector<nlohmann::json>& documents,
                                              ProgressCallback progress) {
        std::vector<DocumentLayout> results(documents.size());
        if (documents.empty()) {
            return results;
        }

        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!pool_) {
                pool_ = std::make_unique<ThreadPool>(options_.thread_count);
            }
        }

        std::mutex progress_mutex;
        size_t completed = 0;
        std::vector<std::future<void>> futures;
        futures.reserve(documents.size());

        for (size_t i = 0; i < documents.size(); ++i) {
            futures.push_back(pool_->submit([this, i, &documents, &results, &progress,
                                             &progress_mutex, &completed]() {
                results[i] = analyze(documents[i]);

                std::lock_guard<std::mutex> lock(progress_mutex);
                completed++;
                if (progress) {
                    progress(completed, documents.size());
                }
            }));
        }

        // Every task references this frame, so all of them must finish before any rethrow.
        std::exception_ptr first_error;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return results;
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);

        nlohmann::json stats;
        stats["documents_processed"] = documents_processed_;
        stats["fragments_processed"] = fragments_processed_;
        stats["pages_processed"] = pages_processed_;
        stats["fallbacks"] = fallbacks_;
        stats["total_processing_time_ms"] = total_time_ms_;

        if (documents_processed_ > 0) {
            stats["average_processing_time_ms"] = total_time_ms_ / static_cast<double>(documents_processed_);
        }
        return stats;
    }

    const LayoutOptions& options() const { return options_; }

private:
    std::vector<TextFragment> parse(const nlohmann::json& records) {
        ParseReport report;
        auto fragments = FragmentParser::parse(records, &report);

        if (!records.is_array() && !records.is_null()) {
            warn("parse", "Expected a JSON array of OCR records");
        }
        if (report.missing_grounding > 0) {
            warn("parse", std::to_string(report.missing_grounding) +
                          " records missing grounding data, using defaults");
        }
        info("parse", "Parsed " + std::to_string(fragments.size()) + " valid fragments from " +
                      std::to_string(report.total_records) + " records");
        return fragments;
    }

    void record(const ReconstructionResult& result) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        documents_processed_++;
        fragments_processed_ += result.fragment_count;
        pages_processed_ += result.page_count;
        if (result.used_fallback) {
            fallbacks_++;
        }
        total_time_ms_ += result.processing_time_ms;
    }

    void info(const char* function, const std::string& message) const {
        if (options_.verbose && !options_.quiet) {
            std::cout << "[LayoutReconstructor::" << function << "] " << message << std::endl;
        }
    }

    void warn(const char* function, const std::string& message) const {
        if (!options_.quiet) {
            std::cerr << "[LayoutReconstructor::" << function << "] WARNING: " << message << std::endl;
        }
    }

    LayoutOptions options_;
    FontSizeClassifier classifier_;

    std::mutex pool_mutex_;
    std::unique_ptr<ThreadPool> pool_;

    mutable std::mutex stats_mutex_;
    size_t documents_processed_ = 0;
    size_t fragments_processed_ = 0;
    size_t pages_processed_ = 0;
    size_t fallbacks_ = 0;
    double total_time_ms_ = 0.0;
};

LayoutReconstructor::LayoutReconstructor(const LayoutOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

LayoutReconstructor::~LayoutReconstructor() = default;

ReconstructionResult LayoutReconstructor::reconstruct(const nlohmann::json& records) {
    return pImpl->reconstruct(records);
}

ReconstructionResult LayoutReconstructor::reconstruct(const std::vector<TextFragment>& fragments) {
    return pImpl->reconstruct(fragments);
}

std::vector<FontClassification> LayoutReconstructor::classify(const std::vector<TextFragment>& fragments) const {
    return pImpl->classify(fragments);
}

DocumentLayout LayoutReconstructor::analyze(const nlohmann::json& records) {
    return pImpl->analyze(records);
}

std::vector<DocumentLayout> LayoutReconstructor::analyze_batch(const std::vector<nlohmann::json>& documents,
                                                               ProgressCallback progress) {
    return pImpl->analyze_batch(documents, progress);
}

nlohmann::json LayoutReconstructor::get_stats() const {
    return pImpl->get_stats();
}

const LayoutOptions& LayoutReconstructor::options() const {
    return pImpl->options();
}

double suggest_batch_calibration_factor(const std::vector<DocumentLayout>& layouts,
                                        double expected_body_pt, bool quiet) {
    std::vector<TextFragment> pooled;
    for (const auto& layout : layouts) {
        pooled.insert(pooled.end(), layout.fragments.begin(), layout.fragments.end());
    }
    return suggest_calibration_factor(pooled, expected_body_pt, quiet);
}

} // namespace ocr_layout
