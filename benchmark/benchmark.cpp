#include <benchmark/benchmark.h>
#include <ocr_layout/layout_reconstructor.h>
#include <ocr_layout/fragment_parser.h>
#include <ocr_layout/reading_order.h>
#include <ocr_layout/report_serializer.h>
#include <algorithm>
#include <random>
#include <string>

namespace {

// Two-column pages with a full-width heading, shuffled so the input order
// carries no layout information
nlohmann::json make_document(int pages, int fragments_per_page, unsigned seed = 42) {
    std::mt19937 rng(seed);
    nlohmann::json records = nlohmann::json::array();

    for (int page = 0; page < pages; ++page) {
        records.push_back({
            {"text", "Heading of page " + std::to_string(page)},
            {"grounding", {{"page", page},
                           {"box", {{"left", 0.1}, {"top", 0.02}, {"right", 0.6}, {"bottom", 0.07}}}}}
        });
        for (int i = 0; i < fragments_per_page; ++i) {
            bool right = (i % 2) == 1;
            double left = right ? 0.55 : 0.05;
            double top = 0.1 + 0.85 * (i / 2) / (fragments_per_page / 2 + 1);
            records.push_back({
                {"text", "Fragment " + std::to_string(i) + " on page " + std::to_string(page)},
                {"grounding", {{"page", page},
                               {"box", {{"left", left}, {"top", top},
                                        {"right", left + 0.4}, {"bottom", top + 0.025}}}}}
            });
        }
    }

    std::vector<nlohmann::json> shuffled(records.begin(), records.end());
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    return nlohmann::json(shuffled);
}

} // namespace

static void BM_ParseFragments(benchmark::State& state) {
    auto document = make_document(static_cast<int>(state.range(0)), 40);

    for (auto _ : state) {
        auto fragments = ocr_layout::FragmentParser::parse(document);
        benchmark::DoNotOptimize(fragments);
    }
    state.SetItemsProcessed(state.iterations() * document.size());
}
BENCHMARK(BM_ParseFragments)->Range(1, 64);

static void BM_ComposeDocument(benchmark::State& state) {
    auto fragments = ocr_layout::FragmentParser::parse(
        make_document(static_cast<int>(state.range(0)), static_cast<int>(state.range(1))));

    for (auto _ : state) {
        auto text = ocr_layout::compose_document(fragments);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * fragments.size());
}
BENCHMARK(BM_ComposeDocument)->Ranges({{1, 64}, {10, 400}});

static void BM_AnalyzeAndSerialize(benchmark::State& state) {
    ocr_layout::LayoutOptions options;
    options.quiet = true;
    ocr_layout::LayoutReconstructor reconstructor(options);
    auto document = make_document(static_cast<int>(state.range(0)), 60);

    for (auto _ : state) {
        auto layout = reconstructor.analyze(document);
        auto report = ocr_layout::ReportSerializer::to_json(layout);
        benchmark::DoNotOptimize(report);
    }
    state.counters["fragments"] = static_cast<double>(document.size());
}
BENCHMARK(BM_AnalyzeAndSerialize)->Range(1, 32);

static void BM_BatchProcessing(benchmark::State& state) {
    ocr_layout::LayoutOptions options;
    options.quiet = true;
    options.thread_count = static_cast<size_t>(state.range(0));
    ocr_layout::LayoutReconstructor reconstructor(options);

    std::vector<nlohmann::json> documents;
    for (int i = 0; i < state.range(1); ++i) {
        documents.push_back(make_document(8, 60, static_cast<unsigned>(i)));
    }

    for (auto _ : state) {
        auto results = reconstructor.analyze_batch(documents);
        benchmark::DoNotOptimize(results);
    }
    state.counters["documents"] = static_cast<double>(documents.size());
}
BENCHMARK(BM_BatchProcessing)->Ranges({{1, 8}, {4, 32}});

BENCHMARK_MAIN();
