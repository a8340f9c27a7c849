#include <benchmark/benchmark.h>
#include <pdf_outliner/json_serializer.h>
#include <pdf_outliner/outline_extractor.h>
#include "test_helpers.h"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Real documents are optional; the synthetic benchmarks always run
const std::string TEST_PDF_SMALL = "test_data/small.pdf";  // ~10 pages

// Numbered report with three heading levels on every page
static pdf_outliner::DocumentContent synthetic_document(int pages) {
    pdf_outliner::test::DocumentBuilder builder;
    builder.page().line("Synthetic Benchmark Report", 24.0f, true).body(8);

    for (int p = 1; p <= pages; ++p) {
        builder.page()
            .line(std::to_string(p) + ". Chapter " + std::to_string(p), 18.0f, true).body(6)
            .heading(std::to_string(p) + ".1 Section", 14.0f).body(10)
            .heading(std::to_string(p) + ".1.1 Detail", 12.0f).body(12);
    }
    return builder.build();
}

static void BM_HeuristicOutline(benchmark::State& state) {
    auto content = synthetic_document(static_cast<int>(state.range(0)));

    pdf_outliner::ExtractOptions options;
    options.quiet = true;
    pdf_outliner::OutlineExtractor extractor(options);

    size_t headings = 0;
    for (auto _ : state) {
        auto outline = extractor.build_outline(content);
        headings = outline.size();
        benchmark::DoNotOptimize(outline);
    }

    state.counters["headings"] = static_cast<double>(headings);
    state.counters["pages_per_second"] = benchmark::Counter(
        static_cast<double>(state.iterations() * content.page_count), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_HeuristicOutline)->Arg(10)->Arg(50)->Arg(200);

static void BM_NativeOutline(benchmark::State& state) {
    auto content = synthetic_document(50);
    for (int i = 1; i <= state.range(0); ++i) {
        content.native_outline.push_back({1 + i % 3, "Part " + std::to_string(i), 1 + i % 50});
    }

    pdf_outliner::ExtractOptions options;
    options.quiet = true;
    pdf_outliner::OutlineExtractor extractor(options);

    for (auto _ : state) {
        auto outline = extractor.build_outline(content);
        benchmark::DoNotOptimize(outline);
    }
}
BENCHMARK(BM_NativeOutline)->Arg(10)->Arg(500);

static void BM_JsonSerialization(benchmark::State& state) {
    pdf_outliner::ExtractOptions options;
    options.quiet = true;
    pdf_outliner::OutlineExtractor extractor(options);
    auto outline = extractor.build_outline(synthetic_document(static_cast<int>(state.range(0))));

    pdf_outliner::SerializeOptions serialize_options;
    serialize_options.pretty = state.range(1) != 0;

    for (auto _ : state) {
        auto json = pdf_outliner::JsonSerializer::serialize(outline, serialize_options);
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_JsonSerialization)->Args({50, 1})->Args({50, 0})->Args({500, 1});

static void BM_BatchProcessing(benchmark::State& state) {
    if (!fs::exists(TEST_PDF_SMALL)) {
        state.SkipWithError("Test PDF not found");
        return;
    }

    std::vector<std::string> test_files(static_cast<size_t>(state.range(1)), TEST_PDF_SMALL);

    pdf_outliner::ExtractOptions options;
    options.thread_count = static_cast<size_t>(state.range(0));
    options.quiet = true;
    pdf_outliner::OutlineExtractor extractor(options);

    for (auto _ : state) {
        auto results = extractor.process_batch(test_files);
        benchmark::DoNotOptimize(results);
    }

    auto stats = extractor.get_stats();
    state.counters["documents"] = static_cast<double>(test_files.size());
    state.counters["pages_processed"] = stats["pages_processed"].get<double>();
}
BENCHMARK(BM_BatchProcessing)->Ranges({{1, 8}, {1, 10}});

BENCHMARK_MAIN();
