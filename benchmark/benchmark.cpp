#include <benchmark/benchmark.h>
#include <docsum/reduce_coordinator.h>
#include <docsum/text_chunker.h>
#include <docsum/token_estimator.h>

#include <string>

namespace {

// Markdown-ish document: headings, paragraphs and the odd list.
std::string generate_document(int sections) {
    std::string content;
    for (int i = 1; i <= sections; ++i) {
        content += "## Section " + std::to_string(i) + "\n\n";
        for (int k = 1; k <= 5; ++k) {
            content += "This is paragraph " + std::to_string(k) + " of section " + std::to_string(i) + ". ";
            content += "It contains some sample text to exercise the chunking algorithm. ";
            content += "The text should be long enough to have meaningful token counts.\n\n";
        }
        if (i % 4 == 0) {
            content += "- first point\n- second point\n- third point\n\n";
        }
    }
    return content;
}

} // namespace

static void BM_TokenEstimate(benchmark::State& state) {
    std::string text = generate_document(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        int tokens = docsum::TokenEstimator::estimate(text);
        benchmark::DoNotOptimize(tokens);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_TokenEstimate)->Range(8, 512);

static void BM_ChunkProse(benchmark::State& state) {
    std::string text = generate_document(static_cast<int>(state.range(0)));

    docsum::ChunkerOptions options;
    options.chunk_size = 500;
    options.chunk_overlap = 50;
    docsum::TextChunker chunker(options);

    size_t chunk_count = 0;
    for (auto _ : state) {
        auto chunks = chunker.split_chunks(text);
        chunk_count = chunks.size();
        benchmark::DoNotOptimize(chunks);
    }

    state.counters["chunks"] = static_cast<double>(chunk_count);
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ChunkProse)->Range(8, 512);

static void BM_ChunkMarkdown(benchmark::State& state) {
    std::string text = generate_document(static_cast<int>(state.range(0)));
    docsum::TextChunker chunker(docsum::ChunkerOptions::for_markdown(500, 50));

    for (auto _ : state) {
        auto chunks = chunker.split_chunks(text);
        benchmark::DoNotOptimize(chunks);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ChunkMarkdown)->Range(8, 512);

static void BM_SimulatedPipeline(benchmark::State& state) {
    std::string text = generate_document(static_cast<int>(state.range(0)));

    docsum::ReduceOptions options;
    options.chunking.chunk_size = 500;
    options.chunking.chunk_overlap = 50;
    options.max_concurrency = static_cast<size_t>(state.range(1));
    docsum::ReduceCoordinator coordinator(options, std::make_shared<docsum::SimulatedBackend>());

    for (auto _ : state) {
        auto summary = coordinator.summarize(text);
        benchmark::DoNotOptimize(summary);
    }
}
BENCHMARK(BM_SimulatedPipeline)->Ranges({{8, 256}, {1, 8}});

BENCHMARK_MAIN();
