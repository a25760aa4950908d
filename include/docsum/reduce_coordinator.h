#pragma once

#include "docsum/cancellation.h"
#include "docsum/chunk_summarizer.h"
#include "docsum/generation_backend.h"
#include "docsum/prompt_templates.h"
#include "docsum/text_chunker.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace docsum {

enum class PipelineState {
    Idle,
    Estimating,
    DirectSummarize,
    Chunking,
    MapSummarizing,
    ReduceMerging,
    FinalSummarizing,
    Done,
    Failed
};

const char* to_string(PipelineState state);

using StateCallback = std::function<void(PipelineState)>;

struct ReduceOptions {
    ChunkerOptions chunking;
    size_t max_concurrency = 4;
    std::chrono::milliseconds call_timeout{120000};
    int max_reduce_rounds = 8;
    std::string chunk_prompt = kChunkSummaryPrompt;
    // Split text that contains_markdown() with the markdown separators
    // instead of chunking.separators.
    bool detect_markdown = false;
};

// Output of one chunk's map call, tagged with the chunk's position.
struct ChunkSummary {
    size_t index = 0;
    std::string text;
};

using ReductionRound = std::vector<ChunkSummary>;

struct SummaryResult {
    std::string summary;
    size_t chunk_count = 0;     // chunks in the first map round
    int reduce_rounds = 0;      // re-chunk passes after the first map round
    size_t backend_calls = 0;
    bool simulated = false;
    double processing_time_ms = 0;
    std::string error;          // empty on success
    bool retryable = false;     // error came from a transient backend failure

    bool success() const { return error.empty(); }
};

/**
 * Map-reduce summarization of a whole document.
 *
 * Text that fits one call goes straight to the final prompt. Larger text is
 * chunked, each chunk is summarized with the chunk prompt on a bounded worker
 * pool, and the summaries (always in chunk order) are joined and re-chunked
 * until they fit, after which one final-prompt call produces the result.
 *
 * The first failed call cancels the rest of the pipeline and its error is
 * rethrown; nothing partial is ever returned. With a simulated backend the
 * first call's sentinel is returned without further calls.
 *
 * Throws std::invalid_argument from the constructor for invalid options.
 */
class ReduceCoordinator {
public:
    ReduceCoordinator(ReduceOptions options,
                      std::shared_ptr<GenerationBackend> backend,
                      std::shared_ptr<TemplateProvider> templates = std::make_shared<DefaultTemplateProvider>());
    ~ReduceCoordinator();

    ReduceCoordinator(const ReduceCoordinator&) = delete;
    ReduceCoordinator& operator=(const ReduceCoordinator&) = delete;

    std::string summarize(const std::string& text,
                          const std::string& prompt_name = kFinalSummaryPrompt,
                          const TemplateVariables& variables = {},
                          const CancellationToken& cancellation = CancellationToken{},
                          const StateCallback& on_state = nullptr) const;

    // Same pipeline; failures are reported in SummaryResult::error instead of thrown.
    SummaryResult summarize_document(const std::string& text,
                                     const std::string& prompt_name = kFinalSummaryPrompt,
                                     const TemplateVariables& variables = {},
                                     const CancellationToken& cancellation = CancellationToken{},
                                     const StateCallback& on_state = nullptr) const;

    const ReduceOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace docsum
