#include "docsum/reduce_coordinator.h"
#include "docsum/errors.h"
#include "docsum/logging.h"
#include "docsum/thread_pool.h"
#include "docsum/token_estimator.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>

namespace docsum {

namespace {

constexpr const char* kComponent = "ReduceCoordinator";

std::string chunk_context(size_t index, size_t total) {
    if (total <= 1) {
        return "";
    }

    std::string context = "This is part " + std::to_string(index + 1) + " of " + std::to_string(total) + ". ";
    if (index == 0) {
        context += "This is the beginning of the document. ";
    } else if (index + 1 == total) {
        context += "This is the end of the document. ";
    } else {
        context += "This is a middle section of the document. ";
    }
    return context;
}

ChunkerOptions with_markdown_separators(ChunkerOptions options) {
    options.separators = ChunkerOptions::for_markdown().separators;
    return options;
}

std::string join_summaries(const ReductionRound& round) {
    std::string joined;
    for (const auto& summary : round) {
        if (!joined.empty()) {
            joined += "\n\n";
        }
        joined += summary.text;
    }
    return joined;
}

} // namespace

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "Idle";
        case PipelineState::Estimating: return "Estimating";
        case PipelineState::DirectSummarize: return "DirectSummarize";
        case PipelineState::Chunking: return "Chunking";
        case PipelineState::MapSummarizing: return "MapSummarizing";
        case PipelineState::ReduceMerging: return "ReduceMerging";
        case PipelineState::FinalSummarizing: return "FinalSummarizing";
        case PipelineState::Done: return "Done";
        case PipelineState::Failed: return "Failed";
    }
    return "Unknown";
}

class ReduceCoordinator::Impl {
public:
    Impl(ReduceOptions opts,
         std::shared_ptr<GenerationBackend> generation_backend,
         std::shared_ptr<TemplateProvider> template_provider)
        : options(std::move(opts)),
          backend(std::move(generation_backend)),
          templates(std::move(template_provider)),
          chunker(options.chunking),
          markdown_chunker(with_markdown_separators(options.chunking)),
          summarizer(backend, options.call_timeout) {
        if (!templates) {
            throw std::invalid_argument("ReduceCoordinator requires a template provider");
        }
        if (options.max_concurrency == 0) {
            throw std::invalid_argument("max_concurrency must be at least 1");
        }
        if (options.max_reduce_rounds < 0) {
            throw std::invalid_argument("max_reduce_rounds must be non-negative");
        }
    }

    // Per-invocation bookkeeping; nothing here outlives one call.
    struct Run {
        SummaryResult& stats;
        const StateCallback& on_state;
        const CancellationToken& cancellation;
    };

    std::string summarize(const std::string& text,
                          const std::string& prompt_name,
                          const TemplateVariables& variables,
                          Run& run) const {
        try {
            return run_pipeline(text, prompt_name, variables, run);
        } catch (const std::exception& e) {
            log_error(kComponent, std::string("Summarization failed: ") + e.what());
            transition(run, PipelineState::Failed);
            throw;
        }
    }

    ReduceOptions options;
    std::shared_ptr<GenerationBackend> backend;
    std::shared_ptr<TemplateProvider> templates;
    TextChunker chunker;
    TextChunker markdown_chunker;
    ChunkSummarizer summarizer;

private:
    const TextChunker& chunker_for(const std::string& text) const {
        if (options.detect_markdown && contains_markdown(text)) {
            log_debug(kComponent, "Markdown detected, using markdown separators");
            return markdown_chunker;
        }
        return chunker;
    }

    void transition(Run& run, PipelineState state) const {
        log_debug(kComponent, std::string("State -> ") + to_string(state));
        if (run.on_state) {
            run.on_state(state);
        }
    }

    std::string run_pipeline(const std::string& text,
                             const std::string& prompt_name,
                             const TemplateVariables& variables,
                             Run& run) const {
        run.stats.simulated = summarizer.simulated();
        run.cancellation.throw_if_cancelled("summarization cancelled before start");

        if (text.empty()) {
            log_warning(kComponent, "Empty text provided, nothing to summarize");
            transition(run, PipelineState::Done);
            return "";
        }

        transition(run, PipelineState::Estimating);
        int estimate = TokenEstimator::estimate(text);
        int budget = options.chunking.chunk_size;
        std::string final_template = templates->load_template(prompt_name);

        if (estimate <= budget) {
            log_info(kComponent, "Text fits in one call (~" + std::to_string(estimate) +
                     " tokens), summarizing directly");
            transition(run, PipelineState::DirectSummarize);
            run.stats.backend_calls++;
            std::string summary = summarizer.summarize(text, final_template, variables, run.cancellation);
            transition(run, PipelineState::Done);
            return summary;
        }

        log_info(kComponent, "Text is ~" + std::to_string(estimate) + " tokens, over the " +
                 std::to_string(budget) + " token budget; chunking");
        transition(run, PipelineState::Chunking);
        std::vector<std::string> chunks = chunker_for(text).split_text(text);
        run.stats.chunk_count = chunks.size();
        std::string chunk_template = templates->load_template(options.chunk_prompt);

        transition(run, PipelineState::MapSummarizing);

        // The offline backend answers every call the same way.
        if (summarizer.simulated()) {
            log_info(kComponent, "No generation backend configured, returning simulated summary");
            run.stats.backend_calls++;
            std::string summary = summarizer.summarize(
                chunks.front(), chunk_template, chunk_variables(variables, chunks.front(), 0, chunks.size()), run.cancellation);
            transition(run, PipelineState::Done);
            return summary;
        }

        ReductionRound round = map_chunks(chunks, chunk_template, variables, run);
        std::string combined = join_summaries(round);

        while (!TokenEstimator::fits(combined, budget)) {
            if (run.stats.reduce_rounds >= options.max_reduce_rounds) {
                throw SummarizeError("summaries still exceed " + std::to_string(budget) +
                                     " tokens after " + std::to_string(run.stats.reduce_rounds) +
                                     " reduce rounds");
            }
            run.stats.reduce_rounds++;

            transition(run, PipelineState::ReduceMerging);
            log_info(kComponent, "Combined summaries are ~" + std::to_string(TokenEstimator::estimate(combined)) +
                     " tokens; reduce round " + std::to_string(run.stats.reduce_rounds));

            std::vector<std::string> merged_chunks = chunker_for(combined).split_text(combined);
            round = map_chunks(merged_chunks, chunk_template, variables, run);
            combined = join_summaries(round);
        }

        transition(run, PipelineState::FinalSummarizing);
        run.stats.backend_calls++;
        std::string summary = summarizer.summarize(combined, final_template, variables, run.cancellation);
        transition(run, PipelineState::Done);
        return summary;
    }

    // The chunk text always fills {{content}}, whatever the caller passed.
    TemplateVariables chunk_variables(const TemplateVariables& variables, const std::string& chunk,
                                      size_t index, size_t total) const {
        TemplateVariables bound = variables;
        bound["content"] = chunk;
        bound["chunk_context"] = chunk_context(index, total);
        bound["chunk_num"] = std::to_string(index + 1);
        bound["total_chunks"] = std::to_string(total);
        return bound;
    }

    // One chunk-prompt call per chunk on a pool of at most max_concurrency
    // workers. The first failure cancels the remaining calls; every future is
    // drained before that failure is rethrown.
    ReductionRound map_chunks(const std::vector<std::string>& chunks,
                              const std::string& chunk_template,
                              const TemplateVariables& variables,
                              Run& run) const {
        CancellationToken pipeline = run.cancellation.child();
        std::mutex failure_mutex;
        std::exception_ptr first_failure;
        std::atomic<size_t> calls{0};

        ReductionRound round;
        round.reserve(chunks.size());

        {
            ThreadPool pool(std::min(options.max_concurrency, chunks.size()));
            std::vector<std::future<ChunkSummary>> futures;
            futures.reserve(chunks.size());

            for (size_t i = 0; i < chunks.size(); ++i) {
                futures.push_back(pool.enqueue([&, i]() -> ChunkSummary {
                    pipeline.throw_if_cancelled("chunk " + std::to_string(i + 1) + " skipped");

                    try {
                        calls++;
                        std::string text = summarizer.summarize(
                            chunks[i], chunk_template, chunk_variables(variables, chunks[i], i, chunks.size()), pipeline);
                        log_debug(kComponent, "Chunk " + std::to_string(i + 1) + "/" +
                                  std::to_string(chunks.size()) + " summarized");
                        return ChunkSummary{i, std::move(text)};
                    } catch (const CancelledError&) {
                        throw;
                    } catch (const std::exception&) {
                        {
                            std::lock_guard<std::mutex> lock(failure_mutex);
                            if (!first_failure) {
                                first_failure = std::current_exception();
                            }
                        }
                        pipeline.cancel();
                        throw;
                    }
                }));
            }

            bool cancelled = false;
            for (auto& future : futures) {
                try {
                    round.push_back(future.get());
                } catch (const CancelledError&) {
                    cancelled = true;
                } catch (const std::exception& e) {
                    log_debug(kComponent, std::string("Chunk call failed: ") + e.what());
                }
            }

            run.stats.backend_calls += calls.load();

            if (first_failure) {
                std::rethrow_exception(first_failure);
            }
            if (cancelled || run.cancellation.is_cancelled()) {
                throw CancelledError("summarization cancelled during the map step");
            }
        }

        std::stable_sort(round.begin(), round.end(),
                         [](const ChunkSummary& a, const ChunkSummary& b) { return a.index < b.index; });

        log_info(kComponent, "Summarized " + std::to_string(round.size()) + " chunks");
        return round;
    }
};

ReduceCoordinator::ReduceCoordinator(ReduceOptions options,
                                     std::shared_ptr<GenerationBackend> backend,
                                     std::shared_ptr<TemplateProvider> templates)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(backend), std::move(templates))) {
}

ReduceCoordinator::~ReduceCoordinator() = default;

std::string ReduceCoordinator::summarize(const std::string& text,
                                         const std::string& prompt_name,
                                         const TemplateVariables& variables,
                                         const CancellationToken& cancellation,
                                         const StateCallback& on_state) const {
    SummaryResult stats;
    Impl::Run run{stats, on_state, cancellation};
    return pImpl->summarize(text, prompt_name, variables, run);
}

SummaryResult ReduceCoordinator::summarize_document(const std::string& text,
                                                    const std::string& prompt_name,
                                                    const TemplateVariables& variables,
                                                    const CancellationToken& cancellation,
                                                    const StateCallback& on_state) const {
    SummaryResult result;
    Impl::Run run{result, on_state, cancellation};

    auto start = std::chrono::high_resolution_clock::now();
    try {
        result.summary = pImpl->summarize(text, prompt_name, variables, run);
    } catch (const BackendError& e) {
        result.error = e.what();
        result.retryable = e.kind() == BackendErrorKind::Timeout ||
                           e.kind() == BackendErrorKind::Network ||
                           e.kind() == BackendErrorKind::RateLimit ||
                           e.kind() == BackendErrorKind::Api;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    auto end = std::chrono::high_resolution_clock::now();
    result.processing_time_ms = std::chrono::duration<double, std::milli>(end - start).count();

    return result;
}

const ReduceOptions& ReduceCoordinator::options() const {
    return pImpl->options;
}

} // namespace docsum
