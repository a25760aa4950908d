#include "docsum/batch_summarizer.h"
#include "docsum/logging.h"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace docsum {

namespace {

constexpr const char* kComponent = "BatchSummarizer";

} // namespace

BatchSummarizer::BatchSummarizer(const ReduceCoordinator& coordinator, BatchOptions options)
    : coordinator_(coordinator), options_(std::move(options)) {
    if (options_.max_attempts < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
}

BatchResult BatchSummarizer::run(const std::vector<Document>& documents,
                                 ProgressCallback progress,
                                 const CancellationToken& cancellation) const {
    BatchResult batch;
    batch.outcomes.reserve(documents.size());

    auto start = std::chrono::high_resolution_clock::now();
    log_info(kComponent, "Summarizing " + std::to_string(documents.size()) + " documents");

    for (size_t i = 0; i < documents.size(); ++i) {
        const Document& document = documents[i];

        DocumentOutcome outcome;
        outcome.id = document.id;

        while (true) {
            outcome.attempts++;
            outcome.result = coordinator_.summarize_document(
                document.text, options_.prompt_name, document.variables, cancellation);

            if (outcome.result.success() || !outcome.result.retryable ||
                outcome.attempts >= options_.max_attempts || cancellation.is_cancelled()) {
                break;
            }

            log_warning(kComponent, document.id + ": attempt " + std::to_string(outcome.attempts) +
                        " failed (" + outcome.result.error + "), retrying");
            if (options_.retry_delay.count() > 0) {
                std::this_thread::sleep_for(options_.retry_delay);
            }
        }

        if (outcome.result.success()) {
            batch.succeeded++;
        } else {
            batch.failed++;
            log_error(kComponent, "Error processing " + document.id + ": " + outcome.result.error);
        }
        batch.outcomes.push_back(std::move(outcome));

        if (progress) {
            progress(i + 1, documents.size());
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    batch.processing_time_ms = std::chrono::duration<double, std::milli>(end - start).count();

    log_info(kComponent, "Batch finished: " + std::to_string(batch.succeeded) + " succeeded, " +
             std::to_string(batch.failed) + " failed");
    return batch;
}

} // namespace docsum
