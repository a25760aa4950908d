#pragma once

#include "docsum/cancellation.h"
#include "docsum/prompt_templates.h"
#include "docsum/reduce_coordinator.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace docsum {

struct Document {
    std::string id;
    std::string text;
    TemplateVariables variables;
};

struct BatchOptions {
    std::string prompt_name = kFinalSummaryPrompt;
    int max_attempts = 1;
    std::chrono::milliseconds retry_delay{0};
};

struct DocumentOutcome {
    std::string id;
    SummaryResult result;
    int attempts = 0;
};

struct BatchResult {
    std::vector<DocumentOutcome> outcomes;
    size_t succeeded = 0;
    size_t failed = 0;
    double processing_time_ms = 0;
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;

// Summarizes documents one after another, retrying transient backend failures
// up to max_attempts. Outcomes are returned in input order.
class BatchSummarizer {
public:
    BatchSummarizer(const ReduceCoordinator& coordinator, BatchOptions options = BatchOptions{});

    BatchResult run(const std::vector<Document>& documents,
                    ProgressCallback progress = nullptr,
                    const CancellationToken& cancellation = CancellationToken{}) const;

private:
    const ReduceCoordinator& coordinator_;
    BatchOptions options_;
};

} // namespace docsum
