#pragma once

#include "docsum/cancellation.h"
#include "docsum/generation_backend.h"
#include "docsum/prompt_templates.h"

#include <chrono>
#include <memory>
#include <string>

namespace docsum {

/**
 * One generation call for one unit of text.
 *
 * The template's placeholders are filled from the variables, with "content"
 * bound to the text unless the caller supplies it. A template without a
 * {{content}} placeholder gets the text appended after a blank line.
 *
 * Throws BackendError when the backend fails, returns nothing, or answers only
 * after the timeout elapsed, and CancelledError when cancelled.
 */
class ChunkSummarizer {
public:
    explicit ChunkSummarizer(std::shared_ptr<GenerationBackend> backend,
                             std::chrono::milliseconds call_timeout = std::chrono::milliseconds(120000));

    std::string summarize(const std::string& text,
                          const std::string& prompt_template,
                          const TemplateVariables& variables,
                          const CancellationToken& cancellation = CancellationToken{}) const;

    std::string build_prompt(const std::string& text,
                             const std::string& prompt_template,
                             const TemplateVariables& variables) const;

    bool simulated() const { return backend_->simulated(); }

    std::chrono::milliseconds call_timeout() const { return call_timeout_; }

private:
    std::shared_ptr<GenerationBackend> backend_;
    std::chrono::milliseconds call_timeout_;
};

} // namespace docsum
