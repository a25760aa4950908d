#include "docsum/chunk_summarizer.h"
#include "docsum/errors.h"
#include "docsum/logging.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace docsum {

namespace {

constexpr const char* kComponent = "ChunkSummarizer";

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

ChunkSummarizer::ChunkSummarizer(std::shared_ptr<GenerationBackend> backend,
                                 std::chrono::milliseconds call_timeout)
    : backend_(std::move(backend)), call_timeout_(call_timeout) {
    if (!backend_) {
        throw std::invalid_argument("ChunkSummarizer requires a generation backend");
    }
    if (call_timeout_.count() <= 0) {
        throw std::invalid_argument("call timeout must be positive");
    }
}

std::string ChunkSummarizer::build_prompt(const std::string& text,
                                          const std::string& prompt_template,
                                          const TemplateVariables& variables) const {
    TemplateVariables bound = variables;
    bound.emplace("content", text);

    std::string prompt = substitute_variables(prompt_template, bound);
    if (!has_placeholder(prompt_template, "content")) {
        prompt += "\n\n" + text;
    }
    return prompt;
}

std::string ChunkSummarizer::summarize(const std::string& text,
                                       const std::string& prompt_template,
                                       const TemplateVariables& variables,
                                       const CancellationToken& cancellation) const {
    cancellation.throw_if_cancelled("summarization cancelled before the call");

    GenerationRequest request;
    request.prompt = build_prompt(text, prompt_template, variables);
    request.timeout = call_timeout_;

    log_debug(kComponent, "Calling " + backend_->name() + " with a prompt of " +
              std::to_string(request.prompt.size()) + " chars");

    auto start = std::chrono::steady_clock::now();
    std::string reply;
    try {
        reply = backend_->generate(request, cancellation);
    } catch (const SummarizeError&) {
        throw;
    } catch (const std::exception& e) {
        throw BackendError(BackendErrorKind::Api, e.what());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    cancellation.throw_if_cancelled("summarization cancelled during the call");

    if (elapsed > call_timeout_) {
        throw BackendError(BackendErrorKind::Timeout,
                           "call took " + std::to_string(elapsed.count()) + " ms, limit is " +
                           std::to_string(call_timeout_.count()) + " ms");
    }

    if (is_blank(reply)) {
        throw BackendError(BackendErrorKind::InvalidResponse, backend_->name() + " returned an empty reply");
    }

    return reply;
}

} // namespace docsum
