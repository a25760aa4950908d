#pragma once

#include <docsum/generation_backend.h>
#include <docsum/prompt_templates.h>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace docsum {
namespace testing {

// Backend whose replies come from a test-supplied function. Records every
// prompt and the peak number of concurrent calls.
class FakeBackend : public GenerationBackend {
public:
    using Responder = std::function<std::string(const std::string& prompt, const CancellationToken& token)>;

    explicit FakeBackend(Responder responder) : responder_(std::move(responder)) {}

    std::string generate(const GenerationRequest& request,
                         const CancellationToken& cancellation) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.push_back(request.prompt);
        }
        size_t now = ++in_flight_;
        size_t peak = peak_in_flight_.load();
        while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {
        }

        struct Leave {
            std::atomic<size_t>& counter;
            ~Leave() { --counter; }
        } leave{in_flight_};

        return responder_(request.prompt, cancellation);
    }

    std::string name() const override { return "fake"; }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_.size();
    }

    size_t peak_in_flight() const { return peak_in_flight_.load(); }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::vector<std::string> prompts_;
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

// Fixed templates keyed by name, so tests can recognise each kind of call.
class MapTemplateProvider : public TemplateProvider {
public:
    explicit MapTemplateProvider(std::map<std::string, std::string> templates)
        : templates_(std::move(templates)) {}

    std::string load_template(const std::string& name) const override {
        auto it = templates_.find(name);
        return it != templates_.end() ? it->second : default_template(name);
    }

private:
    std::map<std::string, std::string> templates_;
};

// Words of four or more letters so every word weighs a full unit and no line
// looks like a list item or heading.
inline std::string make_words(size_t count, const std::string& word = "lorem") {
    std::string text;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) text += ' ';
        text += word;
    }
    return text;
}

} // namespace testing
} // namespace docsum
