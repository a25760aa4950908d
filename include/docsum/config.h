#pragma once

#include "docsum/generation_backend.h"
#include "docsum/http_backend.h"
#include "docsum/logging.h"
#include "docsum/prompt_templates.h"
#include "docsum/reduce_coordinator.h"
#include "docsum/text_chunker.h"

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace docsum {

struct BackendConfig {
    std::string type = "none";  // "none" or "openai"
    std::string api_key_env = "OPENAI_API_KEY";
    OpenAiOptions openai;
};

// Everything the command-line tool needs, loadable from a JSON file.
// Missing keys keep their defaults; invalid values throw std::invalid_argument.
struct Config {
    std::string preset = "auto";
    ReduceOptions reduce;
    BackendConfig backend;
    std::string prompts_dir;
    LogLevel log_level = LogLevel::Info;

    static Config from_json(const nlohmann::json& json);
    static Config from_file(const std::string& path);

    nlohmann::json to_json() const;
};

// "auto", "prose", "markdown" or "code". "auto" starts from the prose
// separators; ReduceOptions::detect_markdown switches per document.
ChunkerOptions chunker_options_for_preset(const std::string& preset, int chunk_size, int chunk_overlap);

// Simulated backend for type "none" or when the API key variable is unset.
std::shared_ptr<GenerationBackend> make_backend(const BackendConfig& config);

std::shared_ptr<TemplateProvider> make_template_provider(const Config& config);

} // namespace docsum
