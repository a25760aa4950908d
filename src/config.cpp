#include "docsum/config.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace docsum {

namespace {

constexpr const char* kComponent = "Config";

using json = nlohmann::json;

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) {
        return empty;
    }
    const json& value = root[name];
    if (!value.is_object()) {
        throw std::invalid_argument(std::string("config section '") + name + "' must be an object");
    }
    return value;
}

Config parse_config(const json& root) {
    if (!root.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }

    Config config;

    const json& chunking = section(root, "chunking");
    int chunk_size = chunking.value("chunk_size", config.reduce.chunking.chunk_size);
    int chunk_overlap = chunking.value("chunk_overlap", config.reduce.chunking.chunk_overlap);
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunking.chunk_size must be positive");
    }
    if (chunk_overlap < 0) {
        throw std::invalid_argument("chunking.chunk_overlap must be non-negative");
    }
    config.preset = chunking.value("preset", config.preset);
    config.reduce.chunking = chunker_options_for_preset(config.preset, chunk_size, chunk_overlap);
    config.reduce.detect_markdown = config.preset == "auto";
    config.reduce.chunking.keep_separator = chunking.value("keep_separator", true);

    const json& reduce = section(root, "reduce");
    int max_concurrency = reduce.value("max_concurrency", static_cast<int>(config.reduce.max_concurrency));
    if (max_concurrency < 1) {
        throw std::invalid_argument("reduce.max_concurrency must be at least 1");
    }
    config.reduce.max_concurrency = static_cast<size_t>(max_concurrency);

    long long timeout_ms = reduce.value("call_timeout_ms", static_cast<long long>(config.reduce.call_timeout.count()));
    if (timeout_ms <= 0) {
        throw std::invalid_argument("reduce.call_timeout_ms must be positive");
    }
    config.reduce.call_timeout = std::chrono::milliseconds(timeout_ms);

    config.reduce.max_reduce_rounds = reduce.value("max_reduce_rounds", config.reduce.max_reduce_rounds);
    if (config.reduce.max_reduce_rounds < 0) {
        throw std::invalid_argument("reduce.max_reduce_rounds must be non-negative");
    }
    config.reduce.chunk_prompt = reduce.value("chunk_prompt", config.reduce.chunk_prompt);

    const json& backend = section(root, "backend");
    config.backend.type = backend.value("type", config.backend.type);
    if (config.backend.type != "none" && config.backend.type != "openai") {
        throw std::invalid_argument("unknown backend type: " + config.backend.type);
    }
    config.backend.api_key_env = backend.value("api_key_env", config.backend.api_key_env);
    config.backend.openai.base_url = backend.value("base_url", config.backend.openai.base_url);
    config.backend.openai.model = backend.value("model", config.backend.openai.model);
    config.backend.openai.temperature = backend.value("temperature", config.backend.openai.temperature);
    config.backend.openai.top_p = backend.value("top_p", config.backend.openai.top_p);
    config.backend.openai.max_tokens = backend.value("max_tokens", config.backend.openai.max_tokens);
    if (config.backend.openai.max_tokens <= 0) {
        throw std::invalid_argument("backend.max_tokens must be positive");
    }

    config.prompts_dir = root.value("prompts_dir", config.prompts_dir);
    if (root.contains("log_level")) {
        config.log_level = parse_log_level(root["log_level"].get<std::string>());
    }

    return config;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "info";
}

} // namespace

Config Config::from_json(const nlohmann::json& json) {
    try {
        return parse_config(json);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("invalid config: ") + e.what());
    }
}

Config Config::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    auto json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded()) {
        throw std::invalid_argument("config file is not valid JSON: " + path);
    }

    Config config = from_json(json);
    log_debug(kComponent, "Loaded configuration from " + path);
    return config;
}

nlohmann::json Config::to_json() const {
    return {
        {"chunking", {
            {"chunk_size", reduce.chunking.chunk_size},
            {"chunk_overlap", reduce.chunking.chunk_overlap},
            {"preset", preset},
            {"keep_separator", reduce.chunking.keep_separator}
        }},
        {"reduce", {
            {"max_concurrency", reduce.max_concurrency},
            {"call_timeout_ms", reduce.call_timeout.count()},
            {"max_reduce_rounds", reduce.max_reduce_rounds},
            {"chunk_prompt", reduce.chunk_prompt}
        }},
        {"backend", {
            {"type", backend.type},
            {"api_key_env", backend.api_key_env},
            {"base_url", backend.openai.base_url},
            {"model", backend.openai.model},
            {"temperature", backend.openai.temperature},
            {"top_p", backend.openai.top_p},
            {"max_tokens", backend.openai.max_tokens}
        }},
        {"prompts_dir", prompts_dir},
        {"log_level", log_level_name(log_level)}
    };
}

ChunkerOptions chunker_options_for_preset(const std::string& preset, int chunk_size, int chunk_overlap) {
    if (preset == "auto" || preset == "prose") {
        ChunkerOptions options;
        options.chunk_size = chunk_size;
        options.chunk_overlap = chunk_overlap;
        return options;
    }
    if (preset == "markdown") {
        return ChunkerOptions::for_markdown(chunk_size, chunk_overlap);
    }
    if (preset == "code") {
        return ChunkerOptions::for_code(chunk_size, chunk_overlap);
    }
    throw std::invalid_argument("unknown chunking preset: " + preset);
}

std::shared_ptr<GenerationBackend> make_backend(const BackendConfig& config) {
    if (config.type == "none") {
        log_info(kComponent, "No generation backend configured, summaries will be simulated");
        return std::make_shared<SimulatedBackend>();
    }

    if (config.type != "openai") {
        throw std::invalid_argument("unknown backend type: " + config.type);
    }

    const char* key = std::getenv(config.api_key_env.c_str());
    if (key == nullptr || *key == '\0') {
        log_warning(kComponent, config.api_key_env + " is not set, summaries will be simulated");
        return std::make_shared<SimulatedBackend>();
    }

    OpenAiOptions options = config.openai;
    options.api_key = key;
    log_info(kComponent, "Using " + options.model + " at " + options.base_url);
    return std::make_shared<OpenAiCompatibleBackend>(options);
}

std::shared_ptr<TemplateProvider> make_template_provider(const Config& config) {
    if (config.prompts_dir.empty()) {
        return std::make_shared<DefaultTemplateProvider>();
    }
    return std::make_shared<DirectoryTemplateProvider>(config.prompts_dir);
}

} // namespace docsum
