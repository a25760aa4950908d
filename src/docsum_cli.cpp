#include <docsum/batch_summarizer.h>
#include <docsum/chunk_serializer.h>
#include <docsum/config.h>
#include <docsum/reduce_coordinator.h>
#include <docsum/text_chunker.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace docsum;

struct CLIOptions {
    std::vector<std::string> input_files;
    std::string output_file;
    std::string config_file;
    std::string prompt_name = kFinalSummaryPrompt;
    TemplateVariables variables;
    int chunk_size = -1;     // -1 = keep config value
    int overlap = -1;
    std::string preset;
    int concurrency = -1;
    long long timeout_ms = -1;
    int retries = 0;
    bool chunks_only = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

namespace {

CancellationToken g_cancellation;

void handle_interrupt(int) {
    g_cancellation.cancel();
}

} // namespace

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input FILE           Input text file, '-' for stdin (repeatable)\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          Write the result to FILE (default: stdout)\n";
    std::cout << "  -c, --config FILE          JSON configuration file\n";
    std::cout << "  --prompt NAME              Final prompt template (default: final_summary_prompt)\n";
    std::cout << "  --var KEY=VALUE            Template variable (repeatable)\n";
    std::cout << "  --chunk-size N             Maximum estimated tokens per call (default: 3000)\n";
    std::cout << "  --overlap N                Overlap between chunks in tokens (default: 500)\n";
    std::cout << "  --preset NAME              Separator preset: auto, prose, markdown, code\n";
    std::cout << "  --concurrency N            Parallel chunk calls (default: 4)\n";
    std::cout << "  --timeout-ms N             Per-call timeout in milliseconds (default: 120000)\n";
    std::cout << "  --retries N                Retries per document for transient failures (default: 0)\n";
    std::cout << "  --chunks-only              Print chunk JSON instead of summarizing\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (errors only)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nThe API key is read from the variable named by backend.api_key_env\n";
    std::cout << "(OPENAI_API_KEY by default). Without it summaries are simulated.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i notes.txt\n";
    std::cout << "  " << program_name << " -i lecture.md --preset markdown --prompt final_summary_prompt_video\n";
    std::cout << "  " << program_name << " -i a.txt -i b.txt -c docsum.json -o summaries.md\n";
    std::cout << "  cat report.txt | " << program_name << " -i - --chunks-only\n";
}

void print_version() {
    std::cout << "docsum version 1.0.0\n";
    std::cout << "Built with C++17, libcurl, nlohmann::json and RapidJSON\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:c:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"prompt", required_argument, nullptr, 1001},
        {"var", required_argument, nullptr, 1002},
        {"chunk-size", required_argument, nullptr, 1003},
        {"overlap", required_argument, nullptr, 1004},
        {"preset", required_argument, nullptr, 1005},
        {"concurrency", required_argument, nullptr, 1006},
        {"timeout-ms", required_argument, nullptr, 1007},
        {"retries", required_argument, nullptr, 1008},
        {"chunks-only", no_argument, nullptr, 1009},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1010},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_files.push_back(optarg);
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 'c':
                options.config_file = optarg;
                break;
            case 1001:  // prompt
                options.prompt_name = optarg;
                break;
            case 1002: {  // var
                std::string assignment = optarg;
                auto eq = assignment.find('=');
                if (eq == std::string::npos || eq == 0) {
                    throw std::invalid_argument("--var expects KEY=VALUE, got: " + assignment);
                }
                options.variables[assignment.substr(0, eq)] = assignment.substr(eq + 1);
                break;
            }
            case 1003:  // chunk-size
                options.chunk_size = std::stoi(optarg);
                if (options.chunk_size <= 0) {
                    throw std::invalid_argument("chunk-size must be positive");
                }
                break;
            case 1004:  // overlap
                options.overlap = std::stoi(optarg);
                if (options.overlap < 0) {
                    throw std::invalid_argument("overlap cannot be negative");
                }
                break;
            case 1005:  // preset
                options.preset = optarg;
                break;
            case 1006:  // concurrency
                options.concurrency = std::stoi(optarg);
                if (options.concurrency <= 0) {
                    throw std::invalid_argument("concurrency must be positive");
                }
                break;
            case 1007:  // timeout-ms
                options.timeout_ms = std::stoll(optarg);
                if (options.timeout_ms <= 0) {
                    throw std::invalid_argument("timeout-ms must be positive");
                }
                break;
            case 1008:  // retries
                options.retries = std::stoi(optarg);
                if (options.retries < 0) {
                    throw std::invalid_argument("retries cannot be negative");
                }
                break;
            case 1009:  // chunks-only
                options.chunks_only = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1010:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_files.empty()) {
        throw std::invalid_argument("At least one input file is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

// Config file first, command-line flags on top.
Config build_config(const CLIOptions& options) {
    Config config = options.config_file.empty() ? Config{} : Config::from_file(options.config_file);

    if (!options.preset.empty()) {
        config.preset = options.preset;
    }
    int chunk_size = options.chunk_size > 0 ? options.chunk_size : config.reduce.chunking.chunk_size;
    int overlap = options.overlap >= 0 ? options.overlap : config.reduce.chunking.chunk_overlap;
    bool keep_separator = config.reduce.chunking.keep_separator;
    config.reduce.chunking = chunker_options_for_preset(config.preset, chunk_size, overlap);
    config.reduce.chunking.keep_separator = keep_separator;
    config.reduce.detect_markdown = config.preset == "auto";

    if (options.concurrency > 0) {
        config.reduce.max_concurrency = static_cast<size_t>(options.concurrency);
    }
    if (options.timeout_ms > 0) {
        config.reduce.call_timeout = std::chrono::milliseconds(options.timeout_ms);
    }

    if (options.verbose) {
        config.log_level = LogLevel::Debug;
    } else if (options.quiet) {
        config.log_level = LogLevel::Error;
    }

    return config;
}

Document read_document(const std::string& input, const TemplateVariables& variables) {
    Document document;
    document.variables = variables;

    if (input == "-") {
        document.id = "stdin";
        document.text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        document.variables.emplace("title", "stdin");
        return document;
    }

    if (!fs::exists(input)) {
        throw std::runtime_error("Input file not found: " + input);
    }

    std::ifstream file(input, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open input file: " + input);
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    document.id = input;
    document.text = contents.str();
    document.variables.emplace("title", fs::path(input).stem().string());
    document.variables.emplace("source_path", input);
    return document;
}

void write_output(const std::string& path, const std::string& content) {
    if (path.empty()) {
        std::cout << content;
        if (!content.empty() && content.back() != '\n') {
            std::cout << "\n";
        }
        return;
    }

    fs::path output_path(path);
    fs::path output_dir = output_path.parent_path();
    if (!output_dir.empty() && !fs::exists(output_dir)) {
        fs::create_directories(output_dir);
    }

    std::ofstream out(output_path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

int run_chunks_only(const Config& config, const std::vector<Document>& documents, const CLIOptions& options) {
    TextChunker chunker(config.reduce.chunking);

    std::string output;
    for (const auto& document : documents) {
        auto chunks = chunker.split_chunks(document.text);
        output += ChunkSerializer::serialize_chunks(chunks, document.id);
        output += "\n";
    }

    write_output(options.output_file, output);
    return 0;
}

int run_summaries(const Config& config, const std::vector<Document>& documents, const CLIOptions& options) {
    ReduceCoordinator coordinator(config.reduce, make_backend(config.backend), make_template_provider(config));

    BatchOptions batch_options;
    batch_options.prompt_name = options.prompt_name;
    batch_options.max_attempts = options.retries + 1;
    batch_options.retry_delay = std::chrono::milliseconds(1000);
    BatchSummarizer batch(coordinator, batch_options);

    auto progress = [&options](size_t current, size_t total) {
        if (!options.quiet && total > 1) {
            std::cerr << "Progress: " << current << "/" << total
                      << " (" << (100 * current / total) << "%)" << std::endl;
        }
    };

    BatchResult result = batch.run(documents, progress, g_cancellation);

    std::string output;
    if (result.outcomes.size() == 1) {
        output = result.outcomes.front().result.summary;
    } else {
        for (const auto& outcome : result.outcomes) {
            if (!outcome.result.success()) continue;
            output += "## " + outcome.id + "\n\n" + outcome.result.summary + "\n\n";
        }
    }
    if (result.succeeded > 0) {
        write_output(options.output_file, output);
    }

    if (options.verbose) {
        for (const auto& outcome : result.outcomes) {
            std::cerr << outcome.id << ": " << outcome.result.chunk_count << " chunks, "
                      << outcome.result.reduce_rounds << " reduce rounds, "
                      << outcome.result.backend_calls << " calls, "
                      << static_cast<long long>(outcome.result.processing_time_ms) << "ms"
                      << (outcome.result.simulated ? " (simulated)" : "") << "\n";
        }
    }

    for (const auto& outcome : result.outcomes) {
        if (!outcome.result.success()) {
            std::cerr << "Error: " << outcome.id << ": " << outcome.result.error << "\n";
        }
    }

    return result.failed == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        Config config = build_config(options);
        set_log_level(config.log_level);

        std::vector<Document> documents;
        for (const auto& input : options.input_files) {
            documents.push_back(read_document(input, options.variables));
        }

        std::signal(SIGINT, handle_interrupt);

        if (options.chunks_only) {
            return run_chunks_only(config, documents, options);
        }
        return run_summaries(config, documents, options);

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
