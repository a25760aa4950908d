#include "docsum/prompt_templates.h"
#include "docsum/logging.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace docsum {

namespace {

constexpr const char* kComponent = "PromptTemplates";

const char* const kDefaultChunkTemplate =
    "You are an expert summarizer. Summarize the following section of a longer document, "
    "keeping its key concepts, main arguments and any concrete facts or figures. "
    "Write clearly and concisely; the result will be combined with the summaries of the other sections.\n"
    "\n"
    "{{chunk_context}}\n"
    "\n"
    "Content:\n"
    "{{content}}";

const char* const kDefaultFinalTemplate =
    "You are an expert summarizer. Write a comprehensive summary of the following material, "
    "synthesizing its main points, arguments and conclusions. Highlight the most important "
    "takeaways and any recommended actions or next steps.\n"
    "\n"
    "Content:\n"
    "{{content}}";

const char* const kDefaultVideoTemplate =
    "You are summarizing the transcript of an educational video. Produce a markdown summary "
    "with these sections:\n"
    "\n"
    "# Video Summary\n"
    "\n"
    "## Topics Covered\n"
    "- Three to five main topics, as bullet points\n"
    "\n"
    "## Key Concepts\n"
    "- The central ideas explained in a few short paragraphs\n"
    "\n"
    "## Takeaways\n"
    "- Three to five practical takeaways\n"
    "\n"
    "## Notable Quotes\n"
    "- One or two significant quotes as markdown blockquotes\n"
    "\n"
    "## Open Questions\n"
    "- What remains unclear or worth exploring further\n"
    "\n"
    "Content:\n"
    "{{content}}";

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) end--;
    return value.substr(begin, end - begin);
}

// Calls visit(key, start, length) for every {{...}} on a single line.
template<typename Visitor>
void for_each_placeholder(const std::string& text, Visitor visit) {
    size_t pos = 0;
    while ((pos = text.find("{{", pos)) != std::string::npos) {
        size_t close = text.find("}}", pos + 2);
        if (close == std::string::npos) {
            return;
        }

        std::string inner = text.substr(pos + 2, close - pos - 2);
        if (inner.find('\n') != std::string::npos) {
            pos += 2;
            continue;
        }

        visit(trim(inner), pos, close + 2 - pos);
        pos = close + 2;
    }
}

} // namespace

std::string substitute_variables(const std::string& prompt_template,
                                 const TemplateVariables& variables) {
    std::string result;
    result.reserve(prompt_template.size());

    size_t copied = 0;
    for_each_placeholder(prompt_template, [&](const std::string& key, size_t start, size_t length) {
        auto it = variables.find(key);
        if (it == variables.end()) {
            return;
        }
        result.append(prompt_template, copied, start - copied);
        result += it->second;
        copied = start + length;
    });
    result.append(prompt_template, copied, std::string::npos);

    return result;
}

bool has_placeholder(const std::string& prompt_template, const std::string& key) {
    bool found = false;
    for_each_placeholder(prompt_template, [&](const std::string& name, size_t, size_t) {
        if (name == key) found = true;
    });
    return found;
}

std::string default_template(const std::string& name) {
    if (name == kChunkSummaryPrompt) return kDefaultChunkTemplate;
    if (name == kFinalSummaryPromptVideo) return kDefaultVideoTemplate;
    if (name != kFinalSummaryPrompt) {
        log_debug(kComponent, "No built-in template named '" + name + "', using " + kFinalSummaryPrompt);
    }
    return kDefaultFinalTemplate;
}

std::string DefaultTemplateProvider::load_template(const std::string& name) const {
    return default_template(name);
}

DirectoryTemplateProvider::DirectoryTemplateProvider(std::string directory)
    : directory_(std::move(directory)) {
}

std::string DirectoryTemplateProvider::load_template(const std::string& name) const {
    namespace fs = std::filesystem;

    fs::path path = fs::path(directory_) / (name + ".md");

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        log_warning(kComponent, "Template not found at " + path.string() + ", using built-in " + name);
        return default_template(name);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        log_error(kComponent, "Failed to open template " + path.string() + ", using built-in " + name);
        return default_template(name);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    log_info(kComponent, "Loaded template: " + name);
    return contents.str();
}

} // namespace docsum
