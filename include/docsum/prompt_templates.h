#pragma once

#include <map>
#include <string>

namespace docsum {

using TemplateVariables = std::map<std::string, std::string>;

inline constexpr const char* kChunkSummaryPrompt = "chunk_summary_prompt";
inline constexpr const char* kFinalSummaryPrompt = "final_summary_prompt";
inline constexpr const char* kFinalSummaryPromptVideo = "final_summary_prompt_video";

// Replaces every {{key}} (whitespace around the key allowed) with its value.
// Placeholders without a matching variable are left as they are.
std::string substitute_variables(const std::string& prompt_template,
                                 const TemplateVariables& variables);

bool has_placeholder(const std::string& prompt_template, const std::string& key);

// Built-in template for a name; unknown names get the final-summary template.
std::string default_template(const std::string& name);

// Supplies prompt templates by name. Must always return a usable template.
class TemplateProvider {
public:
    virtual ~TemplateProvider() = default;

    virtual std::string load_template(const std::string& name) const = 0;
};

class DefaultTemplateProvider final : public TemplateProvider {
public:
    std::string load_template(const std::string& name) const override;
};

// Reads <directory>/<name>.md, falling back to the built-in template when the
// file is missing or unreadable.
class DirectoryTemplateProvider final : public TemplateProvider {
public:
    explicit DirectoryTemplateProvider(std::string directory);

    std::string load_template(const std::string& name) const override;

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

} // namespace docsum
