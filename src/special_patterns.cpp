#include "docsum/special_patterns.h"

#include <algorithm>
#include <regex>

namespace docsum {

namespace {

// Line patterns only constrain the start of a line, so matching a bounded
// prefix is equivalent and keeps std::regex recursion shallow on long lines.
constexpr size_t kLinePrefixLimit = 256;

std::vector<TextSpan> find_code_fences(const std::string& text) {
    static const std::string fence = "```";
    std::vector<TextSpan> spans;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(fence, pos);
        if (open == std::string::npos) break;

        size_t close = text.find(fence, open + fence.size());
        if (close == std::string::npos) break;

        size_t end = close + fence.size();
        spans.push_back({open, end - open});
        pos = end;
    }

    return spans;
}

} // namespace

PatternMatcher line_regex_matcher(const std::string& pattern) {
    auto regex = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript | std::regex::optimize);

    return [regex](const std::string& text) {
        std::vector<TextSpan> spans;
        size_t start = 0;

        while (start <= text.size()) {
            size_t newline = text.find('\n', start);
            size_t end = newline == std::string::npos ? text.size() : newline;

            size_t line_end = end;
            if (line_end > start && text[line_end - 1] == '\r') {
                line_end--;
            }

            size_t line_length = line_end - start;
            if (line_length > 0) {
                std::string prefix = text.substr(start, std::min(line_length, kLinePrefixLimit));
                if (std::regex_match(prefix, *regex)) {
                    spans.push_back({start, line_length});
                }
            }

            if (newline == std::string::npos) break;
            start = newline + 1;
        }

        return spans;
    };
}

SpecialPattern markdown_header_pattern(int priority) {
    return {"markdown_header", line_regex_matcher(R"(\s*#{1,6}\s+.+)"), priority};
}

SpecialPattern code_fence_pattern(int priority) {
    return {"code_fence", find_code_fences, priority};
}

SpecialPattern bullet_list_pattern(int priority) {
    return {"bullet_list", line_regex_matcher(R"(\s*[-*+]\s+.+)"), priority};
}

SpecialPattern numbered_list_pattern(int priority) {
    return {"numbered_list", line_regex_matcher(R"(\s*\d+\.\s+.+)"), priority};
}

std::vector<SpecialPattern> default_special_patterns() {
    return {
        markdown_header_pattern(),
        code_fence_pattern(),
        bullet_list_pattern(),
        numbered_list_pattern()
    };
}

} // namespace docsum
