#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace docsum {

// Byte range inside a source string.
struct TextSpan {
    size_t offset = 0;
    size_t length = 0;
};

// Returns the non-overlapping spans a pattern matches, in document order.
using PatternMatcher = std::function<std::vector<TextSpan>(const std::string&)>;

// A structural region that should not be split internally when avoidable.
// Higher priority patterns are tried first.
struct SpecialPattern {
    std::string name;
    PatternMatcher matcher;
    int priority = 0;
};

// Lines of the form "# Title" through "###### Title".
SpecialPattern markdown_header_pattern(int priority = 10);

// ``` fenced blocks, fence lines included.
SpecialPattern code_fence_pattern(int priority = 20);

// Lines starting with "-", "*" or "+" followed by whitespace and content.
SpecialPattern bullet_list_pattern(int priority = 15);

// Lines starting with "1." style numbering followed by whitespace and content.
SpecialPattern numbered_list_pattern(int priority = 15);

// Headers, code fences, bullet lists and numbered lists with their default priorities.
std::vector<SpecialPattern> default_special_patterns();

// Builds a matcher that tests each line (without its trailing newline or
// carriage return) against an ECMAScript regex and reports whole matching lines.
PatternMatcher line_regex_matcher(const std::string& pattern);

} // namespace docsum
