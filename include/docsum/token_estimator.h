#pragma once

#include <string>

namespace docsum {

/**
 * Heuristic token sizing without calling any tokenizer service.
 *
 * Text is split on whitespace; words of three or more characters weigh 1.0,
 * shorter words 0.5, and every character that is neither alphanumeric nor
 * whitespace adds another 0.5. The sum is multiplied by a 1.2 safety factor
 * and truncated, so the estimate leans high rather than low.
 *
 * Text is decoded as UTF-8 and word length is measured in code points.
 * Unicode punctuation and symbols (typographic quotes, dashes, bullets,
 * arrows, CJK and fullwidth punctuation) weigh the same as their ASCII
 * counterparts; other non-ASCII characters count as letters.
 */
class TokenEstimator {
public:
    static constexpr double kLongWordWeight = 1.0;
    static constexpr double kShortWordWeight = 0.5;
    static constexpr double kPunctuationWeight = 0.5;
    static constexpr double kSafetyFactor = 1.2;
    static constexpr size_t kShortWordLength = 3;

    // Rough characters per estimated token, used for character-level slicing
    // and overlap sizing.
    static constexpr int kCharsPerToken = 4;

    static int estimate(const std::string& text);

    // Weighted sum before the safety factor. Sums of this value can be
    // compared against a budget without per-fragment truncation error.
    static double weighted_units(const std::string& text);

    static int from_units(double units);

    static bool fits(const std::string& text, int budget) {
        return estimate(text) <= budget;
    }
};

} // namespace docsum
