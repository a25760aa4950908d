#include "docsum/token_estimator.h"

#include <cctype>

namespace docsum {

namespace {

bool is_whitespace(unsigned char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

// Decodes the code point starting at `pos` and returns its length in bytes.
// Malformed sequences are taken one byte at a time.
size_t decode_utf8(const std::string& text, size_t pos, char32_t& code_point) {
    auto lead = static_cast<unsigned char>(text[pos]);

    size_t length = 1;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        code_point = lead;
        return 1;
    }

    if (pos + length > text.size()) {
        code_point = lead;
        return 1;
    }
    for (size_t i = 1; i < length; ++i) {
        auto c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            code_point = lead;
            return 1;
        }
        code_point = (code_point << 6) | (c & 0x3F);
    }
    return length;
}

// Punctuation and symbols, ASCII and the common Unicode blocks. Everything
// else outside ASCII (accented letters, CJK, digits of other scripts) counts
// as a letter.
bool is_punctuation(char32_t cp) {
    if (cp < 0x80) {
        return !std::isalnum(static_cast<int>(cp)) && !std::isspace(static_cast<int>(cp));
    }
    return (cp >= 0x00A1 && cp <= 0x00BF) ||
           cp == 0x00D7 || cp == 0x00F7 ||
           (cp >= 0x2000 && cp <= 0x206F) ||   // general punctuation
           (cp >= 0x20A0 && cp <= 0x20CF) ||   // currency
           (cp >= 0x2190 && cp <= 0x2BFF) ||   // arrows, math, shapes, dingbats
           (cp >= 0x2E00 && cp <= 0x2E7F) ||
           (cp >= 0x3000 && cp <= 0x303F) ||   // CJK punctuation
           (cp >= 0xFF01 && cp <= 0xFF0F) ||   // fullwidth ASCII punctuation
           (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) ||
           (cp >= 0xFF5B && cp <= 0xFF65) ||
           (cp >= 0x1F000 && cp <= 0x1FAFF);   // emoji and pictographs
}

} // namespace

double TokenEstimator::weighted_units(const std::string& text) {
    double units = 0.0;
    size_t word_length = 0;

    auto close_word = [&]() {
        if (word_length == 0) return;
        units += word_length >= kShortWordLength ? kLongWordWeight : kShortWordWeight;
        word_length = 0;
    };

    size_t pos = 0;
    while (pos < text.size()) {
        if (is_whitespace(static_cast<unsigned char>(text[pos]))) {
            close_word();
            pos++;
            continue;
        }

        char32_t code_point = 0;
        pos += decode_utf8(text, pos, code_point);
        word_length++;
        if (is_punctuation(code_point)) {
            units += kPunctuationWeight;
        }
    }
    close_word();

    return units;
}

int TokenEstimator::from_units(double units) {
    return static_cast<int>(units * kSafetyFactor);
}

int TokenEstimator::estimate(const std::string& text) {
    if (text.empty()) return 0;
    return from_units(weighted_units(text));
}

} // namespace docsum
