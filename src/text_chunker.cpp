#include "docsum/text_chunker.h"
#include "docsum/logging.h"
#include "docsum/token_estimator.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace docsum {

namespace {

constexpr const char* kComponent = "TextChunker";

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Moves a cut point off the middle of a UTF-8 sequence.
size_t align_forward(const std::string& text, size_t pos) {
    while (pos < text.size() && is_continuation_byte(text[pos])) {
        pos++;
    }
    return pos;
}

size_t align_backward(const std::string& text, size_t pos, size_t floor) {
    size_t aligned = pos;
    while (aligned > floor && aligned < text.size() && is_continuation_byte(text[aligned])) {
        aligned--;
    }
    return aligned > floor ? aligned : align_forward(text, pos);
}

std::string printable(const std::string& separator) {
    std::string out;
    for (char c : separator) {
        if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

} // namespace

std::vector<std::string> ChunkerOptions::default_separators() {
    return {
        "\n\n\n",   // major section
        "\n\n",     // paragraph
        "\n",
        ". ",
        "! ",
        "? ",
        ";",
        ",",
        " ",
        ""          // character level
    };
}

bool contains_markdown(const std::string& text) {
    if (text.empty()) {
        return false;
    }

    constexpr size_t kSampleSize = 5000;
    // Leading newline so markers on the first line are found too.
    std::string sample = "\n" + text.substr(0, kSampleSize);
    auto has = [&sample](const char* marker) {
        return sample.find(marker) != std::string::npos;
    };

    bool headers = has("\n# ") || has("\n## ") || has("\n###") || has("\n===") || has("\n---");
    bool lists = has("\n- ") || has("\n* ") || has("\n+ ") || has("\n1. ");
    bool code = has("```") || has("\n    ");
    bool formatting = (has("[") && has("](")) || has("**") || has("__") || has("\n> ");
    bool tables = has("\n|") && (has("|--") || has("--|") || has("|:-"));

    return headers || lists || code || formatting || tables;
}

ChunkerOptions ChunkerOptions::for_markdown(int chunk_size, int chunk_overlap) {
    ChunkerOptions options;
    options.chunk_size = chunk_size;
    options.chunk_overlap = chunk_overlap;
    options.separators = {
        "\n## ",
        "\n### ",
        "\n#### ",
        "\n##### ",
        "\n###### ",
        "\n\n",
        "\n",
        " ",
        ""
    };
    return options;
}

ChunkerOptions ChunkerOptions::for_code(int chunk_size, int chunk_overlap) {
    ChunkerOptions options;
    options.chunk_size = chunk_size;
    options.chunk_overlap = chunk_overlap;
    options.separators = {
        "\n\n\n",
        "\n\n",
        "\n",
        ";",
        "{",
        "}",
        " ",
        ""
    };
    return options;
}

class TextChunker::Impl {
public:
    explicit Impl(const ChunkerOptions& opts) : options(opts) {
        if (options.chunk_size <= 0) {
            throw std::invalid_argument("chunk size must be positive");
        }
        if (options.chunk_overlap < 0) {
            throw std::invalid_argument("chunk overlap must be non-negative");
        }
        if (options.chunk_overlap >= options.chunk_size) {
            throw std::invalid_argument("chunk overlap must be smaller than chunk size");
        }

        patterns = options.special_patterns;
        std::stable_sort(patterns.begin(), patterns.end(),
                         [](const SpecialPattern& a, const SpecialPattern& b) {
                             return a.priority > b.priority;
                         });
    }

    std::vector<Chunk> split(const std::string& text) const {
        if (text.empty()) {
            log_warning(kComponent, "Empty text provided to split_text");
            return {};
        }

        int estimate = TokenEstimator::estimate(text);
        if (estimate <= options.chunk_size) {
            log_debug(kComponent, "Text fits in a single chunk (" + std::to_string(text.size()) +
                      " chars, ~" + std::to_string(estimate) + " tokens)");
            return {Chunk{0, text, estimate, 0}};
        }

        log_info(kComponent, "Splitting text of " + std::to_string(text.size()) +
                 " chars into chunks (max tokens: " + std::to_string(options.chunk_size) +
                 ", overlap: " + std::to_string(options.chunk_overlap) + ")");

        std::vector<std::string> pieces;
        auto fragments = split_by_special_patterns(text);
        if (!fragments.empty()) {
            log_debug(kComponent, "Special patterns produced " + std::to_string(fragments.size()) +
                      " initial segments");
            pieces = merge_fragments(fragments);
        } else {
            pieces = split_recursive(text, 0);
        }

        auto chunks = apply_overlap(pieces);
        log_info(kComponent, "Created " + std::to_string(chunks.size()) + " chunks");
        return chunks;
    }

    ChunkerOptions options;

private:
    // First pattern (by priority) with any match wins.
    std::vector<std::string> split_by_special_patterns(const std::string& text) const {
        std::vector<std::string> result;

        for (const auto& pattern : patterns) {
            if (!pattern.matcher) continue;

            auto spans = pattern.matcher(text);
            if (spans.empty()) continue;

            log_debug(kComponent, "Found " + std::to_string(spans.size()) +
                      " matches for pattern: " + pattern.name);

            size_t last_end = 0;
            for (const auto& span : spans) {
                if (span.offset < last_end || span.offset + span.length > text.size()) {
                    continue;
                }

                if (span.offset > last_end) {
                    std::string between = text.substr(last_end, span.offset - last_end);
                    if (!is_blank(between)) {
                        result.push_back(std::move(between));
                    }
                }

                result.push_back(text.substr(span.offset, span.length));
                last_end = span.offset + span.length;
            }

            if (last_end < text.size()) {
                std::string remaining = text.substr(last_end);
                if (!is_blank(remaining)) {
                    result.push_back(std::move(remaining));
                }
            }

            if (!result.empty()) {
                return result;
            }
        }

        return result;
    }

    // Tries separators from `first` onwards; over-budget fragments descend to
    // the separators after the one that produced them.
    std::vector<std::string> split_recursive(const std::string& text, size_t first) const {
        const auto& separators = options.separators;

        for (size_t i = first; i < separators.size(); ++i) {
            const std::string& separator = separators[i];
            bool last = i + 1 == separators.size();

            // The character-level separator is only a last resort.
            if (separator.empty() && !last) {
                continue;
            }

            auto splits = separator.empty() ? split_by_characters(text)
                                             : split_on_separator(text, separator);
            if (splits.size() <= 1) {
                continue;
            }

            log_debug(kComponent, "Split into " + std::to_string(splits.size()) +
                      " segments using separator: '" + printable(separator) + "'");

            std::vector<std::string> result;
            for (auto& piece : splits) {
                if (separator.empty() || last || TokenEstimator::estimate(piece) <= options.chunk_size) {
                    result.push_back(std::move(piece));
                    continue;
                }

                auto sub = split_recursive(piece, i + 1);
                result.insert(result.end(),
                              std::make_move_iterator(sub.begin()),
                              std::make_move_iterator(sub.end()));
            }
            return result;
        }

        // Nothing left to split on; emit as is even if over budget.
        return {text};
    }

    std::vector<std::string> split_on_separator(const std::string& text, const std::string& separator) const {
        std::vector<std::string> splits;
        size_t start = 0;

        while (true) {
            size_t pos = text.find(separator, start);
            bool final_segment = pos == std::string::npos;

            std::string segment = text.substr(start, final_segment ? std::string::npos : pos - start);
            if (options.keep_separator && !final_segment) {
                segment += separator;
            }
            // Runs of separators stay attached to the preceding fragment.
            if (!segment.empty() && is_blank(segment) && !splits.empty()) {
                splits.back() += segment;
            } else if (!segment.empty()) {
                splits.push_back(std::move(segment));
            }

            if (final_segment) break;
            start = pos + separator.size();
        }

        return splits;
    }

    std::vector<std::string> split_by_characters(const std::string& text) const {
        std::vector<std::string> slices;
        size_t width = static_cast<size_t>(options.chunk_size) * TokenEstimator::kCharsPerToken;

        size_t start = 0;
        while (start < text.size()) {
            size_t end = std::min(start + width, text.size());
            if (end < text.size()) {
                end = align_backward(text, end, start);
            }
            slices.push_back(text.substr(start, end - start));
            start = end;
        }

        return slices;
    }

    // Packs special-pattern fragments up to the budget. A fragment that is
    // over budget on its own goes through separator splitting.
    std::vector<std::string> merge_fragments(const std::vector<std::string>& fragments) const {
        std::vector<std::string> result;
        std::string current;
        double current_units = 0.0;

        auto flush = [&]() {
            if (!current.empty()) {
                result.push_back(std::move(current));
                current.clear();
                current_units = 0.0;
            }
        };

        for (const auto& fragment : fragments) {
            double units = TokenEstimator::weighted_units(fragment);

            if (TokenEstimator::from_units(units) > options.chunk_size) {
                flush();
                auto sub = split_recursive(fragment, 0);
                result.insert(result.end(),
                              std::make_move_iterator(sub.begin()),
                              std::make_move_iterator(sub.end()));
                continue;
            }

            if (!current.empty() &&
                TokenEstimator::from_units(current_units + units) > options.chunk_size) {
                flush();
            }

            if (!current.empty() &&
                !std::isspace(static_cast<unsigned char>(current.back())) &&
                !std::isspace(static_cast<unsigned char>(fragment.front()))) {
                current += '\n';
            }
            current += fragment;
            current_units += units;
        }
        flush();

        return result;
    }

    std::vector<Chunk> apply_overlap(std::vector<std::string>& pieces) const {
        std::vector<Chunk> chunks;
        chunks.reserve(pieces.size());

        size_t overlap_chars = static_cast<size_t>(options.chunk_overlap) * TokenEstimator::kCharsPerToken;

        for (size_t i = 0; i < pieces.size(); ++i) {
            Chunk chunk;
            chunk.index = i;

            if (i > 0 && overlap_chars > 0) {
                const std::string& previous = pieces[i - 1];
                size_t take = std::min(overlap_chars, previous.size());
                size_t start = align_forward(previous, previous.size() - take);
                chunk.text = previous.substr(start);
                chunk.overlap_length = chunk.text.size();
            }

            chunk.text += pieces[i];
            chunk.token_estimate = TokenEstimator::estimate(chunk.text);
            chunks.push_back(std::move(chunk));
        }

        return chunks;
    }

    std::vector<SpecialPattern> patterns;
};

TextChunker::TextChunker(const ChunkerOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {
}

TextChunker::~TextChunker() = default;

TextChunker::TextChunker(TextChunker&&) noexcept = default;
TextChunker& TextChunker::operator=(TextChunker&&) noexcept = default;

std::vector<std::string> TextChunker::split_text(const std::string& text) const {
    auto chunks = pImpl->split(text);

    std::vector<std::string> result;
    result.reserve(chunks.size());
    for (auto& chunk : chunks) {
        result.push_back(std::move(chunk.text));
    }
    return result;
}

std::vector<Chunk> TextChunker::split_chunks(const std::string& text) const {
    return pImpl->split(text);
}

const ChunkerOptions& TextChunker::options() const {
    return pImpl->options;
}

} // namespace docsum
