#pragma once

#include "docsum/special_patterns.h"

#include <memory>
#include <string>
#include <vector>

namespace docsum {

// Configuration for recursive text chunking. Sizes are in estimated tokens.
struct ChunkerOptions {
    int chunk_size = 3000;
    int chunk_overlap = 500;
    std::vector<std::string> separators = default_separators();
    bool keep_separator = true;
    std::vector<SpecialPattern> special_patterns = default_special_patterns();

    // Paragraph breaks down to single characters, tuned for prose.
    static std::vector<std::string> default_separators();

    // Heading markers "## " through "###### " ahead of the generic breaks.
    static ChunkerOptions for_markdown(int chunk_size = 3000, int chunk_overlap = 500);

    // Statement and block delimiters ahead of whitespace.
    static ChunkerOptions for_code(int chunk_size = 3000, int chunk_overlap = 500);
};

// A chunk with its position in the document. overlap_length is the number of
// leading bytes copied from the end of the previous chunk.
struct Chunk {
    size_t index = 0;
    std::string text;
    int token_estimate = 0;
    size_t overlap_length = 0;

    std::string text_without_overlap() const {
        return text.substr(overlap_length);
    }
};

// Looks for markdown structure (headings, lists, code, links, emphasis,
// quotes, tables) in the first 5000 bytes.
bool contains_markdown(const std::string& text);

/**
 * Splits text into ordered, size-bounded chunks.
 *
 * Structural regions (code fences, list items, headers) are isolated first and
 * re-packed up to the budget. Text without such regions is split on the
 * strongest separator that yields more than one fragment, descending to weaker
 * separators only for fragments that are still over budget. The empty
 * separator, when last in the list, slices into fixed character widths.
 * Every chunk after the first is prefixed with the tail of its predecessor.
 *
 * Throws std::invalid_argument when chunk_size <= 0, chunk_overlap < 0 or
 * chunk_overlap >= chunk_size.
 */
class TextChunker {
public:
    explicit TextChunker(const ChunkerOptions& options = ChunkerOptions{});
    ~TextChunker();

    TextChunker(TextChunker&&) noexcept;
    TextChunker& operator=(TextChunker&&) noexcept;

    std::vector<std::string> split_text(const std::string& text) const;

    std::vector<Chunk> split_chunks(const std::string& text) const;

    const ChunkerOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace docsum
