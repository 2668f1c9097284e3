#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>

#include <string>
#include <string_view>
#include <vector>

namespace quarry::chunking {

// Half-open byte range [start, end) of a unit inside the chunked text
struct TextSpan {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] size_t size() const { return end - start; }
};

// Byte range of one page's text within the joined content
struct PageRange {
    size_t pageNumber = 0;
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief Splits content into overlapping chunks.
 *
 * Characters mode cuts windows of at most maxChars bytes, never inside a UTF-8
 * sequence, preferring a whitespace break in the second half of the window.
 * Sentence and paragraph modes pack whole units greedily; a unit longer than
 * maxChars becomes a chunk of its own and is never split. Overlap between
 * consecutive chunks is at most maxOverlap bytes (whole units in the
 * unit-based modes).
 *
 * Every chunk's content equals text.substr(byteStart, byteEnd - byteStart).
 */
class TextChunker {
public:
    explicit TextChunker(ChunkingConfig config) : config_(std::move(config)) {}

    // maxChars must be positive and larger than maxOverlap
    static Result<void> validate(const ChunkingConfig& config);

    Result<std::vector<Chunk>> chunk(std::string_view text,
                                     const std::vector<PageRange>& pages = {}) const;

    // Trimmed sentence spans; ". ! ?" followed by whitespace end a sentence,
    // except after common abbreviations. Blank lines also end one.
    static std::vector<TextSpan> splitSentences(std::string_view text);

    // Trimmed paragraph spans separated by blank lines
    static std::vector<TextSpan> splitParagraphs(std::string_view text);

    // Locates each page's content in @p content, in page order
    static std::vector<PageRange> locatePages(std::string_view content,
                                              const std::vector<PageContent>& pages);

private:
    std::vector<TextSpan> characterWindows(std::string_view text) const;
    std::vector<TextSpan> packUnits(const std::vector<TextSpan>& units) const;

    ChunkingConfig config_;
};

} // namespace quarry::chunking
