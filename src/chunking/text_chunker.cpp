#include <quarry/chunking/text_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace quarry::chunking {

namespace {

constexpr std::array<std::string_view, 12> kAbbreviations = {
    "Dr", "Mr", "Mrs", "Ms", "Jr", "Sr", "St", "Prof", "vs", "etc", "e.g", "i.e"};

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Largest position <= pos that does not fall inside a UTF-8 sequence
size_t utf8Floor(std::string_view text, size_t pos) {
    while (pos > 0 && pos < text.size() && isContinuationByte(text[pos])) {
        --pos;
    }
    return pos;
}

TextSpan trimmed(std::string_view text, size_t start, size_t end) {
    while (start < end && isBlank(text[start])) {
        ++start;
    }
    while (end > start && isBlank(text[end - 1])) {
        --end;
    }
    return {start, end};
}

bool endsWithAbbreviation(std::string_view text, size_t dot) {
    size_t begin = dot;
    while (begin > 0 && (std::isalpha(static_cast<unsigned char>(text[begin - 1])) ||
                         text[begin - 1] == '.')) {
        --begin;
    }
    auto word = text.substr(begin, dot - begin);
    if (word.size() == 1 && std::isupper(static_cast<unsigned char>(word[0]))) {
        return true; // initials such as "J. Smith"
    }
    return std::find(kAbbreviations.begin(), kAbbreviations.end(), word) != kAbbreviations.end();
}

// True when a blank line starts at pos; runEnd is set past the whitespace run
bool blankLineAt(std::string_view text, size_t pos, size_t& runEnd) {
    if (text[pos] != '\n') {
        return false;
    }
    size_t i = pos + 1;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\r')) {
        ++i;
    }
    if (i < text.size() && text[i] == '\n') {
        while (i < text.size() && isBlank(text[i])) {
            ++i;
        }
        runEnd = i;
        return true;
    }
    return false;
}

size_t countTokens(std::string_view text) {
    size_t tokens = 0;
    bool inToken = false;
    for (char c : text) {
        if (isBlank(c)) {
            inToken = false;
        } else if (!inToken) {
            inToken = true;
            ++tokens;
        }
    }
    return tokens;
}

} // namespace

Result<void> TextChunker::validate(const ChunkingConfig& config) {
    if (config.maxChars == 0) {
        return Error{ErrorCode::Validation, "chunking.max_chars must be greater than zero"};
    }
    if (config.maxOverlap >= config.maxChars) {
        return Error{ErrorCode::Validation,
                     "chunking.max_overlap (" + std::to_string(config.maxOverlap) +
                         ") must be smaller than chunking.max_chars (" +
                         std::to_string(config.maxChars) + ")"};
    }
    return {};
}

std::vector<TextSpan> TextChunker::splitSentences(std::string_view text) {
    std::vector<TextSpan> out;
    size_t start = 0;
    auto emit = [&](size_t end) {
        auto span = trimmed(text, start, end);
        if (span.size() > 0) {
            out.push_back(span);
        }
    };
    for (size_t i = 0; i < text.size(); ++i) {
        size_t runEnd = 0;
        if (blankLineAt(text, i, runEnd)) {
            emit(i);
            start = runEnd;
            i = runEnd - 1;
            continue;
        }
        const char c = text[i];
        if (c != '.' && c != '!' && c != '?') {
            continue;
        }
        // Swallow closing punctuation: ?!, ..., quotes and brackets
        size_t end = i + 1;
        while (end < text.size() && (text[end] == '.' || text[end] == '!' || text[end] == '?' ||
                                     text[end] == '"' || text[end] == '\'' || text[end] == ')')) {
            ++end;
        }
        if (end < text.size() && !isBlank(text[end])) {
            i = end - 1;
            continue;
        }
        if (c == '.' && end == i + 1 && endsWithAbbreviation(text, i)) {
            continue;
        }
        emit(end);
        start = end;
        i = end - 1;
    }
    emit(text.size());
    return out;
}

std::vector<TextSpan> TextChunker::splitParagraphs(std::string_view text) {
    std::vector<TextSpan> out;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        size_t runEnd = 0;
        if (blankLineAt(text, i, runEnd)) {
            auto span = trimmed(text, start, i);
            if (span.size() > 0) {
                out.push_back(span);
            }
            start = runEnd;
            i = runEnd - 1;
        }
    }
    auto last = trimmed(text, start, text.size());
    if (last.size() > 0) {
        out.push_back(last);
    }
    return out;
}

std::vector<PageRange> TextChunker::locatePages(std::string_view content,
                                                const std::vector<PageContent>& pages) {
    std::vector<PageRange> out;
    size_t cursor = 0;
    for (const auto& page : pages) {
        if (page.content.empty()) {
            continue;
        }
        auto pos = content.find(page.content, cursor);
        if (pos == std::string_view::npos) {
            continue;
        }
        out.push_back({page.pageNumber, pos, pos + page.content.size()});
        cursor = pos + page.content.size();
    }
    return out;
}

std::vector<TextSpan> TextChunker::characterWindows(std::string_view text) const {
    std::vector<TextSpan> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = std::min(text.size(), start + config_.maxChars);
        if (end < text.size()) {
            end = utf8Floor(text, end);
            // Prefer breaking after whitespace in the back half of the window
            for (size_t i = end; i > start + config_.maxChars / 2; --i) {
                if (isBlank(text[i - 1])) {
                    end = i;
                    break;
                }
            }
            if (end <= start) {
                // A single sequence wider than the window; take it whole
                end = start + 1;
                while (end < text.size() && isContinuationByte(text[end])) {
                    ++end;
                }
            }
        }
        out.push_back({start, end});
        if (end >= text.size()) {
            break;
        }
        size_t next = end > config_.maxOverlap ? utf8Floor(text, end - config_.maxOverlap) : 0;
        start = next > start ? next : end;
    }
    return out;
}

std::vector<TextSpan> TextChunker::packUnits(const std::vector<TextSpan>& units) const {
    std::vector<TextSpan> out;
    size_t first = 0;
    while (first < units.size()) {
        size_t last = first + 1;
        while (last < units.size() && units[last].end - units[first].start <= config_.maxChars) {
            ++last;
        }
        out.push_back({units[first].start, units[last - 1].end});
        if (last >= units.size()) {
            break;
        }
        // Carry whole trailing units that fit in the overlap budget, as long as
        // the next chunk still has room for the first unit not yet emitted
        size_t next = last;
        while (next - 1 > first &&
               units[last - 1].end - units[next - 1].start <= config_.maxOverlap &&
               units[last].end - units[next - 1].start <= config_.maxChars) {
            --next;
        }
        first = next;
    }
    return out;
}

Result<std::vector<Chunk>> TextChunker::chunk(std::string_view text,
                                              const std::vector<PageRange>& pages) const {
    if (auto valid = validate(config_); !valid) {
        return valid.error();
    }

    std::vector<TextSpan> spans;
    switch (config_.strategy) {
        case ChunkingStrategy::Characters:
            spans = characterWindows(text);
            break;
        case ChunkingStrategy::Sentence:
            spans = packUnits(splitSentences(text));
            break;
        case ChunkingStrategy::Paragraph:
            spans = packUnits(splitParagraphs(text));
            break;
    }

    std::vector<Chunk> chunks;
    chunks.reserve(spans.size());
    for (const auto& span : spans) {
        Chunk c;
        c.content = std::string(text.substr(span.start, span.size()));
        c.byteStart = span.start;
        c.byteEnd = span.end;
        c.tokenCount = countTokens(c.content);
        c.chunkIndex = chunks.size();
        for (const auto& page : pages) {
            if (page.start < span.end && span.start < page.end) {
                if (!c.firstPage) {
                    c.firstPage = page.pageNumber;
                }
                c.lastPage = page.pageNumber;
            }
        }
        chunks.push_back(std::move(c));
    }
    for (auto& c : chunks) {
        c.totalChunks = chunks.size();
    }
    spdlog::debug("Chunked {} bytes into {} chunks ({})", text.size(), chunks.size(),
                  toString(config_.strategy));
    return chunks;
}

} // namespace quarry::chunking
