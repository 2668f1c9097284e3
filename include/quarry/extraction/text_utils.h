#pragma once

#include <quarry/core/types.h>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::extraction {

/**
 * @brief Encoding detection utilities
 */
class EncodingDetector {
public:
    /**
     * @brief Detect text encoding from a buffer
     * @param data Data buffer to analyze
     * @param confidence Confidence level (0.0-1.0)
     * @return Detected encoding name ("UTF-8", "UTF-16LE", "UTF-16BE", "ISO-8859-1")
     */
    static std::string detectEncoding(std::span<const std::byte> data,
                                      double* confidence = nullptr);

    /**
     * @brief Convert text from one encoding to UTF-8
     */
    static Result<std::string> convertToUtf8(std::string_view text,
                                             const std::string& fromEncoding);
};

struct DecodedText {
    std::string text;
    std::string encoding;
    double confidence = 0.0;
};

// Detects the encoding, converts to UTF-8 and strips a UTF-8 BOM
Result<DecodedText> decodeText(std::span<const std::byte> data);

inline std::string_view asStringView(std::span<const std::byte> data) {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

// GitHub-flavored markdown; the first row is the header
std::string renderMarkdownTable(const std::vector<std::vector<std::string>>& rows);

// Collapses runs of spaces/tabs, trims lines, and keeps at most one blank line
std::string normalizeWhitespace(std::string_view text);

void appendUtf8(uint32_t codepoint, std::string& out);

// Substitutes every "{page_num}" in @p format
std::string formatPageMarker(std::string_view format, size_t pageNumber);

} // namespace quarry::extraction
