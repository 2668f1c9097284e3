#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace quarry::postprocess {

struct WordToken {
    std::string lower; // ASCII-lowercased
    size_t offset = 0; // byte offset into the source text
    size_t length = 0;
};

// Letters, digits, apostrophes and any non-ASCII UTF-8 sequence form words
std::vector<WordToken> tokenizeWords(std::string_view text);

std::string toLowerAscii(std::string_view text);

// Languages with a stopword list, as ISO 639-3 codes
const std::vector<std::string>& stopwordLanguages();

/**
 * @brief Stopwords for an ISO 639-1 or 639-3 code ("en" or "eng").
 *
 * Unknown codes fall back to English.
 */
const std::unordered_set<std::string>& stopwords(std::string_view language);

// "en" -> "eng"; three-letter codes pass through lowercased
std::string toIso639_3(std::string_view language);

} // namespace quarry::postprocess
