#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/extraction/extraction_result.h>

#include <string>
#include <string_view>

namespace quarry::postprocess {

/**
 * @brief Shrinks content for token-limited consumers.
 *
 * Light: whitespace and invisible characters. Moderate: also stopwords
 * (capitalized words and numbers kept when preserveImportantWords is set).
 * Aggressive: all stopwords, repeated words and punctuation runs.
 * Every mode is idempotent: reduce(reduce(x)) == reduce(x).
 */
class TokenReducer {
public:
    static std::string reduce(std::string_view text, const TokenReductionConfig& config,
                              std::string_view language = "eng");

    static void apply(ExtractionResult& result, const TokenReductionConfig& config);
};

} // namespace quarry::postprocess
