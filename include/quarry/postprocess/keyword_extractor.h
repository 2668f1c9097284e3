#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/extraction/extraction_result.h>

#include <string>
#include <string_view>
#include <vector>

namespace quarry::postprocess {

/**
 * @brief Keyword and keyphrase extraction.
 *
 * Frequency: candidate n-grams of non-stopwords, scored by term frequency
 * boosted by each word's co-occurrence degree within `windowSize`.
 * Cooccurrence: RAKE-style phrases delimited by stopwords and punctuation,
 * scored by the sum of word degree/frequency ratios.
 * Scores are normalized so the best keyword scores 1.0.
 */
class KeywordExtractor {
public:
    static std::vector<Keyword> extract(std::string_view text, const KeywordConfig& config,
                                        std::string_view language = "eng");

    // Pipeline stage: language from config, else detected language, else English
    static void apply(ExtractionResult& result, const KeywordConfig& config);
};

} // namespace quarry::postprocess
