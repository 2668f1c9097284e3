#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/extraction/extraction_result.h>

#include <string>
#include <string_view>
#include <vector>

namespace quarry::postprocess {

struct LanguageScore {
    std::string language; // ISO 639-3
    double confidence = 0.0;
    size_t hits = 0;
};

/**
 * @brief Stopword-profile language identification.
 *
 * Only stopwords unique to one language count, so confidence is the share of
 * distinctive hits won by the best language.
 */
class LanguageDetector {
public:
    // Texts with fewer distinctive hits are reported as undetermined
    static constexpr size_t kMinHits = 3;

    // Scores sorted by confidence, highest first; empty when undetermined
    static std::vector<LanguageScore> score(std::string_view text);

    // Languages passing the gate; several when detectMultiple is set
    static std::vector<std::string> detect(std::string_view text,
                                           const LanguageDetectionConfig& config);

    // Pipeline stage: sets detectedLanguages and fills metadata.language when empty
    static void apply(ExtractionResult& result, const LanguageDetectionConfig& config);
};

} // namespace quarry::postprocess
