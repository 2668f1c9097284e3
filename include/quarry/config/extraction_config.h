#pragma once

#include <quarry/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

enum class OutputFormat { Plain, Markdown, Html, Structured };

enum class ChunkingStrategy {
    Characters, // hard character windows
    Sentence,   // never splits a sentence
    Paragraph   // never splits a paragraph
};

enum class KeywordAlgorithm {
    Frequency,   // term frequency with a co-occurrence graph boost
    Cooccurrence // RAKE-style candidate phrases scored by degree/frequency
};

enum class ReductionMode { Off, Light, Moderate, Aggressive };

const char* toString(OutputFormat format);
const char* toString(ChunkingStrategy strategy);
const char* toString(KeywordAlgorithm algorithm);
const char* toString(ReductionMode mode);

struct OcrConfig {
    std::string backend = "tesseract";
    std::string language = "eng";
    // Pages whose text coverage falls below this fraction are re-run through OCR.
    // 0 disables the per-page check.
    double coverageThreshold = 0.0;
};

struct EmbeddingConfig {
    std::string backend = "hashing";
    // Preset name ("fast", "balanced", "quality", "multilingual") or a model id
    std::string model = "balanced";
    bool normalize = true;
    size_t batchSize = 32;
};

struct ChunkingConfig {
    size_t maxChars = 1000;
    size_t maxOverlap = 200;
    ChunkingStrategy strategy = ChunkingStrategy::Characters;
    std::optional<EmbeddingConfig> embedding;
};

struct ImageExtractionConfig {
    bool extractImages = true;
    int32_t targetDpi = 300;
    int32_t maxImageDimension = 4096;
    bool autoAdjustDpi = true;
    int32_t minDpi = 72;
    int32_t maxDpi = 600;
};

struct PdfConfig {
    bool extractImages = false;
    bool extractMetadata = true;
    std::vector<std::string> passwords;
};

struct PageConfig {
    bool extractPages = false;
    bool insertPageMarkers = false;
    std::string markerFormat = "\n\n<!-- PAGE {page_num} -->\n\n";
};

struct LanguageDetectionConfig {
    bool enabled = true;
    double minConfidence = 0.8;
    bool detectMultiple = false;
};

struct KeywordConfig {
    KeywordAlgorithm algorithm = KeywordAlgorithm::Frequency;
    size_t maxKeywords = 10;
    double minScore = 0.0;
    size_t ngramMin = 1;
    size_t ngramMax = 3;
    size_t windowSize = 4;
    std::optional<std::string> language;
};

struct TokenReductionConfig {
    ReductionMode mode = ReductionMode::Off;
    bool preserveImportantWords = true;
};

struct PostProcessorConfig {
    bool enabled = true;
    std::optional<std::set<std::string>> enabledProcessors;
    std::optional<std::set<std::string>> disabledProcessors;

    [[nodiscard]] bool isProcessorEnabled(std::string_view name) const;
};

/**
 * @brief Immutable configuration of one extraction run.
 *
 * Every sub-configuration is optional. A missing sub-configuration means the
 * stage runs with its defaults; stages are disabled only through their
 * explicit `enabled` fields.
 */
struct ExtractionConfig {
    std::optional<OcrConfig> ocr;
    std::optional<ChunkingConfig> chunking;
    std::optional<ImageExtractionConfig> images;
    std::optional<PdfConfig> pdfOptions;
    std::optional<PageConfig> pages;
    std::optional<LanguageDetectionConfig> languageDetection;
    std::optional<KeywordConfig> keywords;
    std::optional<TokenReductionConfig> tokenReduction;
    std::optional<PostProcessorConfig> postprocessor;

    bool useCache = true;
    bool enableQualityProcessing = true;
    bool forceOcr = false;
    std::optional<size_t> maxConcurrentExtractions;
    OutputFormat outputFormat = OutputFormat::Plain;
    // Inputs larger than this are rejected before extraction; 0 means unlimited
    uint64_t maxFileSize = 0;

    [[nodiscard]] OcrConfig effectiveOcr() const { return ocr.value_or(OcrConfig{}); }
    [[nodiscard]] LanguageDetectionConfig effectiveLanguageDetection() const {
        return languageDetection.value_or(LanguageDetectionConfig{});
    }
    [[nodiscard]] PostProcessorConfig effectivePostprocessor() const {
        return postprocessor.value_or(PostProcessorConfig{});
    }
    [[nodiscard]] size_t effectiveConcurrency() const;

    [[nodiscard]] nlohmann::json toJson() const;
    // Accepts snake_case and camelCase keys interchangeably
    [[nodiscard]] static Result<ExtractionConfig> fromJson(const nlohmann::json& j);

    // Canonical serialization used in cache keys
    [[nodiscard]] std::string fingerprint() const;
};

} // namespace quarry
