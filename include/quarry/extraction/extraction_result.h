#pragma once

#include <quarry/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

/**
 * @brief Common document metadata plus an open-ended map.
 *
 * `additional` holds format-specific and plugin-injected fields. It must be a
 * JSON object; its keys are serialized next to the common fields and any key
 * that is not a common field is read back into it.
 */
struct Metadata {
    std::optional<std::string> title;
    std::vector<std::string> authors;
    std::optional<std::string> language;
    std::optional<std::string> createdAt;
    std::optional<std::string> modifiedAt;
    std::optional<std::string> subject;
    std::vector<std::string> keywords;
    nlohmann::json additional = nlohmann::json::object();

    void set(const std::string& key, nlohmann::json value) { additional[key] = std::move(value); }
    [[nodiscard]] bool has(const std::string& key) const { return additional.contains(key); }

    [[nodiscard]] nlohmann::json toJson() const;
    static Metadata fromJson(const nlohmann::json& j);
};

struct Table {
    std::vector<std::vector<std::string>> cells; // row-major
    std::string markdown;
    std::optional<size_t> pageNumber;

    [[nodiscard]] nlohmann::json toJson() const;
    static Table fromJson(const nlohmann::json& j);
};

struct Chunk {
    std::string content;
    size_t byteStart = 0;
    size_t byteEnd = 0;
    std::optional<size_t> tokenCount;
    size_t chunkIndex = 0;
    size_t totalChunks = 0;
    std::optional<size_t> firstPage;
    std::optional<size_t> lastPage;
    std::optional<std::vector<float>> embedding;

    [[nodiscard]] nlohmann::json toJson() const;
    static Chunk fromJson(const nlohmann::json& j);
};

struct ExtractedImage {
    std::vector<uint8_t> data;
    std::string format; // "png", "jpeg", ...
    size_t imageIndex = 0;
    std::optional<size_t> pageNumber;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<std::string> ocrText;

    [[nodiscard]] nlohmann::json toJson() const;
    static Result<ExtractedImage> fromJson(const nlohmann::json& j);
};

struct PageContent {
    size_t pageNumber = 0; // 1-based
    std::string content;
    std::vector<Table> tables;
    bool hasVisualContent = false;
    // Fraction of the page area carrying text; nullopt when unknown
    std::optional<double> textCoverage;

    [[nodiscard]] nlohmann::json toJson() const;
    static PageContent fromJson(const nlohmann::json& j);
};

struct Keyword {
    std::string text;
    double score = 0.0;
    std::string algorithm;
    std::vector<size_t> positions; // byte offsets into content

    [[nodiscard]] nlohmann::json toJson() const;
    static Keyword fromJson(const nlohmann::json& j);
};

struct ProcessingWarning {
    std::string source;
    std::string message;
};

/**
 * @brief Result of one extraction run.
 *
 * `content` is always present, possibly empty. Collection fields that were
 * not requested stay empty or unset; they never disappear once set.
 */
struct ExtractionResult {
    std::string content;
    std::string mimeType;
    Metadata metadata;
    std::vector<Table> tables;
    std::optional<std::vector<Chunk>> chunks;
    std::optional<std::vector<ExtractedImage>> images;
    std::optional<std::vector<PageContent>> pages;
    std::optional<std::vector<std::string>> detectedLanguages;
    std::optional<std::vector<Keyword>> keywords;
    std::optional<double> qualityScore;
    std::vector<ProcessingWarning> warnings;

    void addWarning(std::string source, std::string message) {
        warnings.push_back({std::move(source), std::move(message)});
    }

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static Result<ExtractionResult> fromJson(const nlohmann::json& j);
};

} // namespace quarry
