#pragma once

#include <quarry/extraction/document_extractor.h>

#include <string>
#include <vector>

namespace quarry::extraction {

/**
 * @brief HTML to readable text, similar to a browser "reader mode".
 *
 * Script, style and comment blocks are dropped, block-level tags become line
 * breaks, entities are decoded. `<table>` elements are also returned as
 * Table values; `<title>` and description/keywords/author meta tags fill
 * Metadata.
 */
class HtmlExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "html"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

    static std::string extractTextFromHtml(const std::string& html);
    static std::string decodeHtmlEntities(const std::string& text);
    static std::string extractTitle(const std::string& html);
    static std::string extractMetaContent(const std::string& html, const std::string& metaName);
    static std::vector<Table> extractTables(const std::string& html);

private:
    static std::string removeScriptAndStyle(const std::string& html);
    static std::string convertBlockTagsToNewlines(const std::string& html);
    static std::string stripHtmlTags(const std::string& html);
    static std::string cleanWhitespace(const std::string& text);
};

} // namespace quarry::extraction
