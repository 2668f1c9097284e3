#pragma once

#include <quarry/extraction/document_extractor.h>

namespace quarry::extraction {

/**
 * @brief Word (OOXML) documents: body paragraphs and tables in document order.
 *
 * Headings (Heading1..6 / Title styles) are tracked in metadata so the
 * markdown output can reproduce them.
 */
class DocxExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "docx"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;
};

} // namespace quarry::extraction
