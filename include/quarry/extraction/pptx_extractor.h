#pragma once

#include <quarry/extraction/document_extractor.h>

namespace quarry::extraction {

// PowerPoint (OOXML): one page per slide, slides in numeric order
class PptxExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "pptx"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;
};

} // namespace quarry::extraction
