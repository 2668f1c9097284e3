#pragma once

#include <quarry/extraction/document_extractor.h>

#include <cstdint>
#include <optional>

namespace quarry::extraction {

struct ImageInfo {
    std::string format;
    uint32_t width = 0;
    uint32_t height = 0;
};

/**
 * @brief Raster images carry no text layer.
 *
 * The result has empty content and one page flagged as visual content, so the
 * OCR orchestrator picks it up. Dimensions come from the format header.
 */
class ImageExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "image"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

    // Reads width/height from PNG, JPEG, GIF, BMP and WEBP headers
    static std::optional<ImageInfo> probe(std::span<const std::byte> data);
};

} // namespace quarry::extraction
