#pragma once

#include <quarry/extraction/document_extractor.h>

#include <string>
#include <string_view>
#include <vector>

namespace quarry::extraction {

/**
 * @brief Extractor for plain text and text-based structured formats.
 *
 * Content is decoded to UTF-8. CSV and TSV inputs additionally yield a Table.
 */
class PlainTextExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "plain_text"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

    // RFC 4180 style: quoted fields, doubled quotes, embedded separators/newlines
    static std::vector<std::vector<std::string>> parseDelimited(std::string_view text,
                                                                char separator);
};

} // namespace quarry::extraction
