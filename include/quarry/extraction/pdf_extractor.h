#pragma once

#include <quarry/extraction/document_extractor.h>

#include <string>
#include <string_view>

// Forward declarations for QPDF
class QPDF;
class QPDFPageObjectHelper;

namespace quarry::extraction {

/**
 * @brief Text, metadata and page breakdown of PDF documents, built on QPDF.
 *
 * Text comes from the page content streams' text-showing operators. Each page
 * also gets an estimate of how much of its area carries text and whether it
 * draws images, which the OCR orchestrator uses to decide per-page OCR.
 * Encrypted documents are opened with an empty password first, then with each
 * configured password.
 */
class PdfExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "pdf"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

    // "D:20240131235959+01'00'" -> "2024-01-31T23:59:59+01:00"
    static std::string normalizePdfDate(std::string_view value);

private:
    void extractMetadata(QPDF& pdf, ExtractionResult& result);
    PageContent extractPage(QPDFPageObjectHelper& page, size_t pageNumber,
                            ExtractionResult& result, bool extractImages);
};

} // namespace quarry::extraction
