#pragma once

#include <quarry/extraction/document_extractor.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace quarry::extraction {

// Ceiling on cells materialized as a dense grid from a sheet's declared <dimension>
inline constexpr uint64_t kMaxDenseCells = 1'000'000;

struct CellRef {
    uint32_t row = 0; // 1-based
    uint32_t col = 0; // 1-based
};

struct SheetDimension {
    CellRef first;
    CellRef last;

    // Saturating row span * column span
    [[nodiscard]] uint64_t cellCount() const;
};

/**
 * @brief Excel (OOXML) workbooks: every sheet becomes a Table and a markdown block.
 *
 * The <dimension> a sheet declares is an untrusted upper bound. When it implies
 * more than kMaxDenseCells cells, the sheet is assembled from the cells actually
 * present instead of a grid of the declared extent.
 */
class XlsxExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "xlsx"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

    // "B12" -> {12, 2}; nullopt for malformed or out-of-range references
    static std::optional<CellRef> parseCellReference(std::string_view ref);
    // "A1:XFD1048575" or a single cell "A1"
    static std::optional<SheetDimension> parseDimension(std::string_view ref);
    // 1 -> "A", 28 -> "AB"
    static std::string columnName(uint32_t col);
};

} // namespace quarry::extraction
