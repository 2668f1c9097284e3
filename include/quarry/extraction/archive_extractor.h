#pragma once

#include <quarry/extraction/archive_reader.h>
#include <quarry/extraction/document_extractor.h>

#include <optional>
#include <string>

namespace quarry::extraction {

// Decoded member text kept per archive; later members are listed but not read
inline constexpr size_t kMaxArchiveTextBytes = 64 * 1024 * 1024;

/**
 * @brief ZIP, TAR, gzip and 7z archives.
 *
 * The entry listing goes to metadata ("archive_format", "file_count",
 * "total_size", "files"). Members whose extension names a text format are
 * decoded and appended to the content under a "--- path ---" header. A gzip
 * stream holding a tar is read as a tar; a lone gzip stream is one member
 * named after the original file name in its header.
 */
class ArchiveExtractor : public DocumentExtractor {
public:
    std::string name() const override { return "archive"; }
    std::vector<std::string> supportedMimeTypes() const override;

    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

    // FNAME field of a gzip member header
    static std::optional<std::string> gzipOriginalName(std::span<const std::byte> data);
};

} // namespace quarry::extraction
