#pragma once

#include <quarry/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::detection {

/**
 * @brief Binary signature: every segment must match at its offset
 */
struct FilePattern {
    struct Segment {
        size_t offset = 0;
        std::vector<std::byte> bytes;
    };
    std::vector<Segment> segments;
    std::string mimeType;
    std::string description;
    float confidence = 1.0f;
};

/**
 * @brief How a classification was reached
 */
enum class DetectionSource {
    Magic,     ///< Binary signature
    Container, ///< ZIP entry names / ODF mimetype entry
    TextSniff, ///< Leading text markers (XML, HTML, JSON)
    LibMagic,  ///< libmagic database
    Declared,  ///< Caller-declared MIME, consistent with the bytes
    Extension  ///< Path extension
};

const char* toString(DetectionSource source);

struct Classification {
    std::string mimeType;
    DetectionSource source = DetectionSource::Magic;
    float confidence = 0.0f;
    bool isBinary = true;
    // Set when a declared MIME or extension disagreed with the bytes and was overridden
    std::optional<std::string> overriddenHint;
};

struct ClassifierConfig {
    bool useLibMagic = true;
    size_t maxBytesToRead = SNIFF_PREFIX_SIZE;
    // Bytes read from the end of a ZIP file to reach its central directory
    size_t zipTailBytes = 64 * 1024;
    bool cacheResults = true;
    size_t cacheSize = 1000;
};

/**
 * @brief Canonical media type detection.
 *
 * Byte signatures are authoritative. A path extension or caller-declared MIME
 * type only refines a generic sniff (plain text, bare ZIP, OLE2, unknown
 * binary) or stands in when no bytes are available. When a hint disagrees
 * with a specific sniffed type, the sniffed type wins and the hint is logged.
 */
class FormatClassifier {
public:
    explicit FormatClassifier(ClassifierConfig config = {});
    ~FormatClassifier();

    FormatClassifier(const FormatClassifier&) = delete;
    FormatClassifier& operator=(const FormatClassifier&) = delete;

    // Shared instance with default configuration
    static FormatClassifier& instance();

    Result<Classification> classify(std::span<const std::byte> bytes,
                                    const std::optional<std::filesystem::path>& pathHint = {},
                                    const std::optional<std::string>& declaredMime = {}) const;

    // Reads the leading bytes (and a ZIP's central directory) before classifying
    Result<Classification> classifyFile(const std::filesystem::path& path,
                                        const std::optional<std::string>& declaredMime = {}) const;

    // Byte-only detection; nullopt when nothing is recognizable
    std::optional<Classification> sniff(std::span<const std::byte> bytes) const;

    /**
     * @brief MIME type for an extension (with or without dot)
     * @return "application/octet-stream" when the extension is unknown
     */
    static std::string mimeFromExtension(std::string_view extension);

    static bool isBinaryData(std::span<const std::byte> data);

    struct CacheStats {
        size_t hits = 0;
        size_t misses = 0;
        size_t entries = 0;
    };
    CacheStats cacheStats() const;
    void clearCache();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace quarry::detection
