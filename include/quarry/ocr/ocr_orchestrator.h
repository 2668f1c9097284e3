#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>
#include <quarry/ocr/ocr_backend.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quarry::plugins {
class PluginRegistry;
}

namespace quarry::ocr {

enum class OcrState { NotNeeded, Required, Running, Succeeded, Failed };

enum class OcrReason {
    Forced,        ///< ExtractionConfig::forceOcr
    ImageInput,    ///< Raster input without a text layer
    NoTextOnPage,  ///< Near-zero text on a page that draws images
    LowCoverage    ///< Page text coverage below the configured threshold
};

const char* toString(OcrState state);
const char* toString(OcrReason reason);

struct OcrDecision {
    OcrState state = OcrState::NotNeeded;
    std::optional<OcrReason> reason;
    // 1-based pages to recognize; empty with Required means the whole input
    std::vector<size_t> pages;

    [[nodiscard]] bool required() const { return state == OcrState::Required; }
};

// Pages with less trimmed text than this count as empty
inline constexpr size_t kMinPageTextChars = 16;

/**
 * @brief Built-in OCR engines, created on first use.
 */
class BuiltinOcrBackends {
public:
    static BuiltinOcrBackends& instance();

    std::shared_ptr<OcrBackend> find(const std::string& name);
    std::vector<std::string> names() const;

private:
    BuiltinOcrBackends() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<OcrBackend>> created_;
};

/**
 * @brief Decides when OCR is needed, runs it, and merges the text back.
 *
 * Without forceOcr, an OCR failure degrades the result: a warning with source
 * "ocr" is attached and metadata "ocr_status" becomes "failed", which the
 * quality stage penalizes. With forceOcr the failure is returned as an error.
 */
class OcrOrchestrator {
public:
    explicit OcrOrchestrator(const plugins::PluginRegistry& plugins,
                             BuiltinOcrBackends& builtins = BuiltinOcrBackends::instance())
        : plugins_(plugins), builtins_(builtins) {}

    // forceOcr only applies to raster and PDF inputs; other formats keep their text layer
    OcrDecision decide(const ExtractionResult& result, const ExtractionConfig& config) const;

    // Plugin backends first, then built-ins; unknown names are MissingDependency
    Result<std::shared_ptr<OcrBackend>> resolveBackend(const std::string& name) const;

    Result<OcrResult> run(std::span<const std::byte> image, const std::string& language,
                          const std::string& backendName) const;

    /**
     * @brief decide() then run() on the page images and merge.
     *
     * @param input Original input bytes; used as the image for raster inputs.
     */
    Result<OcrState> process(ExtractionResult& result, std::span<const std::byte> input,
                             const ExtractionConfig& config) const;

    // True when extraction should keep embedded page images for OCR
    static bool needsPageImages(const ExtractionConfig& config);

private:
    Result<void> recognizePages(ExtractionResult& result, std::span<const std::byte> input,
                                const OcrDecision& decision, const ExtractionConfig& config) const;

    const plugins::PluginRegistry& plugins_;
    BuiltinOcrBackends& builtins_;
};

} // namespace quarry::ocr
