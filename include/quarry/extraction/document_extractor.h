#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>
#include <quarry/plugins/plugin.h>

#include <span>
#include <string>
#include <vector>

namespace quarry::extraction {

// Priority of built-in extractors; plugins default above it
inline constexpr int32_t kBuiltinPriority = 50;
inline constexpr int32_t kDefaultPluginPriority = 60;

/**
 * @brief Turns the bytes of one media type into an ExtractionResult.
 *
 * Implementations must treat sizes, offsets and dimensions declared inside the
 * document as untrusted upper bounds, never as allocation sizes.
 */
class DocumentExtractor : public plugins::Plugin {
public:
    virtual std::vector<std::string> supportedMimeTypes() const = 0;

    virtual Result<ExtractionResult> extract(std::span<const std::byte> data,
                                             const std::string& mimeType,
                                             const ExtractionConfig& config) = 0;

    bool supports(const std::string& mimeType) const;
};

// Page texts joined by a blank line or by the configured page markers
std::string joinPageContent(const std::vector<PageContent>& pages, const ExtractionConfig& config);

/**
 * @brief Sets result.content from the pages.
 *
 * Page tables are appended to result.tables.
 * The page breakdown is kept in result.pages when `pages.extractPages` is set
 * or when @p keepPages is true (pages needed later for OCR decisions).
 */
void assemblePages(ExtractionResult& result, std::vector<PageContent> pages,
                   const ExtractionConfig& config, bool keepPages = false);

} // namespace quarry::extraction
