#include <quarry/core/mime.h>
#include <quarry/extraction/document_extractor.h>
#include <quarry/extraction/text_utils.h>

#include <algorithm>

namespace quarry::extraction {

bool DocumentExtractor::supports(const std::string& mimeType) const {
    const auto wanted = mime::normalize(mimeType);
    const auto types = supportedMimeTypes();
    return std::any_of(types.begin(), types.end(),
                       [&](const std::string& t) { return mime::normalize(t) == wanted; });
}

std::string joinPageContent(const std::vector<PageContent>& pages, const ExtractionConfig& config) {
    const PageConfig pageConfig = config.pages.value_or(PageConfig{});
    std::string content;
    for (const auto& page : pages) {
        if (pageConfig.insertPageMarkers) {
            content += formatPageMarker(pageConfig.markerFormat, page.pageNumber);
        } else if (!content.empty() && !page.content.empty()) {
            content += "\n\n";
        }
        content += page.content;
    }
    return content;
}

void assemblePages(ExtractionResult& result, std::vector<PageContent> pages,
                   const ExtractionConfig& config, bool keepPages) {
    const PageConfig pageConfig = config.pages.value_or(PageConfig{});
    for (const auto& page : pages) {
        for (const auto& table : page.tables) {
            result.tables.push_back(table);
        }
    }
    result.content = joinPageContent(pages, config);
    result.metadata.set("page_count", pages.size());
    if (pageConfig.extractPages || keepPages) {
        result.pages = std::move(pages);
    }
}

} // namespace quarry::extraction
