#include <quarry/core/mime.h>
#include <quarry/extraction/archive_extractor.h>
#include <quarry/extraction/docx_extractor.h>
#include <quarry/extraction/extractor_registry.h>
#include <quarry/extraction/html_extractor.h>
#include <quarry/extraction/image_extractor.h>
#include <quarry/extraction/pdf_extractor.h>
#include <quarry/extraction/plain_text_extractor.h>
#include <quarry/extraction/pptx_extractor.h>
#include <quarry/extraction/xlsx_extractor.h>
#include <quarry/plugins/plugin_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace quarry::extraction {

BuiltinExtractors::BuiltinExtractors() {
    registerExtractor(std::make_shared<PlainTextExtractor>());
    registerExtractor(std::make_shared<HtmlExtractor>());
    registerExtractor(std::make_shared<PdfExtractor>());
    registerExtractor(std::make_shared<DocxExtractor>());
    registerExtractor(std::make_shared<PptxExtractor>());
    registerExtractor(std::make_shared<XlsxExtractor>());
    registerExtractor(std::make_shared<ImageExtractor>());
    registerExtractor(std::make_shared<ArchiveExtractor>());

    if (spdlog::should_log(spdlog::level::debug)) {
        std::string typeList;
        for (const auto& [type, _] : byMime_) {
            if (!typeList.empty()) {
                typeList += ", ";
            }
            typeList += type;
        }
        spdlog::debug("Built-in extractors cover {} media types: {}", byMime_.size(), typeList);
    }
}

BuiltinExtractors& BuiltinExtractors::instance() {
    static BuiltinExtractors instance;
    return instance;
}

void BuiltinExtractors::registerExtractor(std::shared_ptr<DocumentExtractor> extractor) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& type : extractor->supportedMimeTypes()) {
        byMime_[mime::normalize(type)] = extractor;
    }
}

std::shared_ptr<DocumentExtractor> BuiltinExtractors::find(const std::string& mimeType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byMime_.find(mime::normalize(mimeType));
    return it == byMime_.end() ? nullptr : it->second;
}

std::vector<std::string> BuiltinExtractors::supportedMimeTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(byMime_.size());
    for (const auto& [type, _] : byMime_) {
        types.push_back(type);
    }
    return types;
}

bool BuiltinExtractors::isSupported(const std::string& mimeType) const {
    return find(mimeType) != nullptr;
}

Result<ResolvedExtractor> ExtractorRegistry::resolve(const std::string& mimeType) const {
    const auto normalized = mime::normalize(mimeType);
    if (auto plugin = plugins_.extractorFor(normalized)) {
        spdlog::debug("Using plugin extractor '{}' for {}", plugin->name, normalized);
        return ResolvedExtractor{std::move(plugin->plugin), std::move(plugin->name), true};
    }
    if (auto builtin = builtins_.find(normalized)) {
        std::string name = builtin->name();
        return ResolvedExtractor{std::move(builtin), std::move(name), false};
    }
    return Error{ErrorCode::UnsupportedFormat, "Unsupported mime type: " + normalized};
}

std::vector<std::string> ExtractorRegistry::supportedMimeTypes() const {
    std::set<std::string> types;
    for (auto& type : builtins_.supportedMimeTypes()) {
        types.insert(std::move(type));
    }
    for (const auto& type : plugins_.extractorMimeTypes()) {
        types.insert(mime::normalize(type));
    }
    return {types.begin(), types.end()};
}

} // namespace quarry::extraction
