#include <quarry/plugins/plugin_registry.h>

namespace quarry::plugins {

const char* toString(PluginKind kind) {
    switch (kind) {
        case PluginKind::Validator:
            return "validator";
        case PluginKind::PostProcessor:
            return "post-processor";
        case PluginKind::OcrBackend:
            return "OCR backend";
        case PluginKind::DocumentExtractor:
            return "document extractor";
        case PluginKind::EmbeddingBackend:
            return "embedding backend";
    }
    return "plugin";
}

const char* toString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::Early:
            return "early";
        case ProcessingStage::Middle:
            return "middle";
        case ProcessingStage::Late:
            return "late";
    }
    return "middle";
}

PluginRegistry::PluginRegistry() = default;

PluginRegistry::~PluginRegistry() {
    auto failures = clearAll();
    if (!failures.empty()) {
        spdlog::debug("{} plugin(s) failed to shut down during registry teardown",
                      failures.size());
    }
}

PluginRegistry& PluginRegistry::global() {
    static PluginRegistry registry;
    return registry;
}

Result<void> PluginRegistry::registerValidator(std::shared_ptr<Validator> validator,
                                               int32_t priority) {
    return validators_.add(std::move(validator), priority);
}

Result<void> PluginRegistry::unregisterValidator(const std::string& name) {
    return validators_.remove(name);
}

std::vector<std::string> PluginRegistry::listValidators() const {
    return validators_.list();
}

std::vector<std::string> PluginRegistry::clearValidators() {
    return validators_.clear();
}

Result<void> PluginRegistry::registerPostProcessor(std::shared_ptr<PostProcessor> processor,
                                                   int32_t priority) {
    return postProcessors_.add(std::move(processor), priority);
}

Result<void> PluginRegistry::unregisterPostProcessor(const std::string& name) {
    return postProcessors_.remove(name);
}

std::vector<std::string> PluginRegistry::listPostProcessors() const {
    return postProcessors_.list();
}

std::vector<std::string> PluginRegistry::clearPostProcessors() {
    return postProcessors_.clear();
}

Result<void> PluginRegistry::registerOcrBackend(std::shared_ptr<ocr::OcrBackend> backend,
                                                int32_t priority) {
    return ocrBackends_.add(std::move(backend), priority);
}

Result<void> PluginRegistry::unregisterOcrBackend(const std::string& name) {
    return ocrBackends_.remove(name);
}

std::vector<std::string> PluginRegistry::listOcrBackends() const {
    return ocrBackends_.list();
}

std::vector<std::string> PluginRegistry::clearOcrBackends() {
    return ocrBackends_.clear();
}

Result<void>
PluginRegistry::registerDocumentExtractor(std::shared_ptr<extraction::DocumentExtractor> extractor,
                                          int32_t priority) {
    if (extractor) {
        auto mimeTypes = invokePlugin("<extractor>", "supportedMimeTypes",
                                      [&]() -> Result<std::vector<std::string>> {
                                          return extractor->supportedMimeTypes();
                                      });
        if (!mimeTypes) {
            return mimeTypes.error();
        }
        if (mimeTypes.value().empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Document extractor must declare at least one MIME type"};
        }
    }
    return extractors_.add(std::move(extractor), priority);
}

Result<void> PluginRegistry::unregisterDocumentExtractor(const std::string& name) {
    return extractors_.remove(name);
}

std::vector<std::string> PluginRegistry::listDocumentExtractors() const {
    return extractors_.list();
}

std::vector<std::string> PluginRegistry::clearDocumentExtractors() {
    return extractors_.clear();
}

std::optional<Registration<extraction::DocumentExtractor>>
PluginRegistry::extractorFor(const std::string& mimeType) const {
    for (auto& entry : extractors_.snapshot()) {
        auto supported = invokePlugin(entry.name, "supports", [&]() -> Result<bool> {
            return entry.plugin->supports(mimeType);
        });
        if (supported && supported.value()) {
            return std::move(entry);
        }
    }
    return std::nullopt;
}

Result<void>
PluginRegistry::registerEmbeddingBackend(std::shared_ptr<embedding::EmbeddingBackend> backend,
                                         int32_t priority) {
    return embeddingBackends_.add(std::move(backend), priority);
}

Result<void> PluginRegistry::unregisterEmbeddingBackend(const std::string& name) {
    return embeddingBackends_.remove(name);
}

std::vector<std::string> PluginRegistry::listEmbeddingBackends() const {
    return embeddingBackends_.list();
}

std::vector<std::string> PluginRegistry::clearEmbeddingBackends() {
    return embeddingBackends_.clear();
}

std::vector<std::string> PluginRegistry::extractorMimeTypes() const {
    std::vector<std::string> types;
    for (const auto& entry : extractors_.snapshot()) {
        auto declared = invokePlugin(entry.name, "supportedMimeTypes",
                                     [&]() -> Result<std::vector<std::string>> {
                                         return entry.plugin->supportedMimeTypes();
                                     });
        if (declared) {
            types.insert(types.end(), declared.value().begin(), declared.value().end());
        }
    }
    return types;
}

void PluginRegistry::setWarningObserver(WarningObserver observer) {
    validators_.setWarningObserver(observer);
    postProcessors_.setWarningObserver(observer);
    ocrBackends_.setWarningObserver(observer);
    extractors_.setWarningObserver(observer);
    embeddingBackends_.setWarningObserver(std::move(observer));
}

std::vector<std::string> PluginRegistry::clearAll() {
    std::vector<std::string> failures;
    for (auto&& batch : {validators_.clear(), postProcessors_.clear(), ocrBackends_.clear(),
                         extractors_.clear(), embeddingBackends_.clear()}) {
        failures.insert(failures.end(), batch.begin(), batch.end());
    }
    return failures;
}

} // namespace quarry::plugins
