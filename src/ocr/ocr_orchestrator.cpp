#include <quarry/core/mime.h>
#include <quarry/extraction/document_extractor.h>
#include <quarry/extraction/text_utils.h>
#include <quarry/ocr/ocr_orchestrator.h>
#include <quarry/plugins/plugin_registry.h>

#ifdef QUARRY_HAVE_TESSERACT
#include <quarry/ocr/tesseract_backend.h>
#endif

#include <spdlog/spdlog.h>

#include <algorithm>

namespace quarry::ocr {

namespace {

size_t trimmedLength(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return 0;
    }
    return text.find_last_not_of(" \t\r\n") - first + 1;
}

std::string joinNumbers(const std::vector<size_t>& values) {
    std::string out;
    for (auto v : values) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::to_string(v);
    }
    return out;
}

} // namespace

const char* toString(OcrState state) {
    switch (state) {
        case OcrState::NotNeeded:
            return "not_needed";
        case OcrState::Required:
            return "required";
        case OcrState::Running:
            return "running";
        case OcrState::Succeeded:
            return "succeeded";
        case OcrState::Failed:
            return "failed";
    }
    return "unknown";
}

const char* toString(OcrReason reason) {
    switch (reason) {
        case OcrReason::Forced:
            return "forced";
        case OcrReason::ImageInput:
            return "image_input";
        case OcrReason::NoTextOnPage:
            return "no_text_on_page";
        case OcrReason::LowCoverage:
            return "low_coverage";
    }
    return "unknown";
}

BuiltinOcrBackends& BuiltinOcrBackends::instance() {
    static BuiltinOcrBackends instance;
    return instance;
}

std::shared_ptr<OcrBackend> BuiltinOcrBackends::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = created_.find(name); it != created_.end()) {
        return it->second;
    }
#ifdef QUARRY_HAVE_TESSERACT
    if (name == "tesseract") {
        auto backend = std::make_shared<TesseractBackend>();
        if (auto init = backend->initialize(); !init) {
            spdlog::warn("Tesseract backend unavailable: {}", init.error().message);
            return nullptr;
        }
        created_[name] = backend;
        return backend;
    }
#endif
    return nullptr;
}

std::vector<std::string> BuiltinOcrBackends::names() const {
#ifdef QUARRY_HAVE_TESSERACT
    return {"tesseract"};
#else
    return {};
#endif
}

bool OcrOrchestrator::needsPageImages(const ExtractionConfig& config) {
    return config.forceOcr || config.ocr.has_value();
}

OcrDecision OcrOrchestrator::decide(const ExtractionResult& result,
                                    const ExtractionConfig& config) const {
    OcrDecision decision;
    if (config.forceOcr) {
        // Only raster and PDF inputs carry anything to recognize
        if (mime::isImage(result.mimeType) || result.mimeType == mime::kPdf) {
            decision.state = OcrState::Required;
            decision.reason = OcrReason::Forced;
            return decision;
        }
        spdlog::debug("force_ocr ignored for {}: no page images", result.mimeType);
        return decision;
    }
    if (mime::isImage(result.mimeType)) {
        decision.state = OcrState::Required;
        decision.reason = OcrReason::ImageInput;
        return decision;
    }
    if (!result.pages) {
        return decision;
    }

    const double threshold = config.effectiveOcr().coverageThreshold;
    for (const auto& page : *result.pages) {
        if (threshold > 0.0 && page.textCoverage && *page.textCoverage < threshold) {
            decision.pages.push_back(page.pageNumber);
            if (!decision.reason) {
                decision.reason = OcrReason::LowCoverage;
            }
        } else if (page.hasVisualContent && trimmedLength(page.content) < kMinPageTextChars) {
            decision.pages.push_back(page.pageNumber);
            if (!decision.reason) {
                decision.reason = OcrReason::NoTextOnPage;
            }
        }
    }
    if (!decision.pages.empty()) {
        decision.state = OcrState::Required;
    }
    return decision;
}

Result<std::shared_ptr<OcrBackend>>
OcrOrchestrator::resolveBackend(const std::string& name) const {
    if (auto plugin = plugins_.ocrBackend(name)) {
        return plugin;
    }
    if (auto builtin = builtins_.find(name)) {
        return builtin;
    }
    std::string available;
    for (const auto& n : plugins_.listOcrBackends()) {
        available += (available.empty() ? "" : ", ") + n;
    }
    for (const auto& n : builtins_.names()) {
        available += (available.empty() ? "" : ", ") + n;
    }
    return missingDependency(name, "OCR backend '" + name + "' is not available. Available: [" +
                                       available + "]");
}

Result<OcrResult> OcrOrchestrator::run(std::span<const std::byte> image,
                                       const std::string& language,
                                       const std::string& backendName) const {
    auto backend = resolveBackend(backendName);
    if (!backend) {
        return backend.error();
    }
    auto& engine = backend.value();

    auto supported = plugins::invokePlugin(backendName, "supportedLanguages",
                                           [&]() -> Result<bool> {
                                               return engine->supportsLanguage(language);
                                           });
    if (!supported) {
        return supported.error();
    }
    if (!supported.value()) {
        return Error{ErrorCode::Validation, "OCR language '" + language +
                                                "' is not supported by backend '" + backendName +
                                                "'"};
    }

    // No lock is held here; backends may be slow or out-of-process
    return plugins::invokePlugin(backendName, "processImage",
                                 [&] { return engine->processImage(image, language); });
}

Result<void> OcrOrchestrator::recognizePages(ExtractionResult& result,
                                             std::span<const std::byte> input,
                                             const OcrDecision& decision,
                                             const ExtractionConfig& config) const {
    const auto ocrConfig = config.effectiveOcr();
    double confidenceSum = 0.0;
    size_t runs = 0;

    if (mime::isImage(result.mimeType)) {
        auto ocr = run(input, ocrConfig.language, ocrConfig.backend);
        if (!ocr) {
            return ocr.error();
        }
        auto text = extraction::normalizeWhitespace(ocr.value().text);
        if (result.pages && !result.pages->empty()) {
            result.pages->front().content = text;
        }
        if (result.images && !result.images->empty()) {
            result.images->front().ocrText = text;
        }
        if (ocr.value().rotationDegrees) {
            result.metadata.set("ocr_rotation", *ocr.value().rotationDegrees);
        }
        result.content = std::move(text);
        result.metadata.set("ocr_confidence", ocr.value().meanConfidence());
        return {};
    }

    if (!result.pages || result.pages->empty()) {
        return Error{ErrorCode::Ocr, "OCR requested but " + result.mimeType +
                                         " input has no page images to recognize"};
    }

    std::vector<size_t> wanted = decision.pages;
    if (wanted.empty()) {
        for (const auto& page : *result.pages) {
            wanted.push_back(page.pageNumber);
        }
    }

    std::vector<size_t> missingImages;
    for (size_t pageNumber : wanted) {
        auto pageIt = std::find_if(result.pages->begin(), result.pages->end(),
                                   [&](const PageContent& p) { return p.pageNumber == pageNumber; });
        if (pageIt == result.pages->end()) {
            continue;
        }
        std::string pageText;
        bool hadImage = false;
        if (result.images) {
            for (auto& image : *result.images) {
                if (image.pageNumber != pageNumber) {
                    continue;
                }
                hadImage = true;
                auto ocr = run(std::as_bytes(std::span(image.data)), ocrConfig.language,
                               ocrConfig.backend);
                if (!ocr) {
                    return ocr.error();
                }
                image.ocrText = extraction::normalizeWhitespace(ocr.value().text);
                confidenceSum += ocr.value().meanConfidence();
                ++runs;
                if (!image.ocrText->empty()) {
                    if (!pageText.empty()) {
                        pageText += "\n\n";
                    }
                    pageText += *image.ocrText;
                }
            }
        }
        if (!hadImage) {
            missingImages.push_back(pageNumber);
            continue;
        }
        if (config.forceOcr || trimmedLength(pageText) > trimmedLength(pageIt->content)) {
            pageIt->content = std::move(pageText);
        }
    }

    if (runs == 0) {
        return Error{ErrorCode::Ocr, "No rasterized images available for OCR on pages [" +
                                         joinNumbers(missingImages) + "]"};
    }
    if (!missingImages.empty()) {
        result.addWarning("ocr", "Pages without images were not recognized: [" +
                                     joinNumbers(missingImages) + "]");
    }
    result.content = extraction::joinPageContent(*result.pages, config);
    result.metadata.set("ocr_confidence", confidenceSum / static_cast<double>(runs));
    return {};
}

Result<OcrState> OcrOrchestrator::process(ExtractionResult& result,
                                          std::span<const std::byte> input,
                                          const ExtractionConfig& config) const {
    auto decision = decide(result, config);
    if (!decision.required()) {
        result.metadata.set("ocr_status", toString(OcrState::NotNeeded));
        return OcrState::NotNeeded;
    }
    result.metadata.set("ocr_reason", toString(*decision.reason));
    if (!decision.pages.empty()) {
        result.metadata.set("ocr_pages", decision.pages);
    }
    spdlog::debug("OCR required ({}) for {}", toString(*decision.reason), result.mimeType);

    result.metadata.set("ocr_status", toString(OcrState::Running));
    auto recognized = recognizePages(result, input, decision, config);
    if (recognized) {
        result.metadata.set("ocr_status", toString(OcrState::Succeeded));
        return OcrState::Succeeded;
    }

    const auto& error = recognized.error();
    result.metadata.set("ocr_status", toString(OcrState::Failed));
    if (config.forceOcr) {
        if (error.code == ErrorCode::MissingDependency || error.code == ErrorCode::Ocr) {
            return error;
        }
        return Error{ErrorCode::Ocr, "OCR failed: " + error.message, error.subject};
    }
    spdlog::warn("OCR failed for {}, continuing without it: {}", result.mimeType, error.message);
    result.addWarning("ocr", error.message);
    result.metadata.set("ocr_error", error.message);
    return OcrState::Failed;
}

} // namespace quarry::ocr
