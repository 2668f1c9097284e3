#pragma once

#include <quarry/api/quarry.h>
#include <quarry/extraction/document_extractor.h>
#include <quarry/ocr/ocr_backend.h>
#include <quarry/plugins/plugin.h>

#include <string>
#include <vector>

namespace quarry::api {

// Plugin adapters over the C vtables in quarry.h; each owns its user_data

class CallbackValidator : public plugins::Validator {
public:
    CallbackValidator(std::string name, const quarry_validator_vtable& vtable);
    ~CallbackValidator() override;

    CallbackValidator(const CallbackValidator&) = delete;
    CallbackValidator& operator=(const CallbackValidator&) = delete;

    std::string name() const override { return name_; }
    Result<void> validate(const ExtractionResult& result, const ExtractionConfig& config) override;

private:
    std::string name_;
    quarry_validator_vtable vtable_;
};

class CallbackPostProcessor : public plugins::PostProcessor {
public:
    CallbackPostProcessor(std::string name, const quarry_post_processor_vtable& vtable,
                          plugins::ProcessingStage stage);
    ~CallbackPostProcessor() override;

    CallbackPostProcessor(const CallbackPostProcessor&) = delete;
    CallbackPostProcessor& operator=(const CallbackPostProcessor&) = delete;

    std::string name() const override { return name_; }
    plugins::ProcessingStage processingStage() const override { return stage_; }
    Result<void> process(ExtractionResult& result, const ExtractionConfig& config) override;

private:
    std::string name_;
    quarry_post_processor_vtable vtable_;
    plugins::ProcessingStage stage_;
};

class CallbackOcrBackend : public ocr::OcrBackend {
public:
    CallbackOcrBackend(std::string name, const quarry_ocr_backend_vtable& vtable,
                       std::vector<std::string> languages);
    ~CallbackOcrBackend() override;

    CallbackOcrBackend(const CallbackOcrBackend&) = delete;
    CallbackOcrBackend& operator=(const CallbackOcrBackend&) = delete;

    std::string name() const override { return name_; }
    std::vector<std::string> supportedLanguages() const override { return languages_; }
    Result<ocr::OcrResult> processImage(std::span<const std::byte> image,
                                        const std::string& language) override;

private:
    std::string name_;
    quarry_ocr_backend_vtable vtable_;
    std::vector<std::string> languages_;
};

class CallbackDocumentExtractor : public extraction::DocumentExtractor {
public:
    CallbackDocumentExtractor(std::string name, const quarry_document_extractor_vtable& vtable,
                              std::vector<std::string> mimeTypes);
    ~CallbackDocumentExtractor() override;

    CallbackDocumentExtractor(const CallbackDocumentExtractor&) = delete;
    CallbackDocumentExtractor& operator=(const CallbackDocumentExtractor&) = delete;

    std::string name() const override { return name_; }
    std::vector<std::string> supportedMimeTypes() const override { return mimeTypes_; }
    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& mimeType,
                                     const ExtractionConfig& config) override;

private:
    std::string name_;
    quarry_document_extractor_vtable vtable_;
    std::vector<std::string> mimeTypes_;
};

} // namespace quarry::api
