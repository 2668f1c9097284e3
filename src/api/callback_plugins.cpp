#include "callback_plugins.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string_view>

namespace quarry::api {

namespace {

// Releases a string handed back by a callback through the table's free_string
class CallbackString {
public:
    CallbackString(quarry_free_string_fn release, void* userData)
        : release_(release), userData_(userData) {}
    ~CallbackString() {
        if (value_ && release_) {
            release_(userData_, value_);
        }
    }

    CallbackString(const CallbackString&) = delete;
    CallbackString& operator=(const CallbackString&) = delete;

    char** out() { return &value_; }
    bool empty() const { return value_ == nullptr || *value_ == '\0'; }
    std::string str() const { return value_ ? std::string(value_) : std::string(); }

private:
    quarry_free_string_fn release_;
    void* userData_;
    char* value_ = nullptr;
};

Error callbackError(const std::string& plugin, std::string_view operation, int32_t code,
                    const CallbackString& message) {
    std::string text = message.str();
    if (text.empty()) {
        text = "Plugin '" + plugin + "' " + std::string(operation) + " returned code " +
               std::to_string(code);
    }
    // Codes outside the taxonomy, and Panic, are reported as the plugin's fault
    if (code > static_cast<int32_t>(ErrorCode::Panic) && code < kErrorCodeCount) {
        return Error{static_cast<ErrorCode>(code), std::move(text), plugin};
    }
    return pluginError(plugin, std::move(text));
}

Result<nlohmann::json> parseReturnedJson(const std::string& plugin, std::string_view operation,
                                         const CallbackString& raw) {
    auto j = nlohmann::json::parse(raw.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return pluginError(plugin, "Plugin '" + plugin + "' returned malformed JSON from " +
                                       std::string(operation));
    }
    return j;
}

template <typename Vtable> void destroyUserData(const std::string& name, const Vtable& vtable) {
    if (vtable.destroy) {
        spdlog::debug("Releasing C plugin '{}'", name);
        vtable.destroy(vtable.user_data);
    }
}

} // namespace

CallbackValidator::CallbackValidator(std::string name, const quarry_validator_vtable& vtable)
    : name_(std::move(name)), vtable_(vtable) {}

CallbackValidator::~CallbackValidator() {
    destroyUserData(name_, vtable_);
}

Result<void> CallbackValidator::validate(const ExtractionResult& result,
                                         const ExtractionConfig& /*config*/) {
    const std::string json = result.toJson().dump();
    CallbackString message(vtable_.free_string, vtable_.user_data);
    const int32_t code = vtable_.validate(vtable_.user_data, json.c_str(), message.out());
    if (code != QUARRY_ERROR_SUCCESS) {
        return callbackError(name_, "validate", code, message);
    }
    return {};
}

CallbackPostProcessor::CallbackPostProcessor(std::string name,
                                             const quarry_post_processor_vtable& vtable,
                                             plugins::ProcessingStage stage)
    : name_(std::move(name)), vtable_(vtable), stage_(stage) {}

CallbackPostProcessor::~CallbackPostProcessor() {
    destroyUserData(name_, vtable_);
}

Result<void> CallbackPostProcessor::process(ExtractionResult& result,
                                            const ExtractionConfig& /*config*/) {
    const std::string json = result.toJson().dump();
    CallbackString rewritten(vtable_.free_string, vtable_.user_data);
    CallbackString message(vtable_.free_string, vtable_.user_data);
    const int32_t code =
        vtable_.process(vtable_.user_data, json.c_str(), rewritten.out(), message.out());
    if (code != QUARRY_ERROR_SUCCESS) {
        return callbackError(name_, "process", code, message);
    }
    if (rewritten.empty()) {
        return {};
    }
    auto parsed = parseReturnedJson(name_, "process", rewritten);
    if (!parsed) {
        return parsed.error();
    }
    auto updated = ExtractionResult::fromJson(parsed.value());
    if (!updated) {
        return pluginError(name_, "Plugin '" + name_ +
                                      "' returned an invalid result: " + updated.error().message);
    }
    result = std::move(updated).value();
    return {};
}

CallbackOcrBackend::CallbackOcrBackend(std::string name, const quarry_ocr_backend_vtable& vtable,
                                       std::vector<std::string> languages)
    : name_(std::move(name)), vtable_(vtable), languages_(std::move(languages)) {}

CallbackOcrBackend::~CallbackOcrBackend() {
    destroyUserData(name_, vtable_);
}

Result<ocr::OcrResult> CallbackOcrBackend::processImage(std::span<const std::byte> image,
                                                        const std::string& language) {
    CallbackString text(vtable_.free_string, vtable_.user_data);
    CallbackString message(vtable_.free_string, vtable_.user_data);
    double confidence = 1.0;
    const int32_t code = vtable_.process_image(
        vtable_.user_data, reinterpret_cast<const uint8_t*>(image.data()), image.size(),
        language.c_str(), text.out(), &confidence, message.out());
    if (code != QUARRY_ERROR_SUCCESS) {
        return callbackError(name_, "process_image", code, message);
    }
    ocr::OcrResult result;
    result.text = text.str();
    if (!result.text.empty()) {
        ocr::OcrElement element;
        element.text = result.text;
        element.confidence = std::clamp(confidence, 0.0, 1.0);
        result.elements.push_back(std::move(element));
    }
    return result;
}

CallbackDocumentExtractor::CallbackDocumentExtractor(std::string name,
                                                     const quarry_document_extractor_vtable& vtable,
                                                     std::vector<std::string> mimeTypes)
    : name_(std::move(name)), vtable_(vtable), mimeTypes_(std::move(mimeTypes)) {}

CallbackDocumentExtractor::~CallbackDocumentExtractor() {
    destroyUserData(name_, vtable_);
}

Result<ExtractionResult> CallbackDocumentExtractor::extract(std::span<const std::byte> data,
                                                            const std::string& mimeType,
                                                            const ExtractionConfig& config) {
    const std::string configJson = config.toJson().dump();
    CallbackString output(vtable_.free_string, vtable_.user_data);
    CallbackString message(vtable_.free_string, vtable_.user_data);
    const int32_t code = vtable_.extract(vtable_.user_data,
                                         reinterpret_cast<const uint8_t*>(data.data()), data.size(),
                                         mimeType.c_str(), configJson.c_str(), output.out(),
                                         message.out());
    if (code != QUARRY_ERROR_SUCCESS) {
        return callbackError(name_, "extract", code, message);
    }
    auto parsed = parseReturnedJson(name_, "extract", output);
    if (!parsed) {
        return parsed.error();
    }
    auto result = ExtractionResult::fromJson(parsed.value());
    if (!result) {
        return pluginError(name_, "Plugin '" + name_ +
                                      "' returned an invalid result: " + result.error().message);
    }
    if (result.value().mimeType.empty()) {
        result.value().mimeType = mimeType;
    }
    return result;
}

} // namespace quarry::api
