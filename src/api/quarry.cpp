#include "callback_plugins.h"

#include <quarry/api/quarry.h>
#include <quarry/config/settings.h>
#include <quarry/core/error_details.h>
#include <quarry/detection/format_classifier.h>
#include <quarry/engine/engine.h>
#include <quarry/ocr/ocr_orchestrator.h>
#include <quarry/plugins/plugin_registry.h>
#include <quarry/version.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace {

using quarry::Error;
using quarry::ErrorCode;
using quarry::ErrorDetails;
using quarry::Result;

thread_local ErrorDetails g_lastError{ErrorCode::Success, ""};

void setLastError(const Error& error) {
    g_lastError = ErrorDetails::fromError(error);
    if (error.code == ErrorCode::Panic) {
        if (auto fault = quarry::lastFaultContext()) {
            g_lastError.faultTrace = fault->trace;
            g_lastError.context = quarry::ErrorContext{"", fault->boundary, 0, fault->exceptionType};
        }
    }
}

void clearLastError() {
    g_lastError = ErrorDetails{ErrorCode::Success, ""};
}

char* dupString(const std::string& s) {
    auto* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (out) {
        std::memcpy(out, s.c_str(), s.size() + 1);
    }
    return out;
}

char* dupOptional(const std::optional<std::string>& s) {
    return s ? dupString(*s) : nullptr;
}

struct GlobalState {
    quarry::config::Settings settings;
    std::unique_ptr<quarry::engine::Engine> engine;
};

GlobalState& state() {
    static GlobalState instance = [] {
        GlobalState s;
        auto loaded = quarry::config::ConfigLoader::load();
        if (loaded) {
            s.settings = std::move(loaded).value();
        } else {
            spdlog::warn("Using default settings: {}", loaded.error().message);
        }
        if (auto logging = quarry::config::configureLogging(s.settings.logging); !logging) {
            spdlog::warn("Logging setup failed: {}", logging.error().message);
        }
        s.engine = std::make_unique<quarry::engine::Engine>(
            quarry::plugins::PluginRegistry::global(),
            quarry::engine::EngineOptions::fromSettings(s.settings));
        return s;
    }();
    return instance;
}

Result<quarry::ExtractionConfig> parseConfig(const char* configJson) {
    if (configJson == nullptr || *configJson == '\0') {
        return state().settings.extraction;
    }
    auto j = nlohmann::json::parse(configJson, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::Validation, "Malformed configuration JSON"};
    }
    return quarry::ExtractionConfig::fromJson(j);
}

std::optional<std::string> optionalString(const char* s) {
    if (s == nullptr || *s == '\0') {
        return std::nullopt;
    }
    return std::string(s);
}

// Runs @p fn at the C boundary and returns its JSON as a malloc'd string
template <typename F> char* jsonBoundary(std::string_view boundary, F&& fn) {
    auto out = quarry::guardBoundary(boundary, [&]() -> Result<std::string> {
        auto value = fn();
        if (!value) {
            return value.error();
        }
        return value.value().dump();
    });
    if (!out) {
        setLastError(out.error());
        return nullptr;
    }
    clearLastError();
    return dupString(out.value());
}

nlohmann::json namesToJson(const std::vector<std::string>& names) {
    return nlohmann::json(names);
}

// Runs a status-returning operation at the C boundary
template <typename F> int32_t statusBoundary(std::string_view boundary, F&& fn) {
    auto done = quarry::guardBoundary(boundary, std::forward<F>(fn));
    if (!done) {
        setLastError(done.error());
        return static_cast<int32_t>(done.error().code);
    }
    clearLastError();
    return QUARRY_ERROR_SUCCESS;
}

Result<std::string> requireName(const char* name) {
    if (name == nullptr || *name == '\0') {
        return Error{ErrorCode::InvalidArgument, "plugin name must not be empty"};
    }
    return std::string(name);
}

Result<std::vector<std::string>> stringList(const char* const* items, size_t count,
                                            std::string_view what) {
    if (items == nullptr && count > 0) {
        return Error{ErrorCode::InvalidArgument, std::string(what) + " is null"};
    }
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        if (items[i] == nullptr || *items[i] == '\0') {
            return Error{ErrorCode::InvalidArgument,
                         std::string(what) + " contains an empty entry at index " +
                             std::to_string(i)};
        }
        out.emplace_back(items[i]);
    }
    return out;
}

std::string ocrBackendName(const char* backend) {
    return backend && *backend ? backend : "tesseract";
}

// Plugin backends first, then built-ins
Result<std::shared_ptr<quarry::ocr::OcrBackend>> findOcrBackend(const std::string& name) {
    quarry::ocr::OcrOrchestrator orchestrator(quarry::plugins::PluginRegistry::global());
    return orchestrator.resolveBackend(name);
}

} // namespace

extern "C" {

char* quarry_extract_file(const char* path, const char* mime_type, const char* config_json) {
    return jsonBoundary("quarry_extract_file", [&]() -> Result<nlohmann::json> {
        if (path == nullptr || *path == '\0') {
            return Error{ErrorCode::InvalidArgument, "path must not be empty"};
        }
        auto config = parseConfig(config_json);
        if (!config) {
            return config.error();
        }
        auto result = state().engine->extractFile(path, optionalString(mime_type), config.value());
        if (!result) {
            return result.error();
        }
        return result.value().toJson();
    });
}

char* quarry_extract_bytes(const uint8_t* data, size_t length, const char* mime_type,
                           const char* config_json) {
    return jsonBoundary("quarry_extract_bytes", [&]() -> Result<nlohmann::json> {
        if (data == nullptr && length > 0) {
            return Error{ErrorCode::InvalidArgument, "data is null"};
        }
        auto config = parseConfig(config_json);
        if (!config) {
            return config.error();
        }
        std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(data), length);
        auto result = state().engine->extractBytes(bytes, optionalString(mime_type), config.value());
        if (!result) {
            return result.error();
        }
        return result.value().toJson();
    });
}

char* quarry_batch_extract_files(const char* const* paths, size_t count, const char* config_json) {
    return jsonBoundary("quarry_batch_extract_files", [&]() -> Result<nlohmann::json> {
        if (paths == nullptr && count > 0) {
            return Error{ErrorCode::InvalidArgument, "paths is null"};
        }
        auto config = parseConfig(config_json);
        if (!config) {
            return config.error();
        }
        std::vector<std::filesystem::path> items;
        items.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            items.emplace_back(paths[i] ? paths[i] : "");
        }
        auto results = state().engine->batchExtractFiles(items, config.value());
        auto out = nlohmann::json::array();
        for (const auto& r : results) {
            if (r) {
                out.push_back({{"ok", r.value().toJson()}});
            } else {
                out.push_back({{"error", ErrorDetails::fromError(r.error()).toJson()}});
            }
        }
        return out;
    });
}

char* quarry_batch_extract_bytes(const uint8_t* const* data, const size_t* lengths,
                                 const char* const* mime_types, size_t count,
                                 const char* config_json) {
    return jsonBoundary("quarry_batch_extract_bytes", [&]() -> Result<nlohmann::json> {
        if ((data == nullptr || lengths == nullptr) && count > 0) {
            return Error{ErrorCode::InvalidArgument, "data and lengths must not be null"};
        }
        auto config = parseConfig(config_json);
        if (!config) {
            return config.error();
        }
        std::vector<quarry::engine::BytesInput> items;
        items.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (data[i] == nullptr && lengths[i] > 0) {
                return Error{ErrorCode::InvalidArgument,
                             "data[" + std::to_string(i) + "] is null"};
            }
            quarry::engine::BytesInput item;
            const auto* first = reinterpret_cast<const std::byte*>(data[i]);
            item.data.assign(first, first + lengths[i]);
            if (mime_types) {
                item.mimeType = optionalString(mime_types[i]);
            }
            items.push_back(std::move(item));
        }
        auto results = state().engine->batchExtractBytes(items, config.value());
        auto out = nlohmann::json::array();
        for (const auto& r : results) {
            if (r) {
                out.push_back({{"ok", r.value().toJson()}});
            } else {
                out.push_back({{"error", ErrorDetails::fromError(r.error()).toJson()}});
            }
        }
        return out;
    });
}

void quarry_free_string(char* s) {
    std::free(s);
}

int32_t quarry_last_error_code(void) {
    return g_lastError.numericCode();
}

const char* quarry_last_error_message(void) {
    return g_lastError.message.c_str();
}

quarry_error_details* quarry_last_error_details(void) {
    if (g_lastError.code == ErrorCode::Success) {
        return nullptr;
    }
    auto* out = static_cast<quarry_error_details*>(std::calloc(1, sizeof(quarry_error_details)));
    if (!out) {
        return nullptr;
    }
    out->code = g_lastError.numericCode();
    out->kind = dupString(g_lastError.kindName());
    out->message = dupString(g_lastError.message);
    out->plugin_name = dupOptional(g_lastError.pluginName);
    out->dependency = dupOptional(g_lastError.dependency);
    if (g_lastError.context) {
        out->source_file = dupString(g_lastError.context->sourceFile);
        out->source_function = dupString(g_lastError.context->sourceFunction);
        out->line = g_lastError.context->line;
        out->info = dupString(g_lastError.context->info);
    }
    out->fault_trace = dupOptional(g_lastError.faultTrace);
    return out;
}

void quarry_free_error_details(quarry_error_details* details) {
    if (!details) {
        return;
    }
    for (char* s : {details->kind, details->message, details->plugin_name, details->dependency,
                    details->source_file, details->source_function, details->info,
                    details->fault_trace}) {
        std::free(s);
    }
    std::free(details);
}

char* quarry_last_panic_context(void) {
    auto fault = quarry::lastFaultContext();
    return fault ? dupString(fault->toJson().dump()) : nullptr;
}

int32_t quarry_classify_error(const char* message) {
    if (message == nullptr) {
        return static_cast<int32_t>(ErrorCode::Unknown);
    }
    return static_cast<int32_t>(quarry::classifyMessage(message));
}

const char* quarry_error_code_name(int32_t code) {
    if (code < 0 || code >= quarry::kErrorCodeCount) {
        return "unknown";
    }
    return quarry::errorCodeName(static_cast<ErrorCode>(code));
}

int32_t quarry_error_code_success(void) { return QUARRY_ERROR_SUCCESS; }
int32_t quarry_error_code_generic(void) { return QUARRY_ERROR_GENERIC; }
int32_t quarry_error_code_panic(void) { return QUARRY_ERROR_PANIC; }
int32_t quarry_error_code_invalid_argument(void) { return QUARRY_ERROR_INVALID_ARGUMENT; }
int32_t quarry_error_code_io(void) { return QUARRY_ERROR_IO; }
int32_t quarry_error_code_parsing(void) { return QUARRY_ERROR_PARSING; }
int32_t quarry_error_code_ocr(void) { return QUARRY_ERROR_OCR; }
int32_t quarry_error_code_missing_dependency(void) { return QUARRY_ERROR_MISSING_DEPENDENCY; }
int32_t quarry_error_code_validation(void) { return QUARRY_ERROR_VALIDATION; }
int32_t quarry_error_code_unsupported_format(void) { return QUARRY_ERROR_UNSUPPORTED_FORMAT; }
int32_t quarry_error_code_cache(void) { return QUARRY_ERROR_CACHE; }
int32_t quarry_error_code_image_processing(void) { return QUARRY_ERROR_IMAGE_PROCESSING; }
int32_t quarry_error_code_plugin(void) { return QUARRY_ERROR_PLUGIN; }

int32_t quarry_clear_cache(void) {
    auto cleared = quarry::guardBoundary("quarry_clear_cache",
                                         [] { return state().engine->cache().clear(); });
    if (!cleared) {
        setLastError(cleared.error());
        return static_cast<int32_t>(cleared.error().code);
    }
    clearLastError();
    return QUARRY_ERROR_SUCCESS;
}

char* quarry_cache_stats(void) {
    return jsonBoundary("quarry_cache_stats", []() -> Result<nlohmann::json> {
        return state().engine->cache().stats().toJson();
    });
}

char* quarry_list_plugins(const char* kind) {
    return jsonBoundary("quarry_list_plugins", [&]() -> Result<nlohmann::json> {
        const std::string k = kind ? kind : "";
        auto& registry = quarry::plugins::PluginRegistry::global();
        if (k == "validators") {
            return namesToJson(registry.listValidators());
        }
        if (k == "post_processors") {
            return namesToJson(registry.listPostProcessors());
        }
        if (k == "ocr_backends") {
            return namesToJson(registry.listOcrBackends());
        }
        if (k == "document_extractors") {
            return namesToJson(registry.listDocumentExtractors());
        }
        if (k == "embedding_backends") {
            return namesToJson(registry.listEmbeddingBackends());
        }
        return Error{ErrorCode::InvalidArgument, "Unknown plugin kind '" + k + "'"};
    });
}

int32_t quarry_clear_plugins(const char* kind) {
    auto cleared = quarry::guardBoundary("quarry_clear_plugins", [&]() -> Result<void> {
        const std::string k = kind ? kind : "";
        auto& registry = quarry::plugins::PluginRegistry::global();
        std::vector<std::string> failures;
        if (k == "validators") {
            failures = registry.clearValidators();
        } else if (k == "post_processors") {
            failures = registry.clearPostProcessors();
        } else if (k == "ocr_backends") {
            failures = registry.clearOcrBackends();
        } else if (k == "document_extractors") {
            failures = registry.clearDocumentExtractors();
        } else if (k == "embedding_backends") {
            failures = registry.clearEmbeddingBackends();
        } else if (k == "all") {
            failures = registry.clearAll();
        } else {
            return Error{ErrorCode::InvalidArgument, "Unknown plugin kind '" + k + "'"};
        }
        if (!failures.empty()) {
            std::string names;
            for (const auto& n : failures) {
                names += (names.empty() ? "" : ", ") + n;
            }
            return quarry::pluginError(failures.front(), "Shutdown failed for: " + names);
        }
        return {};
    });
    if (!cleared) {
        setLastError(cleared.error());
        return static_cast<int32_t>(cleared.error().code);
    }
    clearLastError();
    return QUARRY_ERROR_SUCCESS;
}

char* quarry_supported_mime_types(void) {
    return jsonBoundary("quarry_supported_mime_types", []() -> Result<nlohmann::json> {
        return namesToJson(state().engine->extractors().supportedMimeTypes());
    });
}

char* quarry_detect_mime_type(const char* path) {
    return jsonBoundary("quarry_detect_mime_type", [&]() -> Result<nlohmann::json> {
        if (path == nullptr || *path == '\0') {
            return Error{ErrorCode::InvalidArgument, "path must not be empty"};
        }
        auto classified = quarry::detection::FormatClassifier::instance().classifyFile(path);
        if (!classified) {
            return classified.error();
        }
        return nlohmann::json(classified.value().mimeType);
    });
}

char* quarry_get_ocr_languages(const char* backend) {
    return jsonBoundary("quarry_get_ocr_languages", [&]() -> Result<nlohmann::json> {
        const std::string name = ocrBackendName(backend);
        auto found = findOcrBackend(name);
        if (!found) {
            return found.error();
        }
        auto languages = quarry::plugins::invokePlugin(
            name, "supportedLanguages", [&]() -> Result<std::vector<std::string>> {
                return found.value()->supportedLanguages();
            });
        if (!languages) {
            return languages.error();
        }
        return namesToJson(languages.value());
    });
}

int32_t quarry_is_language_supported(const char* backend, const char* language) {
    bool supported = false;
    const int32_t status = statusBoundary("quarry_is_language_supported", [&]() -> Result<void> {
        if (language == nullptr || *language == '\0') {
            return Error{ErrorCode::InvalidArgument, "language must not be empty"};
        }
        const std::string name = ocrBackendName(backend);
        auto found = findOcrBackend(name);
        if (!found) {
            return found.error();
        }
        auto answer = quarry::plugins::invokePlugin(name, "supportsLanguage", [&]() -> Result<bool> {
            return found.value()->supportsLanguage(language);
        });
        if (!answer) {
            return answer.error();
        }
        supported = answer.value();
        return {};
    });
    if (status != QUARRY_ERROR_SUCCESS) {
        return -1;
    }
    return supported ? 1 : 0;
}

int32_t quarry_register_validator(const char* name, const quarry_validator_vtable* vtable,
                                  int32_t priority) {
    return statusBoundary("quarry_register_validator", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        if (vtable == nullptr || vtable->validate == nullptr) {
            return Error{ErrorCode::InvalidArgument, "validator table needs a validate callback"};
        }
        return quarry::plugins::PluginRegistry::global().registerValidator(
            std::make_shared<quarry::api::CallbackValidator>(checked.value(), *vtable), priority);
    });
}

int32_t quarry_unregister_validator(const char* name) {
    return statusBoundary("quarry_unregister_validator", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        return quarry::plugins::PluginRegistry::global().unregisterValidator(checked.value());
    });
}

int32_t quarry_register_post_processor(const char* name, const quarry_post_processor_vtable* vtable,
                                       int32_t stage, int32_t priority) {
    return statusBoundary("quarry_register_post_processor", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        if (vtable == nullptr || vtable->process == nullptr) {
            return Error{ErrorCode::InvalidArgument,
                         "post-processor table needs a process callback"};
        }
        if (stage < QUARRY_STAGE_EARLY || stage > QUARRY_STAGE_LATE) {
            return Error{ErrorCode::InvalidArgument,
                         "Unknown processing stage " + std::to_string(stage)};
        }
        return quarry::plugins::PluginRegistry::global().registerPostProcessor(
            std::make_shared<quarry::api::CallbackPostProcessor>(
                checked.value(), *vtable, static_cast<quarry::plugins::ProcessingStage>(stage)),
            priority);
    });
}

int32_t quarry_unregister_post_processor(const char* name) {
    return statusBoundary("quarry_unregister_post_processor", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        return quarry::plugins::PluginRegistry::global().unregisterPostProcessor(checked.value());
    });
}

int32_t quarry_register_ocr_backend(const char* name, const quarry_ocr_backend_vtable* vtable,
                                    const char* const* languages, size_t language_count,
                                    int32_t priority) {
    return statusBoundary("quarry_register_ocr_backend", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        if (vtable == nullptr || vtable->process_image == nullptr) {
            return Error{ErrorCode::InvalidArgument,
                         "OCR backend table needs a process_image callback"};
        }
        auto langs = stringList(languages, language_count, "languages");
        if (!langs) {
            return langs.error();
        }
        if (langs.value().empty()) {
            return Error{ErrorCode::InvalidArgument, "OCR backend must declare a language"};
        }
        return quarry::plugins::PluginRegistry::global().registerOcrBackend(
            std::make_shared<quarry::api::CallbackOcrBackend>(checked.value(), *vtable,
                                                              std::move(langs).value()),
            priority);
    });
}

int32_t quarry_unregister_ocr_backend(const char* name) {
    return statusBoundary("quarry_unregister_ocr_backend", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        return quarry::plugins::PluginRegistry::global().unregisterOcrBackend(checked.value());
    });
}

int32_t quarry_register_document_extractor(const char* name,
                                           const quarry_document_extractor_vtable* vtable,
                                           const char* const* mime_types, size_t mime_type_count,
                                           int32_t priority) {
    return statusBoundary("quarry_register_document_extractor", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        if (vtable == nullptr || vtable->extract == nullptr) {
            return Error{ErrorCode::InvalidArgument,
                         "document extractor table needs an extract callback"};
        }
        auto types = stringList(mime_types, mime_type_count, "mime_types");
        if (!types) {
            return types.error();
        }
        return quarry::plugins::PluginRegistry::global().registerDocumentExtractor(
            std::make_shared<quarry::api::CallbackDocumentExtractor>(checked.value(), *vtable,
                                                                     std::move(types).value()),
            priority);
    });
}

int32_t quarry_unregister_document_extractor(const char* name) {
    return statusBoundary("quarry_unregister_document_extractor", [&]() -> Result<void> {
        auto checked = requireName(name);
        if (!checked) {
            return checked.error();
        }
        return quarry::plugins::PluginRegistry::global().unregisterDocumentExtractor(
            checked.value());
    });
}

const char* quarry_version(void) {
    return QUARRY_VERSION_STRING;
}

} // extern "C"
