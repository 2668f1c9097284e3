#include <quarry/config/config_helpers.h>
#include <quarry/config/settings.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <format>
#include <fstream>
#include <vector>

namespace quarry::config {

namespace {

using nlohmann::json;

const json* field(const json& j, const char* snake, const char* camel) {
    if (auto it = j.find(snake); it != j.end() && !it->is_null()) {
        return &*it;
    }
    if (auto it = j.find(camel); it != j.end() && !it->is_null()) {
        return &*it;
    }
    return nullptr;
}

} // namespace

nlohmann::json Settings::toJson() const {
    return json{{"extraction", extraction.toJson()},
                {"logging",
                 {{"level", logging.level},
                  {"file", logging.file.string()},
                  {"max_file_size", logging.maxFileSize},
                  {"max_files", logging.maxFiles}}},
                {"cache",
                 {{"persist_to_disk", cache.persistToDisk},
                  {"directory", cache.directory.string()},
                  {"max_memory_entries", cache.maxMemoryEntries},
                  {"max_age_seconds", cache.maxAgeSeconds}}}};
}

Result<Settings> Settings::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::Validation, "Settings must be a JSON object"};
    }
    Settings settings;
    if (const json* ex = field(j, "extraction", "extraction")) {
        auto parsed = ExtractionConfig::fromJson(*ex);
        if (!parsed) {
            return parsed.error();
        }
        settings.extraction = std::move(parsed).value();
    }
    try {
        if (const json* lg = field(j, "logging", "logging")) {
            if (const json* v = field(*lg, "level", "level"))
                settings.logging.level = v->get<std::string>();
            if (const json* v = field(*lg, "file", "file"))
                settings.logging.file = expand_tilde(v->get<std::string>());
            if (const json* v = field(*lg, "max_file_size", "maxFileSize"))
                settings.logging.maxFileSize = v->get<size_t>();
            if (const json* v = field(*lg, "max_files", "maxFiles"))
                settings.logging.maxFiles = v->get<size_t>();
        }
        if (const json* c = field(j, "cache", "cache")) {
            if (const json* v = field(*c, "persist_to_disk", "persistToDisk"))
                settings.cache.persistToDisk = v->get<bool>();
            if (const json* v = field(*c, "directory", "directory"))
                settings.cache.directory = expand_tilde(v->get<std::string>());
            if (const json* v = field(*c, "max_memory_entries", "maxMemoryEntries"))
                settings.cache.maxMemoryEntries = v->get<size_t>();
            if (const json* v = field(*c, "max_age_seconds", "maxAgeSeconds"))
                settings.cache.maxAgeSeconds = v->get<uint64_t>();
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::Validation, std::format("Invalid settings value: {}", e.what())};
    }
    return settings;
}

Result<Settings> ConfigLoader::load(const std::string& overridePath) {
    auto path = get_config_path(overridePath);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!overridePath.empty()) {
            return Error{ErrorCode::Io, "Config file not found: " + path.string()};
        }
        spdlog::debug("No config file at {}, using defaults", path.string());
        Settings settings;
        applyEnvironment(settings);
        return settings;
    }
    auto loaded = loadFile(path);
    if (!loaded) {
        return loaded.error();
    }
    auto settings = std::move(loaded).value();
    applyEnvironment(settings);
    return settings;
}

Result<Settings> ConfigLoader::loadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::Io, "Failed to open config file: " + path.string()};
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::Parsing,
                     std::format("Failed to parse config file {}: {}", path.string(), e.what())};
    }
    spdlog::debug("Loaded config from {}", path.string());
    return Settings::fromJson(j);
}

Result<ExtractionConfig> ConfigLoader::loadExtractionConfig(const std::filesystem::path& path) {
    auto settings = loadFile(path);
    if (!settings) {
        return settings.error();
    }
    return settings.value().extraction;
}

void ConfigLoader::applyEnvironment(Settings& settings) {
    if (auto dir = env_value("QUARRY_CACHE_DIR")) {
        settings.cache.directory = expand_tilde(*dir);
    }
    if (auto raw = env_value("QUARRY_USE_CACHE")) {
        if (auto b = parse_bool(*raw)) {
            settings.extraction.useCache = *b;
        } else {
            spdlog::warn("Ignoring QUARRY_USE_CACHE='{}': expected a boolean", *raw);
        }
    }
    if (auto raw = env_value("QUARRY_MAX_CONCURRENCY")) {
        try {
            auto n = std::stoul(*raw);
            if (n > 0) {
                settings.extraction.maxConcurrentExtractions = static_cast<size_t>(n);
            }
        } catch (const std::exception&) {
            spdlog::warn("Ignoring QUARRY_MAX_CONCURRENCY='{}': expected a positive integer", *raw);
        }
    }
    if (auto backend = env_value("QUARRY_OCR_BACKEND")) {
        auto ocr = settings.extraction.effectiveOcr();
        ocr.backend = *backend;
        settings.extraction.ocr = ocr;
    }
    if (auto lang = env_value("QUARRY_OCR_LANGUAGE")) {
        auto ocr = settings.extraction.effectiveOcr();
        ocr.language = *lang;
        settings.extraction.ocr = ocr;
    }
    if (auto level = env_value("QUARRY_LOG_LEVEL")) {
        settings.logging.level = *level;
    }
    if (auto file = env_value("QUARRY_LOG_FILE")) {
        settings.logging.file = expand_tilde(*file);
    }
}

Result<void> configureLogging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        return Error{ErrorCode::Validation, "Unknown log level: " + config.level};
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.file.empty()) {
        try {
            if (config.file.has_parent_path()) {
                std::filesystem::create_directories(config.file.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), config.maxFileSize, config.maxFiles));
        } catch (const std::exception& e) {
            return Error{ErrorCode::Io, std::format("Failed to open log file {}: {}",
                                                    config.file.string(), e.what())};
        }
    }

    auto logger = std::make_shared<spdlog::logger>("quarry", sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    if (!config.file.empty()) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.file.string(),
                     config.maxFileSize / (1024 * 1024), config.maxFiles);
    }
    return {};
}

} // namespace quarry::config
