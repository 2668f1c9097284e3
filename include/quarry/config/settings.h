#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace quarry::config {

struct LoggingConfig {
    std::string level = "info"; // trace|debug|info|warn|error|off
    std::filesystem::path file; // empty: stderr only
    size_t maxFileSize = 10 * 1024 * 1024;
    size_t maxFiles = 5;
};

struct CacheSettings {
    bool persistToDisk = true;
    std::filesystem::path directory; // empty: get_cache_dir()
    size_t maxMemoryEntries = 256;
    uint64_t maxAgeSeconds = 30ull * 24 * 3600;
};

/**
 * @brief Process-level settings loaded from quarry.json plus environment.
 *
 * Layout of the file:
 * @code
 * {
 *   "extraction": { ...ExtractionConfig... },
 *   "logging": { "level": "info", "file": "/var/log/quarry.log" },
 *   "cache": { "persist_to_disk": true, "directory": "~/.cache/quarry" }
 * }
 * @endcode
 */
struct Settings {
    ExtractionConfig extraction;
    LoggingConfig logging;
    CacheSettings cache;

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static Result<Settings> fromJson(const nlohmann::json& j);
};

class ConfigLoader {
public:
    // Resolves the config path (see get_config_path); a missing file yields defaults
    static Result<Settings> load(const std::string& overridePath = "");
    static Result<Settings> loadFile(const std::filesystem::path& path);
    static Result<ExtractionConfig> loadExtractionConfig(const std::filesystem::path& path);

    // QUARRY_CACHE_DIR, QUARRY_USE_CACHE, QUARRY_MAX_CONCURRENCY, QUARRY_OCR_BACKEND,
    // QUARRY_OCR_LANGUAGE, QUARRY_LOG_LEVEL, QUARRY_LOG_FILE
    static void applyEnvironment(Settings& settings);
};

// Installs the default spdlog logger according to @p config
Result<void> configureLogging(const LoggingConfig& config);

} // namespace quarry::config
