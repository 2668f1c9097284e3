#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace quarry::cache {

struct CacheOptions {
    // Empty directory keeps the cache in memory only
    std::filesystem::path directory;
    size_t maxEntries = 256;
    // Disk entries older than this are treated as misses; 0 keeps them forever
    uint64_t maxAgeSeconds = 0;
};

struct CacheStats {
    size_t entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t diskEntries = 0;
    uint64_t totalSizeBytes = 0;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Content-addressed memoization of whole extraction runs.
 *
 * At most one computation per key runs at a time; concurrent callers for the
 * same key wait on the same shared future. Failed computations are returned
 * to every waiter but never stored. Disk entries live at
 * `<directory>/<key[0..2]>/<key>.json`. Cache I/O problems are logged and the
 * run continues uncached.
 */
class ExtractionCache {
public:
    using Compute = std::function<Result<ExtractionResult>()>;

    explicit ExtractionCache(CacheOptions options = {});

    ExtractionCache(const ExtractionCache&) = delete;
    ExtractionCache& operator=(const ExtractionCache&) = delete;

    Result<ExtractionResult> getOrCompute(const std::string& key, const Compute& compute);

    std::optional<ExtractionResult> get(const std::string& key);
    void put(const std::string& key, const ExtractionResult& result);

    // Removes memory and disk entries
    Result<void> clear();
    CacheStats stats() const;

    const CacheOptions& options() const { return options_; }

    static std::string cacheKey(std::span<const std::byte> content, const ExtractionConfig& config,
                                std::string_view mimeHint = {});
    // Keyed by path, size and mtime instead of content
    static Result<std::string> cacheKeyForFile(const std::filesystem::path& path,
                                               const ExtractionConfig& config,
                                               std::string_view mimeHint = {});

private:
    std::filesystem::path entryPath(const std::string& key) const;
    std::optional<ExtractionResult> readDisk(const std::string& key);
    Result<void> writeDisk(const std::string& key, const ExtractionResult& result);
    void remember(const std::string& key, const ExtractionResult& result);

    CacheOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExtractionResult> memory_;
    std::deque<std::string> insertionOrder_;
    std::unordered_map<std::string, std::shared_future<Result<ExtractionResult>>> inFlight_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace quarry::cache
