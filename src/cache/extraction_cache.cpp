#include <quarry/cache/extraction_cache.h>
#include <quarry/crypto/hasher.h>
#include <quarry/version.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace quarry::cache {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kKeyDomain = "quarry-extraction-cache-v1";

std::string keyFrom(std::string_view identity, const ExtractionConfig& config,
                    std::string_view mimeHint) {
    crypto::SHA256Hasher hasher;
    hasher.update(kKeyDomain);
    hasher.update(std::string_view("\0", 1));
    hasher.update(std::string_view(QUARRY_VERSION_STRING));
    hasher.update(std::string_view("\0", 1));
    hasher.update(identity);
    hasher.update(std::string_view("\0", 1));
    hasher.update(mimeHint);
    hasher.update(std::string_view("\0", 1));
    hasher.update(config.fingerprint());
    return hasher.finalize();
}

} // namespace

nlohmann::json CacheStats::toJson() const {
    return {{"entries", entries},
            {"hits", hits},
            {"misses", misses},
            {"disk_entries", diskEntries},
            {"total_size_bytes", totalSizeBytes}};
}

ExtractionCache::ExtractionCache(CacheOptions options) : options_(std::move(options)) {
    if (!options_.directory.empty()) {
        std::error_code ec;
        fs::create_directories(options_.directory, ec);
        if (ec) {
            spdlog::warn("Cache directory {} is unusable ({}); caching in memory only",
                         options_.directory.string(), ec.message());
            options_.directory.clear();
        }
    }
}

std::string ExtractionCache::cacheKey(std::span<const std::byte> content,
                                      const ExtractionConfig& config, std::string_view mimeHint) {
    return keyFrom("content:" + crypto::SHA256Hasher::hash(content), config, mimeHint);
}

Result<std::string> ExtractionCache::cacheKeyForFile(const fs::path& path,
                                                     const ExtractionConfig& config,
                                                     std::string_view mimeHint) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        canonical = path;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot stat " + path.string() + ": " + ec.message()};
    }
    const auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot stat " + path.string() + ": " + ec.message()};
    }
    std::ostringstream identity;
    identity << "file:" << canonical.string() << ':' << size << ':'
             << mtime.time_since_epoch().count();
    return keyFrom(identity.str(), config, mimeHint);
}

fs::path ExtractionCache::entryPath(const std::string& key) const {
    return options_.directory / key.substr(0, 2) / (key + ".json");
}

std::optional<ExtractionResult> ExtractionCache::readDisk(const std::string& key) {
    if (options_.directory.empty()) {
        return std::nullopt;
    }
    const auto path = entryPath(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    if (options_.maxAgeSeconds > 0) {
        const auto written = fs::last_write_time(path, ec);
        if (!ec) {
            const auto age = fs::file_time_type::clock::now() - written;
            if (age > std::chrono::seconds(options_.maxAgeSeconds)) {
                spdlog::debug("Cache entry {} expired", key);
                fs::remove(path, ec);
                return std::nullopt;
            }
        }
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::warn("{}: cannot read cache entry {}", errorToString(ErrorCode::Cache), path.string());
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (!j.is_discarded()) {
        auto parsed = ExtractionResult::fromJson(j);
        if (parsed) {
            return std::move(parsed).value();
        }
    }
    spdlog::warn("{}: corrupted cache entry {} removed", errorToString(ErrorCode::Cache), path.string());
    in.close();
    fs::remove(path, ec);
    return std::nullopt;
}

Result<void> ExtractionCache::writeDisk(const std::string& key, const ExtractionResult& result) {
    if (options_.directory.empty()) {
        return {};
    }
    const auto path = entryPath(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::Cache, "Cannot create " + path.parent_path().string() + ": " +
                                           ec.message()};
    }
    // Write then rename so readers never see a partial entry
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::Cache, "Cannot write " + tmp.string()};
        }
        out << result.toJson().dump();
        if (!out) {
            return Error{ErrorCode::Cache, "Short write to " + tmp.string()};
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::Cache, "Cannot publish cache entry " + path.string()};
    }
    return {};
}

void ExtractionCache::remember(const std::string& key, const ExtractionResult& result) {
    std::lock_guard lock(mutex_);
    if (memory_.insert_or_assign(key, result).second) {
        insertionOrder_.push_back(key);
    }
    while (options_.maxEntries > 0 && memory_.size() > options_.maxEntries &&
           !insertionOrder_.empty()) {
        memory_.erase(insertionOrder_.front());
        insertionOrder_.pop_front();
    }
}

std::optional<ExtractionResult> ExtractionCache::get(const std::string& key) {
    {
        std::lock_guard lock(mutex_);
        if (auto it = memory_.find(key); it != memory_.end()) {
            return it->second;
        }
    }
    auto fromDisk = readDisk(key);
    if (fromDisk) {
        remember(key, *fromDisk);
    }
    return fromDisk;
}

void ExtractionCache::put(const std::string& key, const ExtractionResult& result) {
    remember(key, result);
    if (auto written = writeDisk(key, result); !written) {
        spdlog::warn("{}: {}", errorToString(ErrorCode::Cache), written.error().message);
    }
}

Result<ExtractionResult> ExtractionCache::getOrCompute(const std::string& key,
                                                       const Compute& compute) {
    std::promise<Result<ExtractionResult>> promise;
    {
        std::unique_lock lock(mutex_);
        if (auto it = memory_.find(key); it != memory_.end()) {
            ++hits_;
            return it->second;
        }
        if (auto it = inFlight_.find(key); it != inFlight_.end()) {
            auto pending = it->second;
            lock.unlock();
            ++hits_;
            spdlog::debug("Waiting for in-flight extraction {}", key);
            return pending.get();
        }
        inFlight_.emplace(key, promise.get_future().share());
    }

    auto finish = [&](const Result<ExtractionResult>& value) {
        {
            std::lock_guard lock(mutex_);
            inFlight_.erase(key);
        }
        promise.set_value(value);
    };

    if (auto fromDisk = readDisk(key)) {
        ++hits_;
        remember(key, *fromDisk);
        Result<ExtractionResult> value(std::move(*fromDisk));
        finish(value);
        return value;
    }

    ++misses_;
    Result<ExtractionResult> value = Error{ErrorCode::Unknown};
    try {
        value = compute();
    } catch (...) {
        {
            std::lock_guard lock(mutex_);
            inFlight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    if (value) {
        put(key, value.value());
    }
    finish(value);
    return value;
}

Result<void> ExtractionCache::clear() {
    {
        std::lock_guard lock(mutex_);
        memory_.clear();
        insertionOrder_.clear();
    }
    hits_ = 0;
    misses_ = 0;
    if (options_.directory.empty()) {
        return {};
    }
    std::error_code ec;
    for (const auto& shard : fs::directory_iterator(options_.directory, ec)) {
        if (shard.is_directory() && shard.path().filename().string().size() == 2) {
            fs::remove_all(shard.path(), ec);
            if (ec) {
                return Error{ErrorCode::Cache,
                             "Cannot remove " + shard.path().string() + ": " + ec.message()};
            }
        }
    }
    if (ec) {
        return Error{ErrorCode::Cache,
                     "Cannot list " + options_.directory.string() + ": " + ec.message()};
    }
    spdlog::info("Cleared extraction cache at {}", options_.directory.string());
    return {};
}

CacheStats ExtractionCache::stats() const {
    CacheStats s;
    {
        std::lock_guard lock(mutex_);
        s.entries = memory_.size();
    }
    s.hits = hits_.load();
    s.misses = misses_.load();
    if (options_.directory.empty()) {
        return s;
    }
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(options_.directory, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") {
            ++s.diskEntries;
            s.totalSizeBytes += it->file_size(ec);
        }
    }
    return s;
}

} // namespace quarry::cache
