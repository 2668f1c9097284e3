#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <quarry/cache/extraction_cache.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace quarry;
using namespace quarry::cache;

namespace {

ExtractionResult sampleResult(const std::string& content) {
    ExtractionResult result;
    result.content = content;
    result.mimeType = "text/plain";
    result.metadata.title = "Cached";
    result.metadata.set("line_count", 1);
    return result;
}

} // namespace

TEST_CASE("Cache keys depend on content, config and hint", "[cache]") {
    const auto bytes = test::as_bytes("same content");
    ExtractionConfig base;
    const auto key = ExtractionCache::cacheKey(bytes, base);
    CHECK(key.size() == 64);
    CHECK(key == ExtractionCache::cacheKey(bytes, base));

    ExtractionConfig chunked;
    chunked.chunking = ChunkingConfig{};
    CHECK(key != ExtractionCache::cacheKey(bytes, chunked));
    CHECK(key != ExtractionCache::cacheKey(test::as_bytes("other content"), base));
    CHECK(key != ExtractionCache::cacheKey(bytes, base, "text/markdown"));

    ExtractionConfig concurrent;
    concurrent.maxConcurrentExtractions = 3;
    CHECK(key == ExtractionCache::cacheKey(bytes, concurrent));
}

TEST_CASE("File keys track the file", "[cache]") {
    test::TempDir dir("quarry_cache_key_");
    const auto path = dir / "doc.txt";
    test::write_file(path, "one");
    auto first = ExtractionCache::cacheKeyForFile(path, {});
    REQUIRE(first.has_value());

    test::write_file(path, "one plus more");
    auto second = ExtractionCache::cacheKeyForFile(path, {});
    REQUIRE(second.has_value());
    CHECK(first.value() != second.value());

    auto missing = ExtractionCache::cacheKeyForFile(dir / "nope.txt", {});
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::Io);
}

TEST_CASE("Concurrent callers share one computation", "[cache][concurrency]") {
    ExtractionCache cache;
    std::atomic<int> computations{0};
    const auto compute = [&]() -> Result<ExtractionResult> {
        ++computations;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return sampleResult("expensive");
    };

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            auto result = cache.getOrCompute("shared-key", compute);
            if (result && result.value().content == "expensive") {
                ++ok;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(computations == 1);
    CHECK(ok == kThreads);
    auto stats = cache.stats();
    CHECK(stats.misses == 1);
    CHECK(stats.hits == kThreads - 1);
    CHECK(stats.entries == 1);
}

TEST_CASE("Failed computations are not cached", "[cache]") {
    ExtractionCache cache;
    int calls = 0;
    const auto failing = [&]() -> Result<ExtractionResult> {
        ++calls;
        return Error{ErrorCode::Parsing, "bad document"};
    };

    auto first = cache.getOrCompute("k", failing);
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error().code == ErrorCode::Parsing);
    auto second = cache.getOrCompute("k", failing);
    REQUIRE_FALSE(second.has_value());
    CHECK(calls == 2);
    CHECK(cache.stats().entries == 0);
}

TEST_CASE("Disk entries survive a new cache instance", "[cache]") {
    test::TempDir dir("quarry_cache_disk_");
    const std::string key = ExtractionCache::cacheKey(test::as_bytes("persisted"), {});
    {
        ExtractionCache cache(CacheOptions{.directory = dir.path()});
        REQUIRE(cache.getOrCompute(key, [] { return Result<ExtractionResult>(sampleResult("from disk")); })
                    .has_value());
        auto stats = cache.stats();
        CHECK(stats.diskEntries == 1);
        CHECK(stats.totalSizeBytes > 0);
    }

    ExtractionCache reopened(CacheOptions{.directory = dir.path()});
    bool computed = false;
    auto result = reopened.getOrCompute(key, [&]() -> Result<ExtractionResult> {
        computed = true;
        return Error{ErrorCode::Unknown, "should not run"};
    });
    REQUIRE(result.has_value());
    CHECK_FALSE(computed);
    CHECK(result.value().content == "from disk");
    CHECK(result.value().metadata.title == std::optional<std::string>("Cached"));
    CHECK(result.value().metadata.additional["line_count"] == 1);
    CHECK(reopened.stats().hits == 1);
}

TEST_CASE("Corrupted disk entries are removed", "[cache]") {
    test::TempDir dir("quarry_cache_corrupt_");
    const std::string key(64, 'a');
    const auto entry = dir / "aa" / (key + ".json");
    std::filesystem::create_directories(entry.parent_path());
    test::write_file(entry, "{not json");

    ExtractionCache cache(CacheOptions{.directory = dir.path()});
    CHECK_FALSE(cache.get(key).has_value());
    CHECK_FALSE(std::filesystem::exists(entry));
}

TEST_CASE("Clear empties memory and disk", "[cache]") {
    test::TempDir dir("quarry_cache_clear_");
    ExtractionCache cache(CacheOptions{.directory = dir.path()});
    cache.put(std::string(64, 'b'), sampleResult("one"));
    cache.put(std::string(64, 'c'), sampleResult("two"));
    CHECK(cache.stats().diskEntries == 2);

    REQUIRE(cache.clear().has_value());
    auto stats = cache.stats();
    CHECK(stats.entries == 0);
    CHECK(stats.diskEntries == 0);
    CHECK_FALSE(cache.get(std::string(64, 'b')).has_value());

    auto json = stats.toJson();
    CHECK(json.contains("hits"));
    CHECK(json.contains("disk_entries"));
    CHECK(json.contains("total_size_bytes"));
}

TEST_CASE("Memory entries are bounded", "[cache]") {
    ExtractionCache cache(CacheOptions{.maxEntries = 2});
    cache.put("first", sampleResult("1"));
    cache.put("second", sampleResult("2"));
    cache.put("third", sampleResult("3"));
    CHECK(cache.stats().entries == 2);
    CHECK_FALSE(cache.get("first").has_value());
    CHECK(cache.get("third").has_value());
}
