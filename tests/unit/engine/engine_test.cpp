#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <quarry/engine/engine.h>
#include <quarry/plugins/plugin_registry.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace quarry;
using namespace quarry::engine;

namespace {

ExtractionConfig uncached() {
    ExtractionConfig config;
    config.useCache = false;
    return config;
}

// Plain-text extractor that takes its time and tracks how many run at once
class SlowTextExtractor : public extraction::DocumentExtractor {
public:
    explicit SlowTextExtractor(std::chrono::milliseconds delay) : delay_(delay) {}

    std::string name() const override { return "slow-text"; }
    std::vector<std::string> supportedMimeTypes() const override { return {"text/plain"}; }
    Result<ExtractionResult> extract(std::span<const std::byte> bytes, const std::string& mimeType,
                                     const ExtractionConfig&) override {
        const int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(delay_);
        --running;
        ExtractionResult result;
        result.mimeType = mimeType;
        result.content.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return result;
    }

    std::atomic<int> running{0};
    std::atomic<int> peak{0};

private:
    std::chrono::milliseconds delay_;
};

class ThrowingExtractor : public extraction::DocumentExtractor {
public:
    std::string name() const override { return "explosive"; }
    std::vector<std::string> supportedMimeTypes() const override { return {"text/plain"}; }
    Result<ExtractionResult> extract(std::span<const std::byte>, const std::string&,
                                     const ExtractionConfig&) override {
        throw std::runtime_error("parser crashed");
    }
};

// Loses its name() after registration and throws from extract()
class NamelessThrowingExtractor : public ThrowingExtractor {
public:
    std::string name() const override {
        if (registered) {
            throw std::logic_error("name lookup failed");
        }
        return "nameless";
    }

    std::atomic<bool> registered{false};
};

} // namespace

TEST_CASE("Bytes are classified, extracted and post-processed", "[engine]") {
    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 2});

    auto result = engine.extractBytes(test::as_bytes("Hello engine.\nSecond line."), std::nullopt,
                                      uncached());
    REQUIRE(result.has_value());
    CHECK(result.value().mimeType == "text/plain");
    CHECK(result.value().content == "Hello engine.\nSecond line.");
    CHECK(result.value().qualityScore.has_value());
    CHECK(result.value().metadata.additional["output_format"] == "plain");
}

TEST_CASE("Input checks run before extraction", "[engine]") {
    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 1});

    auto tooBig = uncached();
    tooBig.maxFileSize = 4;
    auto size = engine.extractBytes(test::as_bytes("more than four bytes"), std::nullopt, tooBig);
    REQUIRE_FALSE(size.has_value());
    CHECK(size.error().code == ErrorCode::Validation);

    auto badChunks = uncached();
    badChunks.chunking = ChunkingConfig{.maxChars = 10, .maxOverlap = 50};
    auto chunks = engine.extractBytes(test::as_bytes("text"), std::nullopt, badChunks);
    REQUIRE_FALSE(chunks.has_value());
    CHECK(chunks.error().code == ErrorCode::Validation);

    auto missing = engine.extractFile("/nonexistent/quarry/input.pdf", std::nullopt, uncached());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::Io);
    CHECK(missing.error().message.find("No such file") != std::string::npos);

    const std::string binary("\x01\x02\x03\x04\x00\x00\xfe\xfd\x00\x11", 10);
    auto unknown = engine.extractBytes(test::as_bytes(binary), std::nullopt, uncached());
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::UnsupportedFormat);
}

TEST_CASE("A contradicted declared type produces a warning", "[engine]") {
    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 1});

    auto result = engine.extractBytes(test::as_bytes("just plain words here"),
                                      std::string("application/pdf"), uncached());
    REQUIRE(result.has_value());
    CHECK(result.value().mimeType == "text/plain");
    REQUIRE_FALSE(result.value().warnings.empty());
    CHECK(result.value().warnings.front().source == "detection");
}

TEST_CASE("force_ocr leaves text-layer documents extractable", "[engine][ocr]") {
    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 2});

    const std::string document =
        R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
        "<w:body><w:p><w:r><w:t>Word body text.</w:t></w:r></w:p></w:body></w:document>";
    const auto docx = test::make_zip({{"[Content_Types].xml", "<Types/>"},
                                      {"word/document.xml", document}});

    auto config = uncached();
    config.forceOcr = true;
    auto results = engine.batchExtractBytes(
        {{test::to_bytes("plain words survive"), std::nullopt}, {docx, std::nullopt}}, config);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].has_value());
    CHECK(results[0].value().content == "plain words survive");
    REQUIRE(results[1].has_value());
    CHECK(results[1].value().content == "Word body text.");
}

TEST_CASE("Plain ZIP archives are extracted", "[engine][archive]") {
    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 1});

    auto zip = test::make_zip({{"chapter1.txt", "It was a bright cold day."}, {"cover.bin", "xx"}});
    auto result = engine.extractBytes(zip, std::nullopt, uncached());
    REQUIRE(result.has_value());
    CHECK(result.value().mimeType == "application/zip");
    CHECK(result.value().content.find("It was a bright cold day.") != std::string::npos);
    CHECK(result.value().metadata.additional["file_count"] == 2);
}

TEST_CASE("Repeated extractions are served from the cache", "[engine][cache]") {
    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 1});
    const auto bytes = test::as_bytes("cache me if you can");

    auto first = engine.extractBytes(bytes, std::nullopt, {});
    auto second = engine.extractBytes(bytes, std::nullopt, {});
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first.value().content == second.value().content);
    CHECK(engine.cache().stats().hits == 1);
    CHECK(engine.cache().stats().misses == 1);
}

TEST_CASE("Plugin extractor exceptions become Plugin errors", "[engine][plugins]") {
    plugins::PluginRegistry plugins;
    REQUIRE(plugins.registerDocumentExtractor(std::make_shared<ThrowingExtractor>()).has_value());
    Engine engine(plugins, EngineOptions{.workerThreads = 1});

    auto result = engine.extractBytes(test::as_bytes("plain text input"), std::nullopt, uncached());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::Plugin);
    CHECK(result.error().subject == "explosive");
    CHECK(result.error().message.find("parser crashed") != std::string::npos);
}

TEST_CASE("Plugin errors carry the registered name when name() throws", "[engine][plugins]") {
    plugins::PluginRegistry plugins;
    auto extractor = std::make_shared<NamelessThrowingExtractor>();
    REQUIRE(plugins.registerDocumentExtractor(extractor).has_value());
    extractor->registered = true;
    Engine engine(plugins, EngineOptions{.workerThreads = 1});

    auto result = engine.extractBytes(test::as_bytes("plain text input"), std::nullopt, uncached());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::Plugin);
    CHECK(result.error().subject == "nameless");
    CHECK(result.error().message.find("parser crashed") != std::string::npos);
}

TEST_CASE("Batch results keep order and isolate failures", "[engine][batch]") {
    test::TempDir dir("quarry_engine_batch_");
    const auto a = test::write_file(dir / "a.txt", "first document");
    const auto b = test::write_file(dir / "c.md", "# Third\n\nmarkdown body");

    plugins::PluginRegistry plugins;
    Engine engine(plugins, EngineOptions{.workerThreads = 2});
    auto results = engine.batchExtractFiles({a, dir / "missing.txt", b}, uncached());

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].has_value());
    CHECK(results[0].value().content == "first document");
    REQUIRE_FALSE(results[1].has_value());
    CHECK(results[1].error().code == ErrorCode::Io);
    REQUIRE(results[2].has_value());
    CHECK(results[2].value().mimeType == "text/markdown");
    CHECK(results[2].value().metadata.title == std::optional<std::string>("Third"));
}

TEST_CASE("Batch concurrency honours max_concurrent_extractions", "[engine][batch]") {
    plugins::PluginRegistry plugins;
    auto slow = std::make_shared<SlowTextExtractor>(std::chrono::milliseconds(30));
    REQUIRE(plugins.registerDocumentExtractor(slow).has_value());
    Engine engine(plugins, EngineOptions{.workerThreads = 4});

    std::vector<BytesInput> items;
    for (int i = 0; i < 6; ++i) {
        items.push_back({test::to_bytes("item " + std::to_string(i)), std::string("text/plain")});
    }
    auto config = uncached();
    config.maxConcurrentExtractions = 1;
    auto results = engine.batchExtractBytes(items, config);

    REQUIRE(results.size() == items.size());
    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].has_value());
        CHECK(results[i].value().content == "item " + std::to_string(i));
    }
    CHECK(slow->peak == 1);
}

TEST_CASE("Deferred extraction can be polled and awaited", "[engine][async]") {
    plugins::PluginRegistry plugins;
    REQUIRE(plugins
                .registerDocumentExtractor(
                    std::make_shared<SlowTextExtractor>(std::chrono::milliseconds(300)))
                .has_value());
    Engine engine(plugins, EngineOptions{.workerThreads = 1});

    auto handle = engine.extractBytesAsync(test::to_bytes("eventually"), std::nullopt, uncached());
    REQUIRE(handle.valid());
    CHECK_FALSE(handle.wait(std::chrono::milliseconds(0)));
    CHECK_FALSE(handle.tryGetResult().has_value());

    auto result = handle.getResult();
    REQUIRE(result.has_value());
    CHECK(result.value().content == "eventually");
    CHECK(handle.isReady());
    CHECK(handle.tryGetResult().has_value());

    DeferredExtraction empty;
    auto none = empty.getResult();
    REQUIRE_FALSE(none.has_value());
    CHECK(none.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Dropped handles do not cancel work", "[engine][async]") {
    plugins::PluginRegistry plugins;
    auto slow = std::make_shared<SlowTextExtractor>(std::chrono::milliseconds(20));
    REQUIRE(plugins.registerDocumentExtractor(slow).has_value());
    {
        Engine engine(plugins, EngineOptions{.workerThreads = 1});
        {
            auto dropped = engine.extractBytesAsync(test::to_bytes("fire and forget"), std::nullopt,
                                                    uncached());
        }
        // The pool drains queued work before the engine goes away
    }
    CHECK(slow->peak == 1);
}
