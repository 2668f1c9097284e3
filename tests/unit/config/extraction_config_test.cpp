#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <quarry/config/config_helpers.h>
#include <quarry/config/settings.h>

using namespace quarry;
using namespace quarry::config;
using nlohmann::json;

TEST_CASE("Extraction config defaults", "[config]") {
    ExtractionConfig cfg;
    CHECK(cfg.useCache);
    CHECK(cfg.enableQualityProcessing);
    CHECK_FALSE(cfg.forceOcr);
    CHECK(cfg.outputFormat == OutputFormat::Plain);
    CHECK_FALSE(cfg.chunking.has_value());
    CHECK(cfg.effectiveOcr().backend == "tesseract");
    CHECK(cfg.effectiveOcr().language == "eng");
    CHECK(cfg.effectiveLanguageDetection().enabled);
    CHECK(cfg.effectivePostprocessor().enabled);
    CHECK(cfg.effectiveConcurrency() >= 1);
}

TEST_CASE("Extraction config accepts snake_case and camelCase keys", "[config]") {
    auto snake = ExtractionConfig::fromJson(json::parse(R"({
        "use_cache": false,
        "force_ocr": true,
        "output_format": "markdown",
        "chunking": {"max_chars": 500, "max_overlap": 50, "strategy": "sentence"},
        "ocr": {"backend": "mock", "language": "deu"}
    })"));
    auto camel = ExtractionConfig::fromJson(json::parse(R"({
        "useCache": false,
        "forceOcr": true,
        "outputFormat": "markdown",
        "chunking": {"maxChars": 500, "maxOverlap": 50, "strategy": "sentence"},
        "ocr": {"backend": "mock", "language": "deu"}
    })"));
    REQUIRE(snake.has_value());
    REQUIRE(camel.has_value());

    const auto& a = snake.value();
    CHECK_FALSE(a.useCache);
    CHECK(a.forceOcr);
    CHECK(a.outputFormat == OutputFormat::Markdown);
    REQUIRE(a.chunking.has_value());
    CHECK(a.chunking->maxChars == 500);
    CHECK(a.chunking->maxOverlap == 50);
    CHECK(a.chunking->strategy == ChunkingStrategy::Sentence);
    CHECK(a.effectiveOcr().backend == "mock");

    CHECK(a.fingerprint() == camel.value().fingerprint());
}

TEST_CASE("Extraction config rejects invalid values", "[config]") {
    auto check = [](const char* text) {
        auto parsed = ExtractionConfig::fromJson(json::parse(text));
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::Validation);
    };
    check(R"({"output_format": "pdf"})");
    check(R"({"chunking": {"max_chars": 100, "max_overlap": 100}})");
    check(R"({"chunking": {"max_chars": 0}})");
    check(R"({"chunking": {"strategy": "words"}})");
    check(R"({"ocr": {"coverage_threshold": 1.5}})");
    check(R"({"use_cache": "sometimes"})");
    check(R"({"keywords": {"ngram_range": [3, 1]}})");
    check(R"({"postprocessor": {"enabled_processors": "quality"}})");
    check(R"([1, 2, 3])");
}

TEST_CASE("Fingerprint ignores concurrency but tracks output-affecting fields", "[config]") {
    ExtractionConfig a;
    ExtractionConfig b;
    b.maxConcurrentExtractions = 2;
    CHECK(a.fingerprint() == b.fingerprint());

    ExtractionConfig c;
    c.outputFormat = OutputFormat::Html;
    CHECK(a.fingerprint() != c.fingerprint());

    ExtractionConfig d;
    d.chunking = ChunkingConfig{};
    CHECK(a.fingerprint() != d.fingerprint());
}

TEST_CASE("toJson output parses back to the same configuration", "[config]") {
    ExtractionConfig cfg;
    cfg.chunking = ChunkingConfig{300, 30, ChunkingStrategy::Paragraph, EmbeddingConfig{}};
    cfg.keywords = KeywordConfig{};
    cfg.keywords->algorithm = KeywordAlgorithm::Cooccurrence;
    cfg.tokenReduction = TokenReductionConfig{ReductionMode::Moderate, true};
    cfg.postprocessor = PostProcessorConfig{};
    cfg.postprocessor->disabledProcessors = std::set<std::string>{"quality"};

    auto back = ExtractionConfig::fromJson(cfg.toJson());
    REQUIRE(back.has_value());
    CHECK(back.value().fingerprint() == cfg.fingerprint());
    CHECK_FALSE(back.value().postprocessor->isProcessorEnabled("quality"));
    CHECK(back.value().postprocessor->isProcessorEnabled("keywords"));
}

TEST_CASE("Processor filtering honours enabled, allow and deny lists", "[config]") {
    PostProcessorConfig pp;
    CHECK(pp.isProcessorEnabled("anything"));

    pp.enabledProcessors = std::set<std::string>{"quality", "upper"};
    CHECK(pp.isProcessorEnabled("upper"));
    CHECK_FALSE(pp.isProcessorEnabled("keywords"));

    pp.disabledProcessors = std::set<std::string>{"upper"};
    CHECK_FALSE(pp.isProcessorEnabled("upper"));

    pp.enabled = false;
    CHECK_FALSE(pp.isProcessorEnabled("quality"));
}

TEST_CASE("Settings file layout and environment overrides", "[config][settings]") {
    test::TempDir dir("quarry_config_");
    const auto path = test::write_file(dir / "quarry.json", R"({
        "extraction": {"use_cache": true, "output_format": "html"},
        "logging": {"level": "debug"},
        "cache": {"persistToDisk": false, "max_memory_entries": 8}
    })");

    SECTION("file values are read") {
        auto loaded = ConfigLoader::loadFile(path);
        REQUIRE(loaded.has_value());
        const auto& s = loaded.value();
        CHECK(s.extraction.outputFormat == OutputFormat::Html);
        CHECK(s.logging.level == "debug");
        CHECK_FALSE(s.cache.persistToDisk);
        CHECK(s.cache.maxMemoryEntries == 8);
    }

    SECTION("environment wins over the file") {
        test::ScopedEnvVar useCache("QUARRY_USE_CACHE", "off");
        test::ScopedEnvVar concurrency("QUARRY_MAX_CONCURRENCY", "3");
        test::ScopedEnvVar backend("QUARRY_OCR_BACKEND", "mock");
        test::ScopedEnvVar level("QUARRY_LOG_LEVEL", "warn");

        auto loaded = ConfigLoader::load(path.string());
        REQUIRE(loaded.has_value());
        const auto& s = loaded.value();
        CHECK_FALSE(s.extraction.useCache);
        CHECK(s.extraction.effectiveConcurrency() == 3);
        CHECK(s.extraction.effectiveOcr().backend == "mock");
        CHECK(s.logging.level == "warn");
    }

    SECTION("malformed values in the environment are ignored") {
        test::ScopedEnvVar useCache("QUARRY_USE_CACHE", "perhaps");
        auto loaded = ConfigLoader::load(path.string());
        REQUIRE(loaded.has_value());
        CHECK(loaded.value().extraction.useCache);
    }
}

TEST_CASE("Missing settings files", "[config][settings]") {
    test::TempDir dir("quarry_config_");
    auto explicitPath = ConfigLoader::load((dir / "absent.json").string());
    REQUIRE_FALSE(explicitPath.has_value());
    CHECK(explicitPath.error().code == ErrorCode::Io);

    test::ScopedEnvVar configEnv("QUARRY_CONFIG", (dir / "also-absent.json").string());
    auto defaults = ConfigLoader::load();
    REQUIRE(defaults.has_value());
    CHECK(defaults.value().extraction.outputFormat == OutputFormat::Plain);
}

TEST_CASE("Malformed settings file is a parsing error", "[config][settings]") {
    test::TempDir dir("quarry_config_");
    const auto path = test::write_file(dir / "quarry.json", "{ not json");
    auto loaded = ConfigLoader::loadFile(path);
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == ErrorCode::Parsing);
}

TEST_CASE("Config helpers", "[config]") {
    CHECK(parse_bool("YES") == true);
    CHECK(parse_bool("off") == false);
    CHECK_FALSE(parse_bool("maybe").has_value());

    test::ScopedEnvVar cacheDir("QUARRY_CACHE_DIR", "/tmp/quarry-cache-test");
    CHECK(get_cache_dir() == std::filesystem::path("/tmp/quarry-cache-test"));

    CHECK(configureLogging(LoggingConfig{"verbose"}).has_value() == false);
    CHECK(configureLogging(LoggingConfig{"warn"}).has_value());
}
