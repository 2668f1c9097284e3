#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <quarry/embedding/chunk_embedder.h>
#include <quarry/plugins/plugin_registry.h>

#include <cmath>
#include <memory>
#include <stdexcept>

using namespace quarry;
using namespace quarry::embedding;
using Catch::Matchers::WithinAbs;

namespace {

double norm(const Vector& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return std::sqrt(sum);
}

double cosine(const Vector& a, const Vector& b) {
    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
    }
    return dot / (norm(a) * norm(b));
}

std::vector<Chunk> chunksOf(std::initializer_list<const char*> texts) {
    std::vector<Chunk> chunks;
    for (const auto* text : texts) {
        Chunk c;
        c.content = text;
        c.chunkIndex = chunks.size();
        chunks.push_back(std::move(c));
    }
    return chunks;
}

// Reports one dimension and returns another
class LyingBackend : public EmbeddingBackend {
public:
    std::string name() const override { return "lying"; }
    Result<size_t> dimensions(const std::string&) const override { return size_t{8}; }
    Result<std::vector<Vector>> embed(const std::vector<std::string>& texts,
                                      const std::string&) override {
        return std::vector<Vector>(texts.size(), Vector(4, 1.0f));
    }
};

class ThrowingBackend : public EmbeddingBackend {
public:
    std::string name() const override { return "throwing"; }
    Result<size_t> dimensions(const std::string&) const override { return size_t{8}; }
    Result<std::vector<Vector>> embed(const std::vector<std::string>&, const std::string&) override {
        throw std::runtime_error("model not loaded");
    }
};

// Counts batches and returns constant vectors
class BatchCountingBackend : public EmbeddingBackend {
public:
    std::string name() const override { return "batches"; }
    Result<size_t> dimensions(const std::string&) const override { return size_t{3}; }
    Result<std::vector<Vector>> embed(const std::vector<std::string>& texts,
                                      const std::string&) override {
        ++batches;
        return std::vector<Vector>(texts.size(), Vector{3.0f, 0.0f, 4.0f});
    }
    int batches = 0;
};

} // namespace

TEST_CASE("Preset dimensions", "[embedding]") {
    CHECK(presetDimensions("fast") == std::optional<size_t>(384));
    CHECK(presetDimensions("balanced") == std::optional<size_t>(768));
    CHECK(presetDimensions("quality") == std::optional<size_t>(1024));
    CHECK(presetDimensions("multilingual") == std::optional<size_t>(768));
    CHECK_FALSE(presetDimensions("huge").has_value());

    HashingEmbeddingBackend backend;
    auto unknown = backend.dimensions("huge");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::Validation);
}

TEST_CASE("Hashing embeddings are deterministic and similarity-preserving", "[embedding]") {
    HashingEmbeddingBackend backend;
    auto vectors = backend.embed({"invoice payment due date", "payment due on the invoice date",
                                  "mountain hiking trail weather"},
                                 "fast");
    REQUIRE(vectors.has_value());
    const auto& v = vectors.value();
    REQUIRE(v.size() == 3);
    CHECK(v[0].size() == 384);

    auto again = backend.embed({"invoice payment due date"}, "fast");
    REQUIRE(again.has_value());
    CHECK(again.value()[0] == v[0]);

    CHECK(cosine(v[0], v[1]) > cosine(v[0], v[2]));

    Vector zero(4, 0.0f);
    l2Normalize(zero);
    CHECK(zero == Vector(4, 0.0f));
}

TEST_CASE("Chunk embedding uses the built-in backend", "[embedding]") {
    plugins::PluginRegistry plugins;
    ChunkEmbedder embedder(plugins);
    auto chunks = chunksOf({"first chunk of text", "second chunk of text"});

    REQUIRE(embedder.embed(chunks, EmbeddingConfig{.model = "quality"}).has_value());
    for (const auto& c : chunks) {
        REQUIRE(c.embedding.has_value());
        CHECK(c.embedding->size() == 1024);
        CHECK_THAT(norm(*c.embedding), WithinAbs(1.0, 1e-5));
    }
}

TEST_CASE("Unknown backends are a missing dependency", "[embedding]") {
    plugins::PluginRegistry plugins;
    ChunkEmbedder embedder(plugins);
    auto chunks = chunksOf({"text"});

    auto result = embedder.embed(chunks, EmbeddingConfig{.backend = "onnx"});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::MissingDependency);
    CHECK(result.error().message.find("hashing") != std::string::npos);
    CHECK_FALSE(chunks[0].embedding.has_value());

    auto preset = embedder.embed(chunks, EmbeddingConfig{.model = "huge"});
    REQUIRE_FALSE(preset.has_value());
    CHECK(preset.error().code == ErrorCode::Validation);
}

TEST_CASE("Plugin backends are checked for consistency", "[embedding]") {
    plugins::PluginRegistry plugins;
    REQUIRE(plugins.registerEmbeddingBackend(std::make_shared<LyingBackend>()).has_value());
    REQUIRE(plugins.registerEmbeddingBackend(std::make_shared<ThrowingBackend>()).has_value());
    ChunkEmbedder embedder(plugins);
    auto chunks = chunksOf({"a", "b"});

    auto lying = embedder.embed(chunks, EmbeddingConfig{.backend = "lying"});
    REQUIRE_FALSE(lying.has_value());
    CHECK(lying.error().code == ErrorCode::Plugin);
    CHECK(lying.error().message.find("dimension 4, expected 8") != std::string::npos);
    CHECK_FALSE(chunks[0].embedding.has_value());

    auto thrown = embedder.embed(chunks, EmbeddingConfig{.backend = "throwing"});
    REQUIRE_FALSE(thrown.has_value());
    CHECK(thrown.error().code == ErrorCode::Plugin);
    CHECK(thrown.error().subject == "throwing");
}

TEST_CASE("Embedding runs in batches and normalizes on request", "[embedding]") {
    plugins::PluginRegistry plugins;
    auto backend = std::make_shared<BatchCountingBackend>();
    REQUIRE(plugins.registerEmbeddingBackend(backend).has_value());
    ChunkEmbedder embedder(plugins);

    auto chunks = chunksOf({"1", "2", "3", "4", "5"});
    REQUIRE(embedder.embed(chunks, EmbeddingConfig{.backend = "batches", .batchSize = 2}).has_value());
    CHECK(backend->batches == 3);
    CHECK_THAT((*chunks[4].embedding)[0], WithinAbs(0.6, 1e-6));

    auto raw = chunksOf({"x"});
    REQUIRE(embedder.embed(raw, EmbeddingConfig{.backend = "batches", .normalize = false}).has_value());
    CHECK((*raw[0].embedding)[2] == 4.0f);
}
