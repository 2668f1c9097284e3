#include <catch2/catch_test_macros.hpp>

#include <quarry/embedding/embedding_backend.h>
#include <quarry/extraction/extractor_registry.h>
#include <quarry/plugins/plugin_registry.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace quarry;
using namespace quarry::plugins;

namespace {

class NamedValidator : public Validator {
public:
    explicit NamedValidator(std::string name, bool failShutdown = false)
        : name_(std::move(name)), failShutdown_(failShutdown) {}

    std::string name() const override { return name_; }
    Result<void> initialize() override {
        ++initialized;
        return {};
    }
    Result<void> shutdown() override {
        ++shutdowns;
        if (failShutdown_) {
            return Error{ErrorCode::Plugin, "cannot stop"};
        }
        return {};
    }
    Result<void> validate(const ExtractionResult&, const ExtractionConfig&) override { return {}; }

    std::atomic<int> initialized{0};
    std::atomic<int> shutdowns{0};

private:
    std::string name_;
    bool failShutdown_;
};

class ThrowingInitValidator : public Validator {
public:
    std::string name() const override { return "exploding"; }
    Result<void> initialize() override { throw std::runtime_error("boom"); }
    Result<void> validate(const ExtractionResult&, const ExtractionConfig&) override { return {}; }
};

class StaticExtractor : public extraction::DocumentExtractor {
public:
    StaticExtractor(std::string name, std::vector<std::string> types, std::string content)
        : name_(std::move(name)), types_(std::move(types)), content_(std::move(content)) {}

    std::string name() const override { return name_; }
    std::vector<std::string> supportedMimeTypes() const override { return types_; }
    Result<ExtractionResult> extract(std::span<const std::byte>, const std::string& mimeType,
                                     const ExtractionConfig&) override {
        ExtractionResult result;
        result.mimeType = mimeType;
        result.content = content_;
        return result;
    }

private:
    std::string name_;
    std::vector<std::string> types_;
    std::string content_;
};

// Answers name() once for registration, then throws
class FlakyNameExtractor : public StaticExtractor {
public:
    FlakyNameExtractor()
        : StaticExtractor("flaky", std::vector<std::string>{"application/x-flaky"}, "flaky body") {}

    std::string name() const override {
        if (registered) {
            throw std::runtime_error("name unavailable");
        }
        return StaticExtractor::name();
    }

    std::atomic<bool> registered{false};
};

} // namespace

TEST_CASE("Registration runs initialize and rejects bad names", "[plugins]") {
    PluginRegistry registry;
    auto v = std::make_shared<NamedValidator>("length");
    REQUIRE(registry.registerValidator(v).has_value());
    CHECK(v->initialized == 1);
    CHECK(registry.listValidators() == std::vector<std::string>{"length"});

    auto empty = registry.registerValidator(std::make_shared<NamedValidator>(""));
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);

    auto spaced = registry.registerValidator(std::make_shared<NamedValidator>("two words"));
    REQUIRE_FALSE(spaced.has_value());
    CHECK(spaced.error().code == ErrorCode::InvalidArgument);

    auto null = registry.registerValidator(nullptr);
    REQUIRE_FALSE(null.has_value());
    CHECK(null.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Replacing a plugin warns and shuts the old one down", "[plugins]") {
    PluginRegistry registry;
    std::vector<std::string> warnings;
    registry.setWarningObserver([&](PluginKind kind, const std::string& name, const std::string& msg) {
        CHECK(kind == PluginKind::Validator);
        warnings.push_back(name + ": " + msg);
    });

    auto first = std::make_shared<NamedValidator>("dup");
    auto second = std::make_shared<NamedValidator>("dup");
    REQUIRE(registry.registerValidator(first).has_value());
    REQUIRE(registry.registerValidator(second).has_value());

    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].find("replaced") != std::string::npos);
    CHECK(first->shutdowns == 1);
    CHECK(second->shutdowns == 0);
    CHECK(registry.listValidators().size() == 1);
}

TEST_CASE("Embedding backend replacement reaches the warning observer", "[plugins]") {
    PluginRegistry registry;
    std::vector<PluginKind> kinds;
    registry.setWarningObserver(
        [&](PluginKind kind, const std::string&, const std::string&) { kinds.push_back(kind); });

    REQUIRE(registry
                .registerEmbeddingBackend(std::make_shared<embedding::HashingEmbeddingBackend>())
                .has_value());
    REQUIRE(registry
                .registerEmbeddingBackend(std::make_shared<embedding::HashingEmbeddingBackend>())
                .has_value());

    REQUIRE(kinds.size() == 1);
    CHECK(kinds[0] == PluginKind::EmbeddingBackend);
}

TEST_CASE("Unregistering an unknown name lists what is registered", "[plugins]") {
    PluginRegistry registry;
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("alpha")).has_value());
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("beta")).has_value());

    auto missing = registry.unregisterValidator("gamma");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::Plugin);
    CHECK(missing.error().message.find("Registered: [alpha, beta]") != std::string::npos);

    REQUIRE(registry.unregisterValidator("alpha").has_value());
    CHECK(registry.listValidators() == std::vector<std::string>{"beta"});
}

TEST_CASE("Throwing lifecycle hooks become Plugin errors", "[plugins]") {
    PluginRegistry registry;
    auto result = registry.registerValidator(std::make_shared<ThrowingInitValidator>());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::Plugin);
    CHECK(result.error().subject == "exploding");
    CHECK(result.error().message.find("boom") != std::string::npos);
    CHECK(registry.listValidators().empty());

    auto direct = invokePlugin("inline", "process", []() -> Result<int> {
        throw std::logic_error("bad state");
    });
    REQUIRE_FALSE(direct.has_value());
    CHECK(direct.error().code == ErrorCode::Plugin);
}

TEST_CASE("Clearing reports failed shutdowns", "[plugins]") {
    PluginRegistry registry;
    auto good = std::make_shared<NamedValidator>("good");
    auto bad = std::make_shared<NamedValidator>("bad", true);
    REQUIRE(registry.registerValidator(good).has_value());
    REQUIRE(registry.registerValidator(bad).has_value());

    auto failures = registry.clearValidators();
    CHECK(failures == std::vector<std::string>{"bad"});
    CHECK(good->shutdowns == 1);
    CHECK(registry.listValidators().empty());
}

TEST_CASE("Snapshots are ordered by priority then registration", "[plugins]") {
    PluginRegistry registry;
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("low"), 10).has_value());
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("high"), 90).has_value());
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("mid-a"), 50).has_value());
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("mid-b"), 50).has_value());

    std::vector<std::string> order;
    for (const auto& reg : registry.validators()) {
        order.push_back(reg.name);
    }
    CHECK(order == std::vector<std::string>{"high", "mid-a", "mid-b", "low"});
}

TEST_CASE("Plugin extractors take precedence over built-ins", "[plugins][extraction]") {
    PluginRegistry registry;
    extraction::ExtractorRegistry extractors(registry);

    auto builtin = extractors.resolve("text/plain");
    REQUIRE(builtin.has_value());
    CHECK(builtin.value().name == "plain_text");
    CHECK_FALSE(builtin.value().fromPlugin);

    REQUIRE(registry
                .registerDocumentExtractor(std::make_shared<StaticExtractor>(
                    "custom-text", std::vector<std::string>{"text/plain"}, "custom"))
                .has_value());
    REQUIRE(registry
                .registerDocumentExtractor(std::make_shared<StaticExtractor>(
                    "lower-priority", std::vector<std::string>{"text/plain"}, "ignored"),
                                           10)
                .has_value());

    auto overridden = extractors.resolve("text/plain");
    REQUIRE(overridden.has_value());
    CHECK(overridden.value().name == "custom-text");
    CHECK(overridden.value().fromPlugin);

    REQUIRE(registry
                .registerDocumentExtractor(std::make_shared<StaticExtractor>(
                    "fancy", std::vector<std::string>{"application/x-fancy"}, "f"))
                .has_value());
    auto types = extractors.supportedMimeTypes();
    CHECK(std::find(types.begin(), types.end(), "application/x-fancy") != types.end());

    registry.clearDocumentExtractors();
    CHECK(extractors.resolve("text/plain").value().name == "plain_text");
    CHECK_FALSE(extractors.resolve("application/x-fancy").has_value());
}

TEST_CASE("Resolving a plugin extractor does not call its name()", "[plugins][extraction]") {
    PluginRegistry registry;
    extraction::ExtractorRegistry extractors(registry);

    auto flaky = std::make_shared<FlakyNameExtractor>();
    REQUIRE(registry.registerDocumentExtractor(flaky).has_value());
    flaky->registered = true;

    auto resolved = extractors.resolve("application/x-flaky");
    REQUIRE(resolved.has_value());
    CHECK(resolved.value().fromPlugin);
    CHECK(resolved.value().name == "flaky");
    CHECK(resolved.value().extractor == flaky);
}

TEST_CASE("Each plugin kind has its own namespace", "[plugins]") {
    PluginRegistry registry;
    REQUIRE(registry.registerValidator(std::make_shared<NamedValidator>("hashing")).has_value());
    REQUIRE(registry
                .registerEmbeddingBackend(std::make_shared<embedding::HashingEmbeddingBackend>())
                .has_value());

    CHECK(registry.listValidators() == std::vector<std::string>{"hashing"});
    CHECK(registry.listEmbeddingBackends() == std::vector<std::string>{"hashing"});
    CHECK(registry.embeddingBackend("hashing") != nullptr);
    CHECK(registry.listOcrBackends().empty());

    CHECK(registry.clearAll().empty());
    CHECK(registry.listValidators().empty());
    CHECK(registry.listEmbeddingBackends().empty());
    CHECK(std::string(toString(PluginKind::EmbeddingBackend)) == "embedding backend");
}
