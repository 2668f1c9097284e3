#pragma once

#include <quarry/core/types.h>
#include <quarry/plugins/plugin.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::embedding {

using Vector = std::vector<float>;

// Dimension of a named preset: fast 384, balanced 768, quality 1024, multilingual 768
std::optional<size_t> presetDimensions(std::string_view preset);

/**
 * @brief Turns a batch of strings into fixed-dimension vectors.
 *
 * `model` is a preset name or a backend-specific model identifier. Every
 * returned vector has dimensions(model) entries, one per input, in order.
 */
class EmbeddingBackend : public plugins::Plugin {
public:
    virtual Result<size_t> dimensions(const std::string& model) const = 0;
    virtual Result<std::vector<Vector>> embed(const std::vector<std::string>& texts,
                                              const std::string& model) = 0;
};

/**
 * @brief Feature-hashing bag of words and character trigrams.
 *
 * Deterministic and dependency-free; texts sharing vocabulary get nearby
 * vectors. Tokens are hashed with FNV-1a into the preset's dimension with a
 * sign bit to reduce collision bias.
 */
class HashingEmbeddingBackend : public EmbeddingBackend {
public:
    std::string name() const override { return "hashing"; }
    Result<size_t> dimensions(const std::string& model) const override;
    Result<std::vector<Vector>> embed(const std::vector<std::string>& texts,
                                      const std::string& model) override;
};

// Scales @p v to unit length; zero vectors are left unchanged
void l2Normalize(Vector& v);

} // namespace quarry::embedding
