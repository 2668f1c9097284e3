#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/embedding/embedding_backend.h>
#include <quarry/extraction/extraction_result.h>

#include <memory>
#include <string>
#include <vector>

namespace quarry::plugins {
class PluginRegistry;
}

namespace quarry::embedding {

/**
 * @brief Attaches embeddings to chunks through a named backend.
 *
 * Registered embedding plugins are consulted first; "hashing" is always
 * available as a built-in.
 */
class ChunkEmbedder {
public:
    explicit ChunkEmbedder(const plugins::PluginRegistry& plugins) : plugins_(plugins) {}

    Result<std::shared_ptr<EmbeddingBackend>> resolveBackend(const std::string& name) const;

    // Embeds in batches of config.batchSize; chunks are untouched on failure
    Result<void> embed(std::vector<Chunk>& chunks, const EmbeddingConfig& config) const;

private:
    const plugins::PluginRegistry& plugins_;
};

} // namespace quarry::embedding
