#include <quarry/embedding/chunk_embedder.h>
#include <quarry/plugins/plugin_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace quarry::embedding {

Result<std::shared_ptr<EmbeddingBackend>>
ChunkEmbedder::resolveBackend(const std::string& name) const {
    if (auto plugin = plugins_.embeddingBackend(name)) {
        return plugin;
    }
    if (name == "hashing") {
        static const auto builtin = std::make_shared<HashingEmbeddingBackend>();
        return std::static_pointer_cast<EmbeddingBackend>(builtin);
    }
    std::string available = "hashing";
    for (const auto& registered : plugins_.listEmbeddingBackends()) {
        available += ", " + registered;
    }
    return missingDependency(name, "Embedding backend '" + name +
                                       "' is not available. Available: [" + available + "]");
}

Result<void> ChunkEmbedder::embed(std::vector<Chunk>& chunks, const EmbeddingConfig& config) const {
    if (chunks.empty()) {
        return {};
    }
    auto backend = resolveBackend(config.backend);
    if (!backend) {
        return backend.error();
    }
    const auto& impl = backend.value();
    const std::string backendName = config.backend;

    auto dims = plugins::invokePlugin(backendName, "dimensions",
                                      [&] { return impl->dimensions(config.model); });
    if (!dims) {
        return dims.error();
    }

    const size_t batchSize = std::max<size_t>(1, config.batchSize);
    std::vector<Vector> vectors;
    vectors.reserve(chunks.size());
    for (size_t begin = 0; begin < chunks.size(); begin += batchSize) {
        const size_t end = std::min(chunks.size(), begin + batchSize);
        std::vector<std::string> texts;
        texts.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            texts.push_back(chunks[i].content);
        }
        auto batch = plugins::invokePlugin(backendName, "embed",
                                           [&] { return impl->embed(texts, config.model); });
        if (!batch) {
            return batch.error();
        }
        if (batch.value().size() != texts.size()) {
            return pluginError(backendName, "Embedding backend '" + backendName + "' returned " +
                                                std::to_string(batch.value().size()) +
                                                " vectors for " + std::to_string(texts.size()) +
                                                " inputs");
        }
        for (auto& v : batch.value()) {
            if (v.size() != dims.value()) {
                return pluginError(backendName, "Embedding backend '" + backendName +
                                                    "' returned a vector of dimension " +
                                                    std::to_string(v.size()) + ", expected " +
                                                    std::to_string(dims.value()));
            }
            if (config.normalize) {
                l2Normalize(v);
            }
            vectors.push_back(std::move(v));
        }
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].embedding = std::move(vectors[i]);
    }
    spdlog::debug("Embedded {} chunks with '{}' ({} dimensions)", chunks.size(), backendName,
                  dims.value());
    return {};
}

} // namespace quarry::embedding
