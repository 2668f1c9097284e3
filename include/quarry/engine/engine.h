#pragma once

#include <quarry/cache/extraction_cache.h>
#include <quarry/config/extraction_config.h>
#include <quarry/config/settings.h>
#include <quarry/core/types.h>
#include <quarry/detection/format_classifier.h>
#include <quarry/engine/worker_pool.h>
#include <quarry/extraction/extraction_result.h>
#include <quarry/extraction/extractor_registry.h>
#include <quarry/ocr/ocr_orchestrator.h>
#include <quarry/postprocess/pipeline.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quarry::plugins {
class PluginRegistry;
}

namespace quarry::engine {

/**
 * @brief Handle to an extraction running on the engine's worker pool.
 *
 * Copies share the same computation. Dropping every handle does not cancel
 * work that was already dispatched; its result is discarded.
 */
class DeferredExtraction {
public:
    DeferredExtraction() = default;
    explicit DeferredExtraction(std::shared_future<Result<ExtractionResult>> future)
        : future_(std::move(future)) {}

    bool valid() const { return future_.valid(); }
    bool isReady() const;
    // The result when finished, otherwise nullopt; never blocks
    std::optional<Result<ExtractionResult>> tryGetResult() const;
    // Blocks until the extraction finishes
    Result<ExtractionResult> getResult() const;
    // True when the result became available within @p timeout
    bool wait(std::chrono::milliseconds timeout) const;

private:
    std::shared_future<Result<ExtractionResult>> future_;
};

struct BytesInput {
    ByteVector data;
    std::optional<std::string> mimeType;
};

struct EngineOptions {
    // 0 uses the hardware concurrency
    size_t workerThreads = 0;
    cache::CacheOptions cache;

    static EngineOptions fromSettings(const config::Settings& settings);
};

/**
 * @brief Entry point: classify, extract, OCR, post-process, cache.
 *
 * Synchronous calls run on the calling thread; async and batch calls run on
 * a bounded Boost.Asio worker pool. Batch results keep input order and one
 * item's failure never affects another.
 */
class Engine {
public:
    explicit Engine(plugins::PluginRegistry& plugins, EngineOptions options = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    Result<ExtractionResult> extractFile(const std::filesystem::path& path,
                                         const std::optional<std::string>& mimeType,
                                         const ExtractionConfig& config);
    Result<ExtractionResult> extractBytes(std::span<const std::byte> bytes,
                                          const std::optional<std::string>& mimeType,
                                          const ExtractionConfig& config);

    DeferredExtraction extractFileAsync(std::filesystem::path path,
                                        std::optional<std::string> mimeType,
                                        ExtractionConfig config);
    DeferredExtraction extractBytesAsync(ByteVector bytes, std::optional<std::string> mimeType,
                                         ExtractionConfig config);

    std::vector<Result<ExtractionResult>>
    batchExtractFiles(const std::vector<std::filesystem::path>& paths,
                      const ExtractionConfig& config);
    std::vector<Result<ExtractionResult>> batchExtractBytes(const std::vector<BytesInput>& items,
                                                            const ExtractionConfig& config);

    cache::ExtractionCache& cache() { return cache_; }
    plugins::PluginRegistry& plugins() { return plugins_; }
    const extraction::ExtractorRegistry& extractors() const { return extractors_; }
    size_t workerThreads() const { return pool_.threads(); }

private:
    template <typename F> DeferredExtraction dispatch(F&& work);
    template <typename Item, typename F>
    std::vector<Result<ExtractionResult>> runBatch(const std::vector<Item>& items,
                                                   const ExtractionConfig& config, F&& extractOne);

    Result<void> precheck(uint64_t inputSize, const ExtractionConfig& config) const;
    Result<ExtractionResult> process(std::span<const std::byte> bytes,
                                     const detection::Classification& classification,
                                     const ExtractionConfig& config) const;

    plugins::PluginRegistry& plugins_;
    EngineOptions options_;
    extraction::ExtractorRegistry extractors_;
    ocr::OcrOrchestrator ocr_;
    postprocess::Pipeline pipeline_;
    cache::ExtractionCache cache_;
    WorkerPool pool_;
};

} // namespace quarry::engine
