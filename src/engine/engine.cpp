#include <quarry/chunking/text_chunker.h>
#include <quarry/config/config_helpers.h>
#include <quarry/core/error_details.h>
#include <quarry/engine/engine.h>
#include <quarry/plugins/plugin_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <future>
#include <semaphore>
#include <system_error>

namespace quarry::engine {

namespace fs = std::filesystem;

namespace {

Result<ByteVector> readWholeFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error{ErrorCode::Io, "No such file or directory: " + path.string()};
    }
    if (fs::is_directory(path, ec)) {
        return Error{ErrorCode::Io, "Is a directory: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::Io, "Cannot open file (permission denied?): " + path.string()};
    }
    in.seekg(0, std::ios::end);
    const auto size = in.tellg();
    in.seekg(0, std::ios::beg);
    ByteVector data(size > 0 ? static_cast<size_t>(size) : 0);
    if (!data.empty() && !in.read(reinterpret_cast<char*>(data.data()),
                                  static_cast<std::streamsize>(data.size()))) {
        return Error{ErrorCode::Io, "I/O error while reading " + path.string()};
    }
    return data;
}

} // namespace

bool DeferredExtraction::isReady() const {
    return future_.valid() &&
           future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::optional<Result<ExtractionResult>> DeferredExtraction::tryGetResult() const {
    if (!isReady()) {
        return std::nullopt;
    }
    return future_.get();
}

Result<ExtractionResult> DeferredExtraction::getResult() const {
    if (!future_.valid()) {
        return Error{ErrorCode::InvalidArgument, "Deferred extraction handle is empty"};
    }
    return future_.get();
}

bool DeferredExtraction::wait(std::chrono::milliseconds timeout) const {
    return future_.valid() && future_.wait_for(timeout) == std::future_status::ready;
}

EngineOptions EngineOptions::fromSettings(const config::Settings& settings) {
    EngineOptions options;
    options.workerThreads = settings.extraction.effectiveConcurrency();
    options.cache.maxEntries = settings.cache.maxMemoryEntries;
    options.cache.maxAgeSeconds = settings.cache.maxAgeSeconds;
    if (settings.cache.persistToDisk) {
        options.cache.directory = settings.cache.directory.empty()
                                      ? config::get_cache_dir()
                                      : settings.cache.directory;
    }
    return options;
}

Engine::Engine(plugins::PluginRegistry& plugins, EngineOptions options)
    : plugins_(plugins), options_(std::move(options)), extractors_(plugins), ocr_(plugins),
      pipeline_(plugins), cache_(options_.cache),
      pool_(options_.workerThreads > 0 ? options_.workerThreads
                                       : ExtractionConfig{}.effectiveConcurrency()) {}

Engine::~Engine() {
    pool_.stop();
}

Result<void> Engine::precheck(uint64_t inputSize, const ExtractionConfig& config) const {
    if (config.maxFileSize > 0 && inputSize > config.maxFileSize) {
        return Error{ErrorCode::Validation, "Input of " + std::to_string(inputSize) +
                                                " bytes exceeds max_file_size (" +
                                                std::to_string(config.maxFileSize) + ")"};
    }
    if (config.chunking) {
        if (auto valid = chunking::TextChunker::validate(*config.chunking); !valid) {
            return valid;
        }
    }
    return {};
}

Result<ExtractionResult> Engine::process(std::span<const std::byte> bytes,
                                         const detection::Classification& classification,
                                         const ExtractionConfig& config) const {
    const auto& mimeType = classification.mimeType;
    auto resolved = extractors_.resolve(mimeType);
    if (!resolved) {
        return resolved.error();
    }
    const auto& target = resolved.value();

    // OCR of PDF pages works on their embedded images
    ExtractionConfig effective = config;
    const bool userWantsPdfImages = config.pdfOptions && config.pdfOptions->extractImages;
    const bool forcedImages = !userWantsPdfImages && ocr::OcrOrchestrator::needsPageImages(config);
    if (forcedImages) {
        if (!effective.pdfOptions) {
            effective.pdfOptions.emplace();
        }
        effective.pdfOptions->extractImages = true;
    }

    Result<ExtractionResult> extracted = Error{ErrorCode::Unknown};
    if (target.fromPlugin) {
        extracted = plugins::invokePlugin(target.name, "extract", [&] {
            return target.extractor->extract(bytes, mimeType, effective);
        });
    } else {
        extracted = guardBoundary("extractor " + target.name, [&] {
            return target.extractor->extract(bytes, mimeType, effective);
        });
    }
    if (!extracted) {
        spdlog::debug("Extraction of {} failed: {}", mimeType, extracted.error().message);
        return extracted.error();
    }
    auto result = std::move(extracted).value();
    if (result.mimeType.empty()) {
        result.mimeType = mimeType;
    }
    if (classification.overriddenHint) {
        result.addWarning("detection", "Declared type " + *classification.overriddenHint +
                                           " disagreed with the content; using " + mimeType);
    }

    auto ocrState = ocr_.process(result, bytes, effective);
    if (!ocrState) {
        return ocrState.error();
    }

    if (!(config.pages && config.pages->extractPages)) {
        result.pages.reset();
    }
    if (forcedImages && result.mimeType == "application/pdf") {
        result.images.reset();
    }

    if (auto piped = pipeline_.run(result, config); !piped) {
        return piped.error();
    }
    return result;
}

Result<ExtractionResult> Engine::extractBytes(std::span<const std::byte> bytes,
                                              const std::optional<std::string>& mimeType,
                                              const ExtractionConfig& config) {
    return guardBoundary("extract_bytes", [&]() -> Result<ExtractionResult> {
        if (auto ok = precheck(bytes.size(), config); !ok) {
            return ok.error();
        }
        auto classification = detection::FormatClassifier::instance().classify(bytes, {}, mimeType);
        if (!classification) {
            return classification.error();
        }
        auto compute = [&] { return process(bytes, classification.value(), config); };
        if (!config.useCache) {
            return compute();
        }
        const auto key = cache::ExtractionCache::cacheKey(bytes, config,
                                                          classification.value().mimeType);
        return cache_.getOrCompute(key, compute);
    });
}

Result<ExtractionResult> Engine::extractFile(const fs::path& path,
                                             const std::optional<std::string>& mimeType,
                                             const ExtractionConfig& config) {
    return guardBoundary("extract_file", [&]() -> Result<ExtractionResult> {
        std::error_code ec;
        if (config.maxFileSize > 0) {
            const auto size = fs::file_size(path, ec);
            if (!ec) {
                if (auto ok = precheck(size, config); !ok) {
                    return ok.error();
                }
            }
        }
        auto data = readWholeFile(path);
        if (!data) {
            return data.error();
        }
        const auto& bytes = data.value();
        if (auto ok = precheck(bytes.size(), config); !ok) {
            return ok.error();
        }
        auto classification =
            detection::FormatClassifier::instance().classify(bytes, path, mimeType);
        if (!classification) {
            return classification.error();
        }
        auto compute = [&] { return process(bytes, classification.value(), config); };
        if (!config.useCache) {
            return compute();
        }
        auto key = cache::ExtractionCache::cacheKeyForFile(path, config,
                                                           classification.value().mimeType);
        if (!key) {
            spdlog::warn("Extracting {} without cache: {}", path.string(), key.error().message);
            return compute();
        }
        return cache_.getOrCompute(key.value(), compute);
    });
}

template <typename F> DeferredExtraction Engine::dispatch(F&& work) {
    auto task = std::make_shared<std::packaged_task<Result<ExtractionResult>()>>(
        [fn = std::forward<F>(work)]() mutable {
            return guardBoundary("worker", [&] { return fn(); });
        });
    DeferredExtraction handle(task->get_future().share());
    pool_.post([task] { (*task)(); });
    return handle;
}

DeferredExtraction Engine::extractFileAsync(fs::path path, std::optional<std::string> mimeType,
                                            ExtractionConfig config) {
    return dispatch([this, path = std::move(path), mimeType = std::move(mimeType),
                     config = std::move(config)] { return extractFile(path, mimeType, config); });
}

DeferredExtraction Engine::extractBytesAsync(ByteVector bytes, std::optional<std::string> mimeType,
                                             ExtractionConfig config) {
    return dispatch([this, bytes = std::move(bytes), mimeType = std::move(mimeType),
                     config = std::move(config)] { return extractBytes(bytes, mimeType, config); });
}

template <typename Item, typename F>
std::vector<Result<ExtractionResult>> Engine::runBatch(const std::vector<Item>& items,
                                                       const ExtractionConfig& config,
                                                       F&& extractOne) {
    // Bounded by the pool and by the per-call concurrency setting
    const auto limit = static_cast<std::ptrdiff_t>(
        std::max<size_t>(1, std::min(pool_.threads(), config.effectiveConcurrency())));
    std::counting_semaphore<> slots(limit);

    std::vector<DeferredExtraction> handles;
    handles.reserve(items.size());
    for (const auto& item : items) {
        slots.acquire();
        handles.push_back(dispatch([&, itemPtr = &item]() {
            struct Release {
                std::counting_semaphore<>& s;
                ~Release() { s.release(); }
            } release{slots};
            return extractOne(*itemPtr);
        }));
    }

    std::vector<Result<ExtractionResult>> results;
    results.reserve(items.size());
    for (const auto& handle : handles) {
        results.push_back(handle.getResult());
    }
    spdlog::debug("Batch of {} finished", items.size());
    return results;
}

std::vector<Result<ExtractionResult>>
Engine::batchExtractFiles(const std::vector<fs::path>& paths, const ExtractionConfig& config) {
    return runBatch(paths, config, [&](const fs::path& path) {
        return extractFile(path, std::nullopt, config);
    });
}

std::vector<Result<ExtractionResult>> Engine::batchExtractBytes(const std::vector<BytesInput>& items,
                                                                const ExtractionConfig& config) {
    return runBatch(items, config, [&](const BytesInput& item) {
        return extractBytes(item.data, item.mimeType, config);
    });
}

} // namespace quarry::engine
