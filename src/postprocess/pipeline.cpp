#include <quarry/chunking/text_chunker.h>
#include <quarry/embedding/chunk_embedder.h>
#include <quarry/plugins/plugin_registry.h>
#include <quarry/postprocess/keyword_extractor.h>
#include <quarry/postprocess/language_detector.h>
#include <quarry/postprocess/output_formatter.h>
#include <quarry/postprocess/pipeline.h>
#include <quarry/postprocess/quality.h>
#include <quarry/postprocess/token_reducer.h>

#include <spdlog/spdlog.h>

namespace quarry::postprocess {

namespace {

template <typename T> void restoreIfRemoved(std::optional<T>& after, const std::optional<T>& before) {
    if (before && !after) {
        after = before;
    }
}

// Puts back anything a post-processor removed
void restoreCollections(ExtractionResult& result, const ExtractionResult& before,
                        const std::string& pluginName) {
    bool restored = false;
    auto note = [&](bool changed) { restored = restored || changed; };

    note(before.chunks && !result.chunks);
    restoreIfRemoved(result.chunks, before.chunks);
    note(before.images && !result.images);
    restoreIfRemoved(result.images, before.images);
    note(before.pages && !result.pages);
    restoreIfRemoved(result.pages, before.pages);
    note(before.detectedLanguages && !result.detectedLanguages);
    restoreIfRemoved(result.detectedLanguages, before.detectedLanguages);
    note(before.keywords && !result.keywords);
    restoreIfRemoved(result.keywords, before.keywords);
    if (!before.tables.empty() && result.tables.empty()) {
        result.tables = before.tables;
        restored = true;
    }
    if (!result.metadata.additional.is_object()) {
        result.metadata.additional = before.metadata.additional;
        restored = true;
    }
    if (restored) {
        spdlog::warn("Post-processor '{}' removed result collections; they were restored",
                     pluginName);
        result.addWarning(pluginName, "Removed result collections were restored");
    }
}

} // namespace

void recordStageError(ExtractionResult& result, std::string_view stage, const Error& error) {
    spdlog::warn("Post-processing stage '{}' failed: {}", stage, error.message);
    result.metadata.set("processing_error_" + std::string(stage), error.message);
    result.addWarning(std::string(stage), error.message);
}

Result<void> Pipeline::runPlugins(plugins::ProcessingStage stage, ExtractionResult& result,
                                  const ExtractionConfig& config) const {
    const auto pp = config.effectivePostprocessor();
    for (const auto& reg : plugins_.postProcessors()) {
        const auto& processor = reg.plugin;
        auto declared = plugins::invokePlugin(reg.name, "processingStage",
                                              [&]() -> Result<plugins::ProcessingStage> {
                                                  return processor->processingStage();
                                              });
        if (!declared) {
            return declared.error();
        }
        if (declared.value() != stage || !pp.isProcessorEnabled(reg.name)) {
            continue;
        }
        auto wanted = plugins::invokePlugin(reg.name, "shouldProcess", [&]() -> Result<bool> {
            return processor->shouldProcess(result, config);
        });
        if (!wanted) {
            return wanted.error();
        }
        if (!wanted.value()) {
            continue;
        }

        ExtractionResult before = result;
        auto outcome =
            plugins::invokePlugin(reg.name, "process", [&] { return processor->process(result, config); });
        if (!outcome) {
            result = std::move(before);
            const auto code = outcome.error().code;
            if (code == ErrorCode::Io || code == ErrorCode::Plugin) {
                spdlog::error("Post-processor '{}' failed: {}", reg.name, outcome.error().message);
                return outcome.error();
            }
            recordStageError(result, reg.name, outcome.error());
            continue;
        }
        restoreCollections(result, before, reg.name);
        spdlog::debug("Post-processor '{}' ({}) done", reg.name, plugins::toString(stage));
    }
    return {};
}

void Pipeline::runBuiltin(std::string_view name, ExtractionResult& result,
                          const std::function<Result<void>(ExtractionResult&)>& stage) const {
    ExtractionResult before = result;
    Result<void> outcome;
    try {
        outcome = stage(result);
    } catch (const std::exception& e) {
        outcome = Error{ErrorCode::Unknown, e.what()};
    }
    if (!outcome) {
        result = std::move(before);
        recordStageError(result, name, outcome.error());
    }
}

void Pipeline::runChunking(ExtractionResult& result, const ChunkingConfig& config) const {
    chunking::TextChunker chunker(config);
    std::vector<chunking::PageRange> pages;
    if (result.pages) {
        pages = chunking::TextChunker::locatePages(result.content, *result.pages);
    }
    auto chunks = chunker.chunk(result.content, pages);
    if (!chunks) {
        recordStageError(result, kChunkingStage, chunks.error());
        return;
    }
    result.chunks = std::move(chunks).value();
    result.metadata.set("chunk_count", result.chunks->size());

    if (config.embedding) {
        embedding::ChunkEmbedder embedder(plugins_);
        if (auto embedded = embedder.embed(*result.chunks, *config.embedding); !embedded) {
            // Chunks are kept without vectors
            spdlog::warn("Embedding failed: {}", embedded.error().message);
            result.metadata.set("embedding_error", embedded.error().message);
            result.addWarning("embedding", embedded.error().message);
        } else {
            result.metadata.set("embeddings_generated", true);
        }
    }
}

Result<void> Pipeline::runValidators(const ExtractionResult& result,
                                     const ExtractionConfig& config) const {
    for (const auto& reg : plugins_.validators()) {
        const auto& validator = reg.plugin;
        auto wanted = plugins::invokePlugin(reg.name, "shouldValidate", [&]() -> Result<bool> {
            return validator->shouldValidate(result, config);
        });
        if (!wanted) {
            return wanted.error();
        }
        if (!wanted.value()) {
            continue;
        }
        auto verdict =
            plugins::invokePlugin(reg.name, "validate", [&] { return validator->validate(result, config); });
        if (!verdict) {
            if (verdict.error().code == ErrorCode::Plugin) {
                return verdict.error();
            }
            return Error{ErrorCode::Validation,
                         "Validator '" + reg.name + "' rejected the result: " +
                             verdict.error().message,
                         reg.name};
        }
    }
    return {};
}

Result<void> Pipeline::run(ExtractionResult& result, const ExtractionConfig& config) const {
    using plugins::ProcessingStage;
    const auto pp = config.effectivePostprocessor();

    if (auto r = runPlugins(ProcessingStage::Early, result, config); !r) {
        return r;
    }

    if (config.enableQualityProcessing && pp.isProcessorEnabled(kQualityStage)) {
        runBuiltin(kQualityStage, result, [](ExtractionResult& r) -> Result<void> {
            applyQualityScore(r);
            return {};
        });
    }

    const auto language = config.effectiveLanguageDetection();
    if (language.enabled && pp.isProcessorEnabled(kLanguageStage)) {
        runBuiltin(kLanguageStage, result, [&](ExtractionResult& r) -> Result<void> {
            LanguageDetector::apply(r, language);
            return {};
        });
    }

    if (auto r = runPlugins(ProcessingStage::Middle, result, config); !r) {
        return r;
    }

    if (config.keywords && pp.isProcessorEnabled(kKeywordsStage)) {
        runBuiltin(kKeywordsStage, result, [&](ExtractionResult& r) -> Result<void> {
            KeywordExtractor::apply(r, *config.keywords);
            return {};
        });
    }

    if (config.chunking && pp.isProcessorEnabled(kChunkingStage)) {
        runChunking(result, *config.chunking);
    }

    if (config.tokenReduction && config.tokenReduction->mode != ReductionMode::Off &&
        pp.isProcessorEnabled(kTokenReductionStage)) {
        runBuiltin(kTokenReductionStage, result, [&](ExtractionResult& r) -> Result<void> {
            TokenReducer::apply(r, *config.tokenReduction);
            return {};
        });
    }

    if (auto r = runPlugins(ProcessingStage::Late, result, config); !r) {
        return r;
    }

    applyOutputFormat(result, config.outputFormat);

    return runValidators(result, config);
}

} // namespace quarry::postprocess
