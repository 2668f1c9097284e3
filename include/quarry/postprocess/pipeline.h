#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>
#include <quarry/plugins/plugin.h>

#include <array>
#include <functional>
#include <string_view>

namespace quarry::plugins {
class PluginRegistry;
}

namespace quarry::postprocess {

inline constexpr std::string_view kQualityStage = "quality";
inline constexpr std::string_view kLanguageStage = "language_detection";
inline constexpr std::string_view kKeywordsStage = "keywords";
inline constexpr std::string_view kChunkingStage = "chunking";
inline constexpr std::string_view kTokenReductionStage = "token_reduction";

/**
 * @brief Runs every post-processing stage over an extraction result.
 *
 * Order: early plugins, quality, language detection, middle plugins,
 * keywords, chunking and embedding, token reduction, late plugins, output
 * format, validators.
 *
 * A failing stage is recorded as metadata "processing_error_<name>" plus a
 * warning and its changes are discarded. Io and Plugin errors returned by a
 * plugin post-processor abort the run, as does any validator rejection.
 * Plugins cannot remove collections: a collection present before a plugin
 * ran is restored if the plugin cleared it.
 */
class Pipeline {
public:
    explicit Pipeline(const plugins::PluginRegistry& plugins) : plugins_(plugins) {}

    Result<void> run(ExtractionResult& result, const ExtractionConfig& config) const;

private:
    Result<void> runPlugins(plugins::ProcessingStage stage, ExtractionResult& result,
                            const ExtractionConfig& config) const;
    void runBuiltin(std::string_view name, ExtractionResult& result,
                    const std::function<Result<void>(ExtractionResult&)>& stage) const;
    void runChunking(ExtractionResult& result, const ChunkingConfig& config) const;
    Result<void> runValidators(const ExtractionResult& result,
                               const ExtractionConfig& config) const;

    const plugins::PluginRegistry& plugins_;
};

// Records a non-fatal stage failure on the result
void recordStageError(ExtractionResult& result, std::string_view stage, const Error& error);

} // namespace quarry::postprocess
