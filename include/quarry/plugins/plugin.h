#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>

#include <string>

namespace quarry::plugins {

/**
 * @brief Common lifecycle of every registrable capability.
 *
 * initialize() runs once when the plugin is registered; shutdown() runs when
 * it is unregistered, replaced, or the registry is cleared. Both may be
 * implemented by host code that throws; the registry converts such failures
 * into Plugin errors.
 */
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const { return "1.0.0"; }

    virtual Result<void> initialize() { return {}; }
    virtual Result<void> shutdown() { return {}; }
};

enum class ProcessingStage { Early, Middle, Late };

const char* toString(ProcessingStage stage);

/**
 * @brief Accepts or rejects a finished result.
 *
 * Returning an error rejects the whole extraction. Validators run after every
 * post-processing stage, ordered by priority (highest first).
 */
class Validator : public Plugin {
public:
    virtual Result<void> validate(const ExtractionResult& result,
                                  const ExtractionConfig& config) = 0;

    virtual bool shouldValidate(const ExtractionResult& /*result*/,
                                const ExtractionConfig& /*config*/) const {
        return true;
    }
};

/**
 * @brief Rewrites a result at a declared pipeline stage.
 */
class PostProcessor : public Plugin {
public:
    virtual ProcessingStage processingStage() const = 0;
    virtual Result<void> process(ExtractionResult& result, const ExtractionConfig& config) = 0;

    virtual bool shouldProcess(const ExtractionResult& /*result*/,
                               const ExtractionConfig& /*config*/) const {
        return true;
    }
};

} // namespace quarry::plugins
