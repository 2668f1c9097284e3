#pragma once

#include <quarry/core/types.h>
#include <quarry/extraction/document_extractor.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quarry::plugins {
class PluginRegistry;
}

namespace quarry::extraction {

/**
 * @brief Catalog of the extractors compiled into the library.
 *
 * The constructor registers every built-in extractor explicitly. Extractors
 * are stateless and shared between threads.
 */
class BuiltinExtractors {
public:
    static BuiltinExtractors& instance();

    // Later registrations for the same MIME type replace earlier ones
    void registerExtractor(std::shared_ptr<DocumentExtractor> extractor);

    std::shared_ptr<DocumentExtractor> find(const std::string& mimeType) const;
    std::vector<std::string> supportedMimeTypes() const;
    bool isSupported(const std::string& mimeType) const;

    BuiltinExtractors(const BuiltinExtractors&) = delete;
    BuiltinExtractors& operator=(const BuiltinExtractors&) = delete;

private:
    BuiltinExtractors();

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DocumentExtractor>> byMime_;
};

struct ResolvedExtractor {
    std::shared_ptr<DocumentExtractor> extractor;
    // Registered name for plugins, the extractor's own name for built-ins
    std::string name;
    bool fromPlugin = false;
};

/**
 * @brief Resolves a canonical media type to an extractor.
 *
 * Plugin extractors declaring the media type win over built-ins, highest
 * priority first. Unknown media types fail with UnsupportedFormat.
 */
class ExtractorRegistry {
public:
    explicit ExtractorRegistry(const plugins::PluginRegistry& plugins,
                               const BuiltinExtractors& builtins = BuiltinExtractors::instance())
        : plugins_(plugins), builtins_(builtins) {}

    Result<ResolvedExtractor> resolve(const std::string& mimeType) const;

    // Built-in types plus every type a registered plugin declares
    std::vector<std::string> supportedMimeTypes() const;

private:
    const plugins::PluginRegistry& plugins_;
    const BuiltinExtractors& builtins_;
};

} // namespace quarry::extraction
