#pragma once

#include <quarry/core/types.h>
#include <quarry/embedding/embedding_backend.h>
#include <quarry/extraction/document_extractor.h>
#include <quarry/ocr/ocr_backend.h>
#include <quarry/plugins/plugin.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::plugins {

enum class PluginKind { Validator, PostProcessor, OcrBackend, DocumentExtractor, EmbeddingBackend };

const char* toString(PluginKind kind);

// Receives replacement warnings: (kind, plugin name, message)
using WarningObserver =
    std::function<void(PluginKind kind, const std::string& name, const std::string& message)>;

/**
 * @brief Run a plugin callback, converting anything it throws into a Plugin error.
 *
 * Errors returned normally by the callback pass through with their own kind.
 */
template <typename F>
auto invokePlugin(const std::string& pluginName, std::string_view operation, F&& fn)
    -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        spdlog::warn("Plugin '{}' threw during {}: {}", pluginName, operation, e.what());
        return pluginError(pluginName, "Plugin '" + pluginName + "' failed during " +
                                           std::string(operation) + ": " + e.what());
    } catch (...) {
        spdlog::warn("Plugin '{}' threw a non-standard exception during {}", pluginName,
                     operation);
        return pluginError(pluginName, "Plugin '" + pluginName + "' failed during " +
                                           std::string(operation) + ": unknown exception");
    }
}

template <typename T> struct Registration {
    std::string name;
    int32_t priority = 0;
    std::shared_ptr<T> plugin;
    uint64_t sequence = 0;
};

/**
 * @brief One namespace of uniquely named plugins.
 *
 * Lookups take a shared lock and copy shared_ptrs out, so callbacks are
 * always invoked without any registry lock held.
 */
template <typename T> class PluginSet {
public:
    explicit PluginSet(PluginKind kind) : kind_(kind) {}

    void setWarningObserver(WarningObserver observer) {
        std::unique_lock lock(mutex_);
        observer_ = std::move(observer);
    }

    Result<void> add(std::shared_ptr<T> plugin, int32_t priority) {
        if (!plugin) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Cannot register a null ") + toString(kind_)};
        }
        std::string name;
        if (auto r = invokePlugin("<unnamed>", "name", [&]() -> Result<void> {
                name = plugin->name();
                return {};
            });
            !r) {
            return r;
        }
        if (name.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         std::string(toString(kind_)) + " name cannot be empty"};
        }
        if (std::any_of(name.begin(), name.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; })) {
            return Error{ErrorCode::InvalidArgument,
                         std::string(toString(kind_)) + " name cannot contain whitespace: '" +
                             name + "'"};
        }

        if (auto init = invokePlugin(name, "initialize", [&] { return plugin->initialize(); });
            !init) {
            return pluginError(name, "Failed to initialize " + std::string(toString(kind_)) +
                                         " '" + name + "': " + init.error().message);
        }

        std::shared_ptr<T> replaced;
        WarningObserver observer;
        {
            std::unique_lock lock(mutex_);
            auto it = entries_.find(name);
            if (it != entries_.end()) {
                replaced = std::move(it->second.plugin);
            }
            entries_[name] = Registration<T>{name, priority, std::move(plugin), nextSequence_++};
            observer = observer_;
        }

        if (replaced) {
            std::string message = std::string(toString(kind_)) + " '" + name +
                                  "' was already registered and has been replaced";
            spdlog::warn("{}", message);
            if (observer) {
                observer(kind_, name, message);
            }
            shutdownQuietly(name, replaced);
        }
        return {};
    }

    Result<void> remove(const std::string& name) {
        std::shared_ptr<T> removed;
        {
            std::unique_lock lock(mutex_);
            auto it = entries_.find(name);
            if (it == entries_.end()) {
                std::string registered;
                for (const auto& [key, _] : entries_) {
                    if (!registered.empty()) {
                        registered += ", ";
                    }
                    registered += key;
                }
                return pluginError(name, std::string(toString(kind_)) + " '" + name +
                                             "' is not registered. Registered: [" + registered +
                                             "]");
            }
            removed = std::move(it->second.plugin);
            entries_.erase(it);
        }
        return invokePlugin(name, "shutdown", [&] { return removed->shutdown(); });
    }

    std::shared_ptr<T> get(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(name);
        return it == entries_.end() ? nullptr : it->second.plugin;
    }

    bool contains(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return entries_.contains(name);
    }

    // Registrations ordered by priority (highest first), then registration order
    std::vector<Registration<T>> snapshot() const {
        std::vector<Registration<T>> out;
        {
            std::shared_lock lock(mutex_);
            out.reserve(entries_.size());
            for (const auto& [_, entry] : entries_) {
                out.push_back(entry);
            }
        }
        std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.sequence < b.sequence;
        });
        return out;
    }

    std::vector<std::string> list() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto& [key, _] : entries_) {
            names.push_back(key);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    /**
     * @brief Remove everything, calling shutdown() on each plugin.
     * @return Names of plugins whose shutdown failed
     */
    std::vector<std::string> clear() {
        std::map<std::string, Registration<T>> drained;
        {
            std::unique_lock lock(mutex_);
            drained.swap(entries_);
        }
        std::vector<std::string> failures;
        for (auto& [name, entry] : drained) {
            if (!shutdownQuietly(name, entry.plugin)) {
                failures.push_back(name);
            }
        }
        return failures;
    }

private:
    bool shutdownQuietly(const std::string& name, const std::shared_ptr<T>& plugin) {
        auto r = invokePlugin(name, "shutdown", [&] { return plugin->shutdown(); });
        if (!r) {
            spdlog::warn("Shutdown of {} '{}' failed: {}", toString(kind_), name,
                         r.error().message);
            return false;
        }
        return true;
    }

    PluginKind kind_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Registration<T>> entries_;
    uint64_t nextSequence_ = 0;
    WarningObserver observer_;
};

/**
 * @brief Validators, post-processors, OCR backends, document extractors and
 * embedding backends, each in its own namespace.
 *
 * Pipeline components receive a registry by reference; global() exists only
 * for the C boundary layer.
 */
class PluginRegistry {
public:
    PluginRegistry();
    ~PluginRegistry();

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    static PluginRegistry& global();

    Result<void> registerValidator(std::shared_ptr<Validator> validator, int32_t priority = 50);
    Result<void> unregisterValidator(const std::string& name);
    std::vector<std::string> listValidators() const;
    std::vector<std::string> clearValidators();

    Result<void> registerPostProcessor(std::shared_ptr<PostProcessor> processor,
                                       int32_t priority = 50);
    Result<void> unregisterPostProcessor(const std::string& name);
    std::vector<std::string> listPostProcessors() const;
    std::vector<std::string> clearPostProcessors();

    Result<void> registerOcrBackend(std::shared_ptr<ocr::OcrBackend> backend,
                                    int32_t priority = 50);
    Result<void> unregisterOcrBackend(const std::string& name);
    std::vector<std::string> listOcrBackends() const;
    std::vector<std::string> clearOcrBackends();

    Result<void> registerDocumentExtractor(std::shared_ptr<extraction::DocumentExtractor> extractor,
                                           int32_t priority = extraction::kDefaultPluginPriority);
    Result<void> unregisterDocumentExtractor(const std::string& name);
    std::vector<std::string> listDocumentExtractors() const;
    std::vector<std::string> clearDocumentExtractors();

    Result<void> registerEmbeddingBackend(std::shared_ptr<embedding::EmbeddingBackend> backend,
                                          int32_t priority = 50);
    Result<void> unregisterEmbeddingBackend(const std::string& name);
    std::vector<std::string> listEmbeddingBackends() const;
    std::vector<std::string> clearEmbeddingBackends();

    // Ordered snapshots used by the pipeline
    std::vector<Registration<Validator>> validators() const { return validators_.snapshot(); }
    std::vector<Registration<PostProcessor>> postProcessors() const {
        return postProcessors_.snapshot();
    }
    std::shared_ptr<ocr::OcrBackend> ocrBackend(const std::string& name) const {
        return ocrBackends_.get(name);
    }
    std::shared_ptr<embedding::EmbeddingBackend> embeddingBackend(const std::string& name) const {
        return embeddingBackends_.get(name);
    }
    // Highest-priority plugin extractor declaring @p mimeType, with its registered name
    std::optional<Registration<extraction::DocumentExtractor>>
    extractorFor(const std::string& mimeType) const;
    // Every media type declared by a registered extractor plugin
    std::vector<std::string> extractorMimeTypes() const;

    void setWarningObserver(WarningObserver observer);

    // Clears every namespace; returns the names whose shutdown failed
    std::vector<std::string> clearAll();

private:
    PluginSet<Validator> validators_{PluginKind::Validator};
    PluginSet<PostProcessor> postProcessors_{PluginKind::PostProcessor};
    PluginSet<ocr::OcrBackend> ocrBackends_{PluginKind::OcrBackend};
    PluginSet<extraction::DocumentExtractor> extractors_{PluginKind::DocumentExtractor};
    PluginSet<embedding::EmbeddingBackend> embeddingBackends_{PluginKind::EmbeddingBackend};
};

} // namespace quarry::plugins
