// Shared helpers for the Catch2 unit tests

#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry::test {

/**
 * @brief Creates a unique temporary directory with the given prefix.
 */
inline std::filesystem::path make_temp_dir(std::string_view prefix = "quarry_test_") {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    std::uniform_int_distribution<int> dist(0, 9999);
    thread_local std::mt19937_64 rng{std::random_device{}()};
    for (int attempt = 0; attempt < 512; ++attempt) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto candidate =
            base / (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    return base;
}

// Removes the directory tree on scope exit
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "quarry_test_") : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    stream.close();
    return path;
}

inline std::span<const std::byte> as_bytes(std::string_view text) {
    return std::as_bytes(std::span(text.data(), text.size()));
}

inline std::vector<std::byte> to_bytes(std::string_view text) {
    auto view = as_bytes(text);
    return {view.begin(), view.end()};
}

enum class ArchiveKind { Zip, Tar, TarGz, SevenZip, Gzip };

/**
 * @brief Builds an in-memory archive with libarchive's writer.
 *
 * Names ending in '/' become directory entries. Gzip writes a single raw
 * stream and expects exactly one entry.
 */
inline std::vector<std::byte>
make_archive(ArchiveKind kind, const std::vector<std::pair<std::string, std::string>>& entries) {
    std::unique_ptr<struct archive, decltype(&archive_write_free)> writer(archive_write_new(),
                                                                          &archive_write_free);
    if (!writer) {
        throw std::runtime_error("cannot create archive writer");
    }
    int rc = ARCHIVE_OK;
    switch (kind) {
        case ArchiveKind::Zip:
            rc = archive_write_set_format_zip(writer.get());
            break;
        case ArchiveKind::Tar:
            rc = archive_write_set_format_ustar(writer.get());
            break;
        case ArchiveKind::TarGz:
            rc = archive_write_set_format_ustar(writer.get());
            if (rc == ARCHIVE_OK) {
                rc = archive_write_add_filter_gzip(writer.get());
            }
            break;
        case ArchiveKind::SevenZip:
            rc = archive_write_set_format_7zip(writer.get());
            if (rc == ARCHIVE_OK) {
                rc = archive_write_set_format_option(writer.get(), "7zip", "compression", "store");
            }
            break;
        case ArchiveKind::Gzip:
            rc = archive_write_set_format_raw(writer.get());
            if (rc == ARCHIVE_OK) {
                rc = archive_write_add_filter_gzip(writer.get());
            }
            break;
    }
    if (rc != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(writer.get()));
    }
    size_t capacity = 64 * 1024;
    for (const auto& [name, body] : entries) {
        capacity += name.size() + body.size() + 1024;
    }
    std::vector<std::byte> buffer(capacity);
    size_t used = 0;
    if (archive_write_open_memory(writer.get(), buffer.data(), buffer.size(), &used) !=
        ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(writer.get()));
    }
    for (const auto& [name, body] : entries) {
        std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(
            archive_entry_new(), &archive_entry_free);
        const bool directory = !name.empty() && name.back() == '/';
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(directory ? 0 : body.size()));
        archive_entry_set_filetype(entry.get(), directory ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(entry.get(), directory ? 0755 : 0644);
        if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
            throw std::runtime_error(archive_error_string(writer.get()));
        }
        if (!directory && !body.empty() &&
            archive_write_data(writer.get(), body.data(), body.size()) < 0) {
            throw std::runtime_error(archive_error_string(writer.get()));
        }
    }
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(writer.get()));
    }
    buffer.resize(used);
    return buffer;
}

/**
 * @brief Builds an in-memory ZIP container (OOXML fixtures).
 */
inline std::vector<std::byte>
make_zip(const std::vector<std::pair<std::string, std::string>>& entries) {
    return make_archive(ArchiveKind::Zip, entries);
}

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(get_env(key_)) {
        set_env(key_, std::move(value));
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { restore(); }

private:
    static std::optional<std::string> get_env(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void set_env(const std::string& key, std::optional<std::string> value) {
#ifdef _WIN32
        _putenv_s(key.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
#endif
    }

    void restore() {
        if (active_) {
            set_env(key_, previous_);
            active_ = false;
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
    bool active_ = true;
};

} // namespace quarry::test
