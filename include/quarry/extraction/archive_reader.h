#pragma once

#include <quarry/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace quarry::extraction {

// Entry count and per-entry size ceilings; archive headers are untrusted
inline constexpr size_t kMaxDeclaredEntries = 65'536;
inline constexpr size_t kMaxEntryBytes = 256 * 1024 * 1024;

enum class ArchiveFormat {
    Zip,
    Tar,
    // A single gzip stream, or a gzip-compressed tar
    Gzip,
    SevenZip,
};

const char* toString(ArchiveFormat format);

struct ArchiveEntryInfo {
    std::string path;
    // Declared size; 0 when the header does not record one
    uint64_t size = 0;
    bool isDirectory = false;
};

/**
 * @brief In-memory archive reader on libarchive.
 *
 * Entries are decompressed lazily in one streaming pass; declared entry sizes
 * are never used to size buffers.
 */
class ArchiveReader {
public:
    using EntryFilter = std::function<bool(const std::string& name)>;

    explicit ArchiveReader(std::span<const std::byte> data,
                           ArchiveFormat format = ArchiveFormat::Zip)
        : data_(data), format_(format) {}

    // Names of all regular-file entries, in archive order
    Result<std::vector<std::string>> listEntries() const;

    // Files and directories, in archive order
    Result<std::vector<ArchiveEntryInfo>> describeEntries() const;

    // Decompresses every entry accepted by @p filter
    Result<std::map<std::string, std::string>> readEntries(const EntryFilter& filter) const;

    // Single entry; Parsing error when absent
    Result<std::string> readEntry(const std::string& name) const;

    // True when a gzip stream decompresses to a tar archive
    static bool isTarStream(std::span<const std::byte> data);

private:
    std::span<const std::byte> data_;
    ArchiveFormat format_;
};

} // namespace quarry::extraction
