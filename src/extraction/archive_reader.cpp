#include <quarry/extraction/archive_reader.h>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <optional>

namespace quarry::extraction {

namespace {

struct ArchiveDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_free(a);
        }
    }
};
using ArchivePtr = std::unique_ptr<struct archive, ArchiveDeleter>;

void enableFormat(struct archive* a, ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:
            archive_read_support_format_zip(a);
            break;
        case ArchiveFormat::Tar:
            archive_read_support_filter_all(a);
            archive_read_support_format_tar(a);
            break;
        case ArchiveFormat::Gzip:
            // tar bids above raw, so a .tar.gz is walked entry by entry
            archive_read_support_filter_gzip(a);
            archive_read_support_format_tar(a);
            archive_read_support_format_raw(a);
            break;
        case ArchiveFormat::SevenZip:
            archive_read_support_format_7zip(a);
            break;
    }
}

Result<ArchivePtr> openMemory(std::span<const std::byte> data, ArchiveFormat format) {
    ArchivePtr a(archive_read_new());
    if (!a) {
        return Error{ErrorCode::Unknown, "archive_read_new failed"};
    }
    enableFormat(a.get(), format);
    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        const char* msg = archive_error_string(a.get());
        return Error{ErrorCode::Parsing, std::string("Failed to open ") + toString(format) +
                                             " container: " + (msg ? msg : "unknown")};
    }
    return a;
}

// Iterates entries (directories only when asked); @p visit returns false to stop
template <typename Visit>
Result<void> forEachEntry(std::span<const std::byte> data, ArchiveFormat format,
                          bool includeDirectories, Visit&& visit) {
    auto opened = openMemory(data, format);
    if (!opened) {
        return opened.error();
    }
    auto& a = opened.value();
    struct archive_entry* entry = nullptr;
    size_t seen = 0;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK ||
           r == ARCHIVE_WARN) {
        if (++seen > kMaxDeclaredEntries) {
            return Error{ErrorCode::Parsing, std::string(toString(format)) +
                                                 " container has more than " +
                                                 std::to_string(kMaxDeclaredEntries) +
                                                 " entries"};
        }
        const auto type = archive_entry_filetype(entry);
        const bool isDirectory = type == AE_IFDIR;
        if (type != AE_IFREG && !(isDirectory && includeDirectories)) {
            archive_read_data_skip(a.get());
            continue;
        }
        const char* pathname = archive_entry_pathname(entry);
        if (!pathname) {
            archive_read_data_skip(a.get());
            continue;
        }
        ArchiveEntryInfo info;
        info.path = pathname;
        info.isDirectory = isDirectory;
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            info.size = static_cast<uint64_t>(archive_entry_size(entry));
        }
        auto keepGoing = visit(a.get(), std::move(info));
        if (!keepGoing) {
            return keepGoing.error();
        }
        if (!keepGoing.value()) {
            return {};
        }
    }
    if (r != ARCHIVE_EOF) {
        const char* msg = archive_error_string(a.get());
        return Error{ErrorCode::Parsing, std::string("Corrupt ") + toString(format) +
                                             " container: " + (msg ? msg : "read error")};
    }
    return {};
}

Result<std::string> readData(struct archive* a, const std::string& name) {
    std::string out;
    std::array<char, 64 * 1024> buffer{};
    for (;;) {
        la_ssize_t n = archive_read_data(a, buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            const char* msg = archive_error_string(a);
            return Error{ErrorCode::Parsing, "Failed to decompress '" + name +
                                                 "': " + (msg ? msg : "unknown")};
        }
        if (out.size() + static_cast<size_t>(n) > kMaxEntryBytes) {
            return Error{ErrorCode::Parsing,
                         "Archive entry '" + name + "' exceeds the decompressed size limit"};
        }
        out.append(buffer.data(), static_cast<size_t>(n));
    }
    return out;
}

} // namespace

const char* toString(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:
            return "ZIP";
        case ArchiveFormat::Tar:
            return "TAR";
        case ArchiveFormat::Gzip:
            return "GZIP";
        case ArchiveFormat::SevenZip:
            return "7Z";
    }
    return "archive";
}

Result<std::vector<std::string>> ArchiveReader::listEntries() const {
    std::vector<std::string> names;
    auto r = forEachEntry(data_, format_, false,
                          [&](struct archive* a, ArchiveEntryInfo info) -> Result<bool> {
                              archive_read_data_skip(a);
                              names.push_back(std::move(info.path));
                              return true;
                          });
    if (!r) {
        return r.error();
    }
    return names;
}

Result<std::vector<ArchiveEntryInfo>> ArchiveReader::describeEntries() const {
    std::vector<ArchiveEntryInfo> entries;
    auto r = forEachEntry(data_, format_, true,
                          [&](struct archive* a, ArchiveEntryInfo info) -> Result<bool> {
                              archive_read_data_skip(a);
                              entries.push_back(std::move(info));
                              return true;
                          });
    if (!r) {
        return r.error();
    }
    return entries;
}

Result<std::map<std::string, std::string>>
ArchiveReader::readEntries(const EntryFilter& filter) const {
    std::map<std::string, std::string> entries;
    auto r = forEachEntry(data_, format_, false,
                          [&](struct archive* a, ArchiveEntryInfo info) -> Result<bool> {
                              if (!filter(info.path)) {
                                  archive_read_data_skip(a);
                                  return true;
                              }
                              auto content = readData(a, info.path);
                              if (!content) {
                                  return content.error();
                              }
                              entries[info.path] = std::move(content).value();
                              return true;
                          });
    if (!r) {
        return r.error();
    }
    spdlog::trace("Read {} {} entries", entries.size(), toString(format_));
    return entries;
}

Result<std::string> ArchiveReader::readEntry(const std::string& name) const {
    std::optional<std::string> found;
    auto r = forEachEntry(data_, format_, false,
                          [&](struct archive* a, ArchiveEntryInfo info) -> Result<bool> {
                              if (info.path != name) {
                                  archive_read_data_skip(a);
                                  return true;
                              }
                              auto content = readData(a, info.path);
                              if (!content) {
                                  return content.error();
                              }
                              found = std::move(content).value();
                              return false;
                          });
    if (!r) {
        return r.error();
    }
    if (!found) {
        return Error{ErrorCode::Parsing,
                     std::string(toString(format_)) + " entry not found: " + name};
    }
    return std::move(*found);
}

bool ArchiveReader::isTarStream(std::span<const std::byte> data) {
    ArchivePtr a(archive_read_new());
    if (!a) {
        return false;
    }
    archive_read_support_filter_gzip(a.get());
    archive_read_support_format_tar(a.get());
    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        return false;
    }
    struct archive_entry* entry = nullptr;
    const int r = archive_read_next_header(a.get(), &entry);
    return r == ARCHIVE_OK || r == ARCHIVE_WARN || r == ARCHIVE_EOF;
}

} // namespace quarry::extraction
