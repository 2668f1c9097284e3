#include <quarry/core/mime.h>
#include <quarry/detection/format_classifier.h>
#include <quarry/extraction/archive_extractor.h>
#include <quarry/extraction/text_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

namespace quarry::extraction {

namespace {

constexpr std::string_view kGzipFallbackName = "compressed_content";
constexpr size_t kMaxGzipNameLength = 1024;

bool isTextMember(const std::string& path) {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || path.find('/', dot) != std::string::npos) {
        return false;
    }
    const auto type = detection::FormatClassifier::mimeFromExtension(path.substr(dot));
    return type.starts_with("text/") || type == mime::kJson || type == mime::kXml ||
           type == mime::kYaml || type == mime::kToml;
}

std::optional<ArchiveFormat> formatFor(const std::string& mimeType) {
    if (mimeType == mime::kZip) {
        return ArchiveFormat::Zip;
    }
    if (mimeType == mime::kTar) {
        return ArchiveFormat::Tar;
    }
    if (mimeType == mime::kGzip) {
        return ArchiveFormat::Gzip;
    }
    if (mimeType == mime::kSevenZip) {
        return ArchiveFormat::SevenZip;
    }
    return std::nullopt;
}

// Decodes text members into "--- path ---" sections, warning on anything skipped
class MemberWriter {
public:
    explicit MemberWriter(ExtractionResult& result) : result_(result) {}

    void add(const std::string& path, const std::string& body) {
        const auto bytes = std::as_bytes(std::span<const char>(body.data(), body.size()));
        if (detection::FormatClassifier::isBinaryData(bytes)) {
            result_.addWarning("extraction", "Skipped binary archive member '" + path + "'");
            return;
        }
        if (textBytes_ + body.size() > kMaxArchiveTextBytes) {
            result_.addWarning("extraction", "Archive text limit reached; member '" + path +
                                                 "' was listed but not extracted");
            return;
        }
        auto decoded = decodeText(bytes);
        if (!decoded) {
            result_.addWarning("extraction", "Could not decode archive member '" + path +
                                                 "': " + decoded.error().message);
            return;
        }
        textBytes_ += body.size();
        ++members_;
        sections_ += "\n\n--- " + path + " ---\n" + decoded.value().text;
    }

    size_t members() const { return members_; }
    const std::string& sections() const { return sections_; }

private:
    ExtractionResult& result_;
    std::string sections_;
    size_t textBytes_ = 0;
    size_t members_ = 0;
};

std::string listing(const char* format, const std::vector<ArchiveEntryInfo>& entries,
                    uint64_t totalSize) {
    size_t files = std::count_if(entries.begin(), entries.end(),
                                 [](const ArchiveEntryInfo& e) { return !e.isDirectory; });
    std::string out = std::string(format) + " archive: " + std::to_string(files) + " files, " +
                      std::to_string(totalSize) + " bytes";
    for (const auto& entry : entries) {
        out += "\n" + entry.path;
    }
    return out;
}

void setListingMetadata(ExtractionResult& result, const char* format,
                        const std::vector<ArchiveEntryInfo>& entries, uint64_t totalSize) {
    nlohmann::json files = nlohmann::json::array();
    size_t fileCount = 0;
    for (const auto& entry : entries) {
        files.push_back({{"path", entry.path}, {"size", entry.size}, {"is_dir", entry.isDirectory}});
        if (!entry.isDirectory) {
            ++fileCount;
        }
    }
    result.metadata.set("archive_format", format);
    result.metadata.set("file_count", fileCount);
    result.metadata.set("total_size", totalSize);
    result.metadata.set("files", std::move(files));
}

Result<ExtractionResult> extractEntries(std::span<const std::byte> data, ArchiveFormat format,
                                        const char* label, ExtractionResult result) {
    ArchiveReader reader(data, format);
    auto entries = reader.describeEntries();
    if (!entries) {
        return entries.error();
    }
    uint64_t totalSize = 0;
    for (const auto& entry : entries.value()) {
        if (!entry.isDirectory) {
            totalSize += entry.size;
        }
    }

    auto texts = reader.readEntries([](const std::string& path) { return isTextMember(path); });
    if (!texts) {
        return texts.error();
    }

    MemberWriter writer(result);
    std::set<std::string> written;
    for (const auto& entry : entries.value()) {
        auto it = texts.value().find(entry.path);
        if (it == texts.value().end() || !written.insert(entry.path).second) {
            continue;
        }
        writer.add(entry.path, it->second);
    }

    setListingMetadata(result, label, entries.value(), totalSize);
    result.metadata.set("text_file_count", writer.members());
    result.content = listing(label, entries.value(), totalSize) + writer.sections();
    spdlog::debug("{} archive: {} entries, {} text members", label, entries.value().size(),
                  writer.members());
    return result;
}

Result<ExtractionResult> extractGzipStream(std::span<const std::byte> data,
                                           ExtractionResult result) {
    ArchiveReader reader(data, ArchiveFormat::Gzip);
    auto streams = reader.readEntries([](const std::string&) { return true; });
    if (!streams) {
        return streams.error();
    }
    if (streams.value().empty()) {
        return Error{ErrorCode::Parsing, "gzip stream holds no data"};
    }
    const std::string& body = streams.value().begin()->second;
    const std::string name =
        ArchiveExtractor::gzipOriginalName(data).value_or(std::string(kGzipFallbackName));

    std::vector<ArchiveEntryInfo> entries{{name, body.size(), false}};
    MemberWriter writer(result);
    writer.add(name, body);

    const char* label = toString(ArchiveFormat::Gzip);
    setListingMetadata(result, label, entries, body.size());
    result.metadata.set("text_file_count", writer.members());
    result.content = listing(label, entries, body.size()) + writer.sections();
    return result;
}

} // namespace

std::vector<std::string> ArchiveExtractor::supportedMimeTypes() const {
    return {std::string(mime::kZip), std::string(mime::kTar), std::string(mime::kGzip),
            std::string(mime::kSevenZip)};
}

Result<ExtractionResult> ArchiveExtractor::extract(std::span<const std::byte> data,
                                                   const std::string& mimeType,
                                                   const ExtractionConfig& /*config*/) {
    const auto normalized = mime::normalize(mimeType);
    auto format = formatFor(normalized);
    if (!format) {
        return Error{ErrorCode::UnsupportedFormat, "Not an archive type: " + mimeType};
    }

    ExtractionResult result;
    result.mimeType = mimeType;

    if (*format == ArchiveFormat::Gzip) {
        if (ArchiveReader::isTarStream(data)) {
            result.metadata.set("compression", "gzip");
            return extractEntries(data, ArchiveFormat::Gzip, toString(ArchiveFormat::Tar),
                                  std::move(result));
        }
        return extractGzipStream(data, std::move(result));
    }
    return extractEntries(data, *format, toString(*format), std::move(result));
}

std::optional<std::string> ArchiveExtractor::gzipOriginalName(std::span<const std::byte> data) {
    constexpr size_t kFixedHeader = 10;
    constexpr unsigned kFlagExtra = 0x04;
    constexpr unsigned kFlagName = 0x08;
    auto byteAt = [&](size_t i) { return static_cast<unsigned char>(data[i]); };

    if (data.size() < kFixedHeader || byteAt(0) != 0x1F || byteAt(1) != 0x8B) {
        return std::nullopt;
    }
    const unsigned flags = byteAt(3);
    if ((flags & kFlagName) == 0) {
        return std::nullopt;
    }
    size_t pos = kFixedHeader;
    if (flags & kFlagExtra) {
        if (data.size() < pos + 2) {
            return std::nullopt;
        }
        pos += 2 + (static_cast<size_t>(byteAt(pos)) | (static_cast<size_t>(byteAt(pos + 1)) << 8));
    }
    std::string name;
    for (; pos < data.size() && name.size() < kMaxGzipNameLength; ++pos) {
        const unsigned char c = byteAt(pos);
        if (c == 0) {
            if (name.empty()) {
                return std::nullopt;
            }
            // FNAME is ISO-8859-1
            std::string utf8;
            for (unsigned char ch : name) {
                appendUtf8(ch, utf8);
            }
            return utf8;
        }
        name.push_back(static_cast<char>(c));
    }
    return std::nullopt;
}

} // namespace quarry::extraction
