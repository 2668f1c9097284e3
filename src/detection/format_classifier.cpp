#include <quarry/core/mime.h>
#include <quarry/crypto/hasher.h>
#include <quarry/detection/format_classifier.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <list>
#include <mutex>
#include <unordered_map>

#ifdef QUARRY_HAS_LIBMAGIC
#include <magic.h>
#endif

namespace quarry::detection {

namespace {

// Extension to MIME type mapping
const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    // Text formats
    {".txt", "text/plain"},
    {".text", "text/plain"},
    {".log", "text/plain"},
    {".md", "text/markdown"},
    {".markdown", "text/markdown"},
    {".rst", "text/x-rst"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".xhtml", "text/html"},
    {".csv", "text/csv"},
    {".tsv", "text/tab-separated-values"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".yaml", "application/x-yaml"},
    {".yml", "application/x-yaml"},
    {".toml", "application/toml"},
    {".rtf", "application/rtf"},

    // Documents
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".xlsm", "application/vnd.ms-excel.sheet.macroEnabled.12"},
    {".ppt", "application/vnd.ms-powerpoint"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".ppsx", "application/vnd.openxmlformats-officedocument.presentationml.slideshow"},
    {".odt", "application/vnd.oasis.opendocument.text"},
    {".ods", "application/vnd.oasis.opendocument.spreadsheet"},
    {".odp", "application/vnd.oasis.opendocument.presentation"},
    {".epub", "application/epub+zip"},

    // Images
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".webp", "image/webp"},
    {".svg", "image/svg+xml"},

    // Archives
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".tgz", "application/gzip"},
    {".7z", "application/x-7z-compressed"},
};

std::vector<std::byte> bytesOf(std::initializer_list<unsigned char> raw) {
    std::vector<std::byte> out;
    out.reserve(raw.size());
    for (auto b : raw) {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

std::vector<std::byte> bytesOf(std::string_view raw) {
    std::vector<std::byte> out;
    out.reserve(raw.size());
    for (char c : raw) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

std::vector<FilePattern> defaultPatterns() {
    std::vector<FilePattern> p;
    p.push_back({{{0, bytesOf("%PDF-")}}, std::string(mime::kPdf), "PDF document", 1.0f});
    p.push_back({{{0, bytesOf({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})}},
                 std::string(mime::kPng),
                 "PNG image",
                 1.0f});
    p.push_back({{{0, bytesOf({0xFF, 0xD8, 0xFF})}}, std::string(mime::kJpeg), "JPEG image", 1.0f});
    p.push_back({{{0, bytesOf("GIF87a")}}, std::string(mime::kGif), "GIF image", 1.0f});
    p.push_back({{{0, bytesOf("GIF89a")}}, std::string(mime::kGif), "GIF image", 1.0f});
    p.push_back({{{0, bytesOf("BM")}, {6, bytesOf({0, 0, 0, 0})}},
                 std::string(mime::kBmp),
                 "BMP image",
                 0.8f});
    p.push_back({{{0, bytesOf({'I', 'I', 0x2A, 0x00})}}, std::string(mime::kTiff), "TIFF image",
                 1.0f});
    p.push_back({{{0, bytesOf({'M', 'M', 0x00, 0x2A})}}, std::string(mime::kTiff), "TIFF image",
                 1.0f});
    p.push_back({{{0, bytesOf("RIFF")}, {8, bytesOf("WEBP")}},
                 std::string(mime::kWebp),
                 "WebP image",
                 1.0f});
    p.push_back({{{0, bytesOf({'P', 'K', 0x03, 0x04})}}, std::string(mime::kZip), "ZIP container",
                 0.9f});
    p.push_back({{{0, bytesOf({'P', 'K', 0x05, 0x06})}}, std::string(mime::kZip),
                 "Empty ZIP container", 0.9f});
    p.push_back({{{0, bytesOf({0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1})}},
                 std::string(mime::kOle2),
                 "OLE2 compound document",
                 0.9f});
    p.push_back({{{0, bytesOf("{\\rtf")}}, std::string(mime::kRtf), "RTF document", 1.0f});
    p.push_back({{{0, bytesOf({0x1F, 0x8B})}}, std::string(mime::kGzip), "gzip stream", 0.9f});
    p.push_back({{{257, bytesOf("ustar")}}, std::string(mime::kTar), "tar archive", 0.9f});
    p.push_back({{{0, bytesOf({'7', 'z', 0xBC, 0xAF, 0x27, 0x1C})}},
                 std::string(mime::kSevenZip),
                 "7-Zip archive",
                 1.0f});
    return p;
}

std::string_view asChars(std::span<const std::byte> data) {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

std::string lowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

uint16_t readLe16(std::string_view s, size_t off) {
    return static_cast<uint16_t>(static_cast<unsigned char>(s[off]) |
                                 (static_cast<unsigned char>(s[off + 1]) << 8));
}

uint32_t readLe32(std::string_view s, size_t off) {
    return static_cast<uint32_t>(static_cast<unsigned char>(s[off])) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 3])) << 24);
}

// ODF and EPUB store an uncompressed "mimetype" entry first in the archive
std::optional<std::string> odfMimetypeEntry(std::string_view zip) {
    constexpr size_t kHeader = 30;
    if (zip.size() < kHeader + 8 || zip.substr(kHeader, 8) != "mimetype") {
        return std::nullopt;
    }
    const uint16_t method = readLe16(zip, 8);
    const uint32_t compressedSize = readLe32(zip, 18);
    const uint16_t nameLen = readLe16(zip, 26);
    const uint16_t extraLen = readLe16(zip, 28);
    if (method != 0 || nameLen != 8 || compressedSize == 0 || compressedSize > 256) {
        return std::nullopt;
    }
    const size_t dataStart = kHeader + nameLen + extraLen;
    if (zip.size() < dataStart + compressedSize) {
        return std::nullopt;
    }
    return std::string(zip.substr(dataStart, compressedSize));
}

std::string zipContainerType(std::string_view zip) {
    if (auto odf = odfMimetypeEntry(zip)) {
        return mime::normalize(*odf);
    }
    // Entry names are stored uncompressed in local headers and the central directory
    if (zip.find("word/document.xml") != std::string_view::npos) {
        return std::string(mime::kDocx);
    }
    if (zip.find("xl/workbook.xml") != std::string_view::npos) {
        if (zip.find("vbaProject.bin") != std::string_view::npos) {
            return std::string(mime::kXlsm);
        }
        return std::string(mime::kXlsx);
    }
    if (zip.find("ppt/presentation.xml") != std::string_view::npos) {
        return std::string(mime::kPptx);
    }
    return std::string(mime::kZip);
}

bool isValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        if (c < 0x80) {
            len = 1;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            // Truncated trailing sequence in a prefix is acceptable
            return true;
        }
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

std::string_view skipLeadingNoise(std::string_view s) {
    if (s.starts_with("\xEF\xBB\xBF")) {
        s.remove_prefix(3);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    return s;
}

std::optional<std::string> sniffText(std::string_view text) {
    auto body = skipLeadingNoise(text);
    auto head = lowerCopy(body.substr(0, std::min<size_t>(body.size(), 1024)));
    if (head.starts_with("<!doctype html") || head.starts_with("<html")) {
        return std::string(mime::kHtml);
    }
    if (head.starts_with("<?xml") || head.starts_with("<")) {
        if (head.find("<svg") != std::string::npos) {
            return std::string(mime::kSvg);
        }
        if (head.find("<html") != std::string::npos) {
            return std::string(mime::kHtml);
        }
        if (head.starts_with("<?xml")) {
            return std::string(mime::kXml);
        }
    }
    if (!body.empty() && (body.front() == '{' || body.front() == '[') &&
        nlohmann::json::accept(body)) {
        return std::string(mime::kJson);
    }
    return std::nullopt;
}

// Broad families used to decide whether a hint may refine a generic sniff
std::string_view familyOf(std::string_view m) {
    if (m.starts_with("text/") || m == mime::kJson || m == mime::kXml || m == mime::kYaml ||
        m == mime::kToml || m == mime::kSvg) {
        return "text";
    }
    if (m == mime::kZip || m == mime::kDocx || m == mime::kXlsx || m == mime::kXlsm ||
        m == mime::kPptx || m == mime::kPpsx || m == mime::kOdt || m == mime::kOds ||
        m == mime::kOdp || m == mime::kEpub) {
        return "zip";
    }
    if (m == mime::kOle2 || m == mime::kLegacyWord || m == mime::kLegacyExcel ||
        m == mime::kLegacyPowerPoint) {
        return "ole";
    }
    return m;
}

bool hintRefines(std::string_view sniffed, std::string_view hint) {
    return familyOf(sniffed) == familyOf(hint);
}

} // namespace

const char* toString(DetectionSource source) {
    switch (source) {
        case DetectionSource::Magic:
            return "magic";
        case DetectionSource::Container:
            return "container";
        case DetectionSource::TextSniff:
            return "text";
        case DetectionSource::LibMagic:
            return "libmagic";
        case DetectionSource::Declared:
            return "declared";
        case DetectionSource::Extension:
            return "extension";
    }
    return "magic";
}

class FormatClassifier::Impl {
public:
    explicit Impl(ClassifierConfig cfg) : config(std::move(cfg)), patterns(defaultPatterns()) {
#ifdef QUARRY_HAS_LIBMAGIC
        if (config.useLibMagic) {
            magicCookie = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
            if (magicCookie && magic_load(magicCookie, nullptr) != 0) {
                spdlog::debug("libmagic database unavailable: {}", magic_error(magicCookie));
                magic_close(magicCookie);
                magicCookie = nullptr;
            }
        }
#endif
    }

    ~Impl() {
#ifdef QUARRY_HAS_LIBMAGIC
        if (magicCookie) {
            magic_close(magicCookie);
        }
#endif
    }

    std::optional<Classification> matchPatterns(std::span<const std::byte> data) const {
        const FilePattern* best = nullptr;
        for (const auto& pattern : patterns) {
            bool matches = true;
            for (const auto& seg : pattern.segments) {
                if (data.size() < seg.offset + seg.bytes.size() ||
                    !std::equal(seg.bytes.begin(), seg.bytes.end(), data.begin() + seg.offset)) {
                    matches = false;
                    break;
                }
            }
            if (matches && (!best || pattern.confidence > best->confidence)) {
                best = &pattern;
            }
        }
        if (!best) {
            return std::nullopt;
        }
        Classification c;
        c.mimeType = best->mimeType;
        c.source = DetectionSource::Magic;
        c.confidence = best->confidence;
        c.isBinary = best->mimeType != mime::kRtf;
        return c;
    }

    std::optional<Classification> detectWithLibMagic(std::span<const std::byte> data) const {
#ifdef QUARRY_HAS_LIBMAGIC
        std::lock_guard<std::mutex> lock(magicMutex);
        if (!magicCookie) {
            return std::nullopt;
        }
        const char* detected = magic_buffer(magicCookie, data.data(), data.size());
        if (!detected) {
            return std::nullopt;
        }
        auto normalized = mime::normalize(detected);
        if (normalized == mime::kOctetStream || normalized.starts_with("text/") ||
            normalized == "application/x-empty") {
            return std::nullopt;
        }
        Classification c;
        c.mimeType = normalized;
        c.source = DetectionSource::LibMagic;
        c.confidence = 0.85f;
        return c;
#else
        (void)data;
        return std::nullopt;
#endif
    }

    std::optional<Classification> lookupCache(const std::string& key) const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        auto it = cache.find(key);
        if (it == cache.end()) {
            ++stats.misses;
            return std::nullopt;
        }
        ++stats.hits;
        return it->second;
    }

    void storeCache(const std::string& key, const Classification& c) const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        if (cache.size() >= config.cacheSize && !order.empty()) {
            cache.erase(order.front());
            order.pop_front();
        }
        if (cache.emplace(key, c).second) {
            order.push_back(key);
        }
        stats.entries = cache.size();
    }

    ClassifierConfig config;
    std::vector<FilePattern> patterns;

    mutable std::mutex cacheMutex;
    mutable std::unordered_map<std::string, Classification> cache;
    mutable std::list<std::string> order;
    mutable CacheStats stats;

#ifdef QUARRY_HAS_LIBMAGIC
    magic_t magicCookie = nullptr;
    mutable std::mutex magicMutex; // libmagic handles are not thread-safe
#endif
};

FormatClassifier::FormatClassifier(ClassifierConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {}

FormatClassifier::~FormatClassifier() = default;

FormatClassifier& FormatClassifier::instance() {
    static FormatClassifier classifier;
    return classifier;
}

std::optional<Classification> FormatClassifier::sniff(std::span<const std::byte> bytes) const {
    if (bytes.empty()) {
        return std::nullopt;
    }

    // ZIP results depend on entry names anywhere in the buffer; everything else on the prefix
    const auto prefix = bytes.first(std::min(bytes.size(), pImpl->config.maxBytesToRead));
    std::string cacheKey;
    if (pImpl->config.cacheResults) {
        cacheKey = crypto::SHA256Hasher::hash(prefix) + ":" + std::to_string(bytes.size());
        if (auto cached = pImpl->lookupCache(cacheKey)) {
            return cached;
        }
    }

    std::optional<Classification> result = pImpl->matchPatterns(prefix);
    if (result && result->mimeType == mime::kZip) {
        result->mimeType = zipContainerType(asChars(bytes));
        if (result->mimeType != mime::kZip) {
            result->source = DetectionSource::Container;
            result->confidence = 0.95f;
        }
    }

    if (!result) {
        if (!isBinaryData(prefix)) {
            Classification c;
            c.isBinary = false;
            if (auto textType = sniffText(asChars(bytes))) {
                c.mimeType = *textType;
                c.source = DetectionSource::TextSniff;
                c.confidence = 0.8f;
            } else {
                c.mimeType = std::string(mime::kPlainText);
                c.source = DetectionSource::TextSniff;
                c.confidence = 0.5f;
            }
            result = std::move(c);
        } else {
            result = pImpl->detectWithLibMagic(prefix);
        }
    }

    if (result && pImpl->config.cacheResults) {
        pImpl->storeCache(cacheKey, *result);
    }
    return result;
}

Result<Classification>
FormatClassifier::classify(std::span<const std::byte> bytes,
                           const std::optional<std::filesystem::path>& pathHint,
                           const std::optional<std::string>& declaredMime) const {
    struct Hint {
        std::string mimeType;
        DetectionSource source;
    };
    std::vector<Hint> hints;
    if (declaredMime && !declaredMime->empty()) {
        auto normalized = mime::normalize(*declaredMime);
        if (normalized != mime::kOctetStream) {
            hints.push_back({std::move(normalized), DetectionSource::Declared});
        }
    }
    if (pathHint && pathHint->has_extension()) {
        auto fromExt = mimeFromExtension(pathHint->extension().string());
        if (fromExt != mime::kOctetStream) {
            hints.push_back({std::move(fromExt), DetectionSource::Extension});
        }
    }

    auto sniffed = sniff(bytes);

    if (sniffed && !mime::isGeneric(sniffed->mimeType)) {
        for (const auto& hint : hints) {
            if (hint.mimeType != sniffed->mimeType) {
                spdlog::warn("Ignoring {} type '{}': content is '{}'", toString(hint.source),
                             hint.mimeType, sniffed->mimeType);
                sniffed->overriddenHint = hint.mimeType;
            }
        }
        return *sniffed;
    }

    if (sniffed) {
        for (const auto& hint : hints) {
            if (hintRefines(sniffed->mimeType, hint.mimeType)) {
                Classification refined = *sniffed;
                refined.mimeType = hint.mimeType;
                refined.source = hint.source;
                refined.confidence = 0.7f;
                return refined;
            }
            spdlog::warn("Ignoring {} type '{}': content is '{}'", toString(hint.source),
                         hint.mimeType, sniffed->mimeType);
            sniffed->overriddenHint = hint.mimeType;
        }
        return *sniffed;
    }

    if (!bytes.empty()) {
        // Unrecognized binary: a hint is the only evidence left, but text types cannot apply
        for (const auto& hint : hints) {
            if (familyOf(hint.mimeType) != "text") {
                Classification c;
                c.mimeType = hint.mimeType;
                c.source = hint.source;
                c.confidence = 0.4f;
                return c;
            }
        }
        return Error{ErrorCode::UnsupportedFormat,
                     "Unsupported format: content does not match any known signature"};
    }

    if (!hints.empty()) {
        Classification c;
        c.mimeType = hints.front().mimeType;
        c.source = hints.front().source;
        c.confidence = 0.6f;
        c.isBinary = familyOf(c.mimeType) != "text";
        return c;
    }
    return Error{ErrorCode::UnsupportedFormat,
                 "Unsupported format: no content, extension or declared MIME type"};
}

Result<Classification>
FormatClassifier::classifyFile(const std::filesystem::path& path,
                               const std::optional<std::string>& declaredMime) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::Io, "File not found: " + path.string()};
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::Io, "Permission denied or unreadable: " + path.string()};
    }

    std::vector<std::byte> buffer(pImpl->config.maxBytesToRead);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<size_t>(file.gcount()));

    // Append the tail so container entry names in the central directory are visible
    if (buffer.size() >= 4 && buffer[0] == std::byte{'P'} && buffer[1] == std::byte{'K'}) {
        auto size = std::filesystem::file_size(path, ec);
        if (!ec && size > buffer.size()) {
            auto tail = std::min<uint64_t>(pImpl->config.zipTailBytes, size - buffer.size());
            file.clear();
            file.seekg(static_cast<std::streamoff>(size - tail));
            std::vector<std::byte> tailBytes(static_cast<size_t>(tail));
            file.read(reinterpret_cast<char*>(tailBytes.data()),
                      static_cast<std::streamsize>(tailBytes.size()));
            tailBytes.resize(static_cast<size_t>(file.gcount()));
            buffer.insert(buffer.end(), tailBytes.begin(), tailBytes.end());
        }
    }

    return classify(buffer, path, declaredMime);
}

std::string FormatClassifier::mimeFromExtension(std::string_view extension) {
    std::string ext = lowerCopy(extension);
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    auto it = EXTENSION_MIME_MAP.find(ext);
    return it != EXTENSION_MIME_MAP.end() ? it->second : std::string(mime::kOctetStream);
}

bool FormatClassifier::isBinaryData(std::span<const std::byte> data) {
    if (data.empty()) {
        return false;
    }
    auto text = asChars(data);
    // UTF-16 with BOM is text even though it carries NULs
    if (text.starts_with("\xFF\xFE") || text.starts_with("\xFE\xFF")) {
        return false;
    }
    size_t control = 0;
    for (unsigned char c : text) {
        if (c == 0) {
            return true;
        }
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t' && c != '\f' && c != 0x1B) {
            ++control;
        }
    }
    if (control * 10 > text.size()) {
        return true;
    }
    if (isValidUtf8(text)) {
        return false;
    }
    // Latin-1 and similar single-byte encodings: mostly printable
    size_t high = std::count_if(text.begin(), text.end(),
                                [](unsigned char c) { return c >= 0x80 && c < 0xA0; });
    return high * 5 > text.size();
}

FormatClassifier::CacheStats FormatClassifier::cacheStats() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->stats;
}

void FormatClassifier::clearCache() {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    pImpl->cache.clear();
    pImpl->order.clear();
    pImpl->stats = {};
}

} // namespace quarry::detection
