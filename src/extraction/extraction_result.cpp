#include <quarry/core/base64.h>
#include <quarry/extraction/extraction_result.h>

#include <array>
#include <format>
#include <string_view>

namespace quarry {

namespace {

using nlohmann::json;

constexpr std::array<std::string_view, 7> kCommonMetadataKeys{
    "title", "authors", "language", "created_at", "modified_at", "subject", "keywords"};

bool isCommonKey(const std::string& key) {
    for (auto k : kCommonMetadataKeys) {
        if (key == k) {
            return true;
        }
    }
    return false;
}

template <typename T> json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T> std::optional<T> optionalFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

} // namespace

json Metadata::toJson() const {
    json j = json::object();
    if (additional.is_object()) {
        for (const auto& [key, value] : additional.items()) {
            j[key] = value;
        }
    }
    // Common fields win over colliding additional keys
    if (title)
        j["title"] = *title;
    if (!authors.empty())
        j["authors"] = authors;
    if (language)
        j["language"] = *language;
    if (createdAt)
        j["created_at"] = *createdAt;
    if (modifiedAt)
        j["modified_at"] = *modifiedAt;
    if (subject)
        j["subject"] = *subject;
    if (!keywords.empty())
        j["keywords"] = keywords;
    return j;
}

Metadata Metadata::fromJson(const json& j) {
    Metadata m;
    if (!j.is_object()) {
        return m;
    }
    m.title = optionalFromJson<std::string>(j, "title");
    m.language = optionalFromJson<std::string>(j, "language");
    m.createdAt = optionalFromJson<std::string>(j, "created_at");
    m.modifiedAt = optionalFromJson<std::string>(j, "modified_at");
    m.subject = optionalFromJson<std::string>(j, "subject");
    if (auto it = j.find("authors"); it != j.end() && it->is_array()) {
        m.authors = it->get<std::vector<std::string>>();
    }
    if (auto it = j.find("keywords"); it != j.end() && it->is_array()) {
        m.keywords = it->get<std::vector<std::string>>();
    }
    for (const auto& [key, value] : j.items()) {
        if (!isCommonKey(key)) {
            m.additional[key] = value;
        }
    }
    return m;
}

json Table::toJson() const {
    return json{{"cells", cells}, {"markdown", markdown}, {"page_number", optionalToJson(pageNumber)}};
}

Table Table::fromJson(const json& j) {
    Table t;
    t.cells = j.value("cells", std::vector<std::vector<std::string>>{});
    t.markdown = j.value("markdown", std::string{});
    t.pageNumber = optionalFromJson<size_t>(j, "page_number");
    return t;
}

json Chunk::toJson() const {
    return json{{"content", content},
                {"embedding", optionalToJson(embedding)},
                {"metadata",
                 {{"byte_start", byteStart},
                  {"byte_end", byteEnd},
                  {"token_count", optionalToJson(tokenCount)},
                  {"chunk_index", chunkIndex},
                  {"total_chunks", totalChunks},
                  {"first_page", optionalToJson(firstPage)},
                  {"last_page", optionalToJson(lastPage)}}}};
}

Chunk Chunk::fromJson(const json& j) {
    Chunk c;
    c.content = j.value("content", std::string{});
    c.embedding = optionalFromJson<std::vector<float>>(j, "embedding");
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        const auto& m = *it;
        c.byteStart = m.value("byte_start", size_t{0});
        c.byteEnd = m.value("byte_end", size_t{0});
        c.tokenCount = optionalFromJson<size_t>(m, "token_count");
        c.chunkIndex = m.value("chunk_index", size_t{0});
        c.totalChunks = m.value("total_chunks", size_t{0});
        c.firstPage = optionalFromJson<size_t>(m, "first_page");
        c.lastPage = optionalFromJson<size_t>(m, "last_page");
    }
    return c;
}

json ExtractedImage::toJson() const {
    return json{{"data", base64Encode(data)},
                {"format", format},
                {"image_index", imageIndex},
                {"page_number", optionalToJson(pageNumber)},
                {"width", optionalToJson(width)},
                {"height", optionalToJson(height)},
                {"ocr_text", optionalToJson(ocrText)}};
}

Result<ExtractedImage> ExtractedImage::fromJson(const json& j) {
    ExtractedImage img;
    auto decoded = base64Decode(j.value("data", std::string{}));
    if (!decoded) {
        return decoded.error();
    }
    img.data = std::move(decoded).value();
    img.format = j.value("format", std::string{});
    img.imageIndex = j.value("image_index", size_t{0});
    img.pageNumber = optionalFromJson<size_t>(j, "page_number");
    img.width = optionalFromJson<uint32_t>(j, "width");
    img.height = optionalFromJson<uint32_t>(j, "height");
    img.ocrText = optionalFromJson<std::string>(j, "ocr_text");
    return img;
}

json PageContent::toJson() const {
    json tablesJson = json::array();
    for (const auto& t : tables) {
        tablesJson.push_back(t.toJson());
    }
    return json{{"page_number", pageNumber},
                {"content", content},
                {"tables", std::move(tablesJson)},
                {"has_visual_content", hasVisualContent},
                {"text_coverage", optionalToJson(textCoverage)}};
}

PageContent PageContent::fromJson(const json& j) {
    PageContent p;
    p.pageNumber = j.value("page_number", size_t{0});
    p.content = j.value("content", std::string{});
    if (auto it = j.find("tables"); it != j.end() && it->is_array()) {
        for (const auto& t : *it) {
            p.tables.push_back(Table::fromJson(t));
        }
    }
    p.hasVisualContent = j.value("has_visual_content", false);
    p.textCoverage = optionalFromJson<double>(j, "text_coverage");
    return p;
}

json Keyword::toJson() const {
    return json{{"text", text}, {"score", score}, {"algorithm", algorithm}, {"positions", positions}};
}

Keyword Keyword::fromJson(const json& j) {
    Keyword k;
    k.text = j.value("text", std::string{});
    k.score = j.value("score", 0.0);
    k.algorithm = j.value("algorithm", std::string{});
    k.positions = j.value("positions", std::vector<size_t>{});
    return k;
}

json ExtractionResult::toJson() const {
    json j;
    j["content"] = content;
    j["mime_type"] = mimeType;
    j["metadata"] = metadata.toJson();

    json tablesJson = json::array();
    for (const auto& t : tables) {
        tablesJson.push_back(t.toJson());
    }
    j["tables"] = std::move(tablesJson);

    auto listToJson = [](const auto& opt) -> json {
        if (!opt) {
            return nullptr;
        }
        json arr = json::array();
        for (const auto& item : *opt) {
            arr.push_back(item.toJson());
        }
        return arr;
    };
    j["chunks"] = listToJson(chunks);
    j["images"] = listToJson(images);
    j["pages"] = listToJson(pages);
    j["keywords"] = listToJson(keywords);
    j["detected_languages"] = optionalToJson(detectedLanguages);
    j["quality_score"] = optionalToJson(qualityScore);

    json warningsJson = json::array();
    for (const auto& w : warnings) {
        warningsJson.push_back({{"source", w.source}, {"message", w.message}});
    }
    j["processing_warnings"] = std::move(warningsJson);
    return j;
}

Result<ExtractionResult> ExtractionResult::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::Parsing, "Extraction result must be a JSON object"};
    }
    ExtractionResult r;
    try {
        r.content = j.value("content", std::string{});
        r.mimeType = j.value("mime_type", std::string{});
        if (auto it = j.find("metadata"); it != j.end()) {
            r.metadata = Metadata::fromJson(*it);
        }
        if (auto it = j.find("tables"); it != j.end() && it->is_array()) {
            for (const auto& t : *it) {
                r.tables.push_back(Table::fromJson(t));
            }
        }
        if (auto it = j.find("chunks"); it != j.end() && it->is_array()) {
            r.chunks.emplace();
            for (const auto& c : *it) {
                r.chunks->push_back(Chunk::fromJson(c));
            }
        }
        if (auto it = j.find("images"); it != j.end() && it->is_array()) {
            r.images.emplace();
            for (const auto& i : *it) {
                auto img = ExtractedImage::fromJson(i);
                if (!img) {
                    return img.error();
                }
                r.images->push_back(std::move(img).value());
            }
        }
        if (auto it = j.find("pages"); it != j.end() && it->is_array()) {
            r.pages.emplace();
            for (const auto& p : *it) {
                r.pages->push_back(PageContent::fromJson(p));
            }
        }
        if (auto it = j.find("keywords"); it != j.end() && it->is_array()) {
            r.keywords.emplace();
            for (const auto& k : *it) {
                r.keywords->push_back(Keyword::fromJson(k));
            }
        }
        r.detectedLanguages = optionalFromJson<std::vector<std::string>>(j, "detected_languages");
        r.qualityScore = optionalFromJson<double>(j, "quality_score");
        if (auto it = j.find("processing_warnings"); it != j.end() && it->is_array()) {
            for (const auto& w : *it) {
                r.warnings.push_back(
                    {w.value("source", std::string{}), w.value("message", std::string{})});
            }
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::Parsing, std::format("Malformed extraction result: {}", e.what())};
    }
    return r;
}

} // namespace quarry
