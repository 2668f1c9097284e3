#include <quarry/core/mime.h>
#include <quarry/extraction/plain_text_extractor.h>
#include <quarry/extraction/text_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace quarry::extraction {

namespace {

// Rows beyond this are kept in content but not materialized as a Table
constexpr size_t kMaxTableRows = 100'000;

std::optional<std::string> markdownTitle(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        auto line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos
                                                                   : eol - pos);
        if (line.starts_with("# ")) {
            auto title = normalizeWhitespace(line.substr(2));
            if (!title.empty()) {
                return title;
            }
        }
        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }
    return std::nullopt;
}

} // namespace

std::vector<std::string> PlainTextExtractor::supportedMimeTypes() const {
    return {std::string(mime::kPlainText), std::string(mime::kMarkdown), std::string(mime::kCsv),
            std::string(mime::kTsv),       std::string(mime::kRst),      std::string(mime::kJson),
            std::string(mime::kXml),       std::string(mime::kXmlText),  std::string(mime::kYaml),
            std::string(mime::kToml),      "text/x-log"};
}

Result<ExtractionResult> PlainTextExtractor::extract(std::span<const std::byte> data,
                                                     const std::string& mimeType,
                                                     const ExtractionConfig& /*config*/) {
    auto decoded = decodeText(data);
    if (!decoded) {
        return decoded.error();
    }

    ExtractionResult result;
    result.mimeType = mimeType;
    result.content = std::move(decoded.value().text);
    result.metadata.set("encoding", decoded.value().encoding);
    result.metadata.set("encoding_confidence", decoded.value().confidence);

    const auto normalized = mime::normalize(mimeType);
    if (normalized == mime::kCsv || normalized == mime::kTsv) {
        const char sep = normalized == mime::kCsv ? ',' : '\t';
        auto rows = parseDelimited(result.content, sep);
        result.metadata.set("row_count", rows.size());
        if (!rows.empty() && rows.size() <= kMaxTableRows) {
            Table table;
            table.markdown = renderMarkdownTable(rows);
            table.cells = std::move(rows);
            result.tables.push_back(std::move(table));
        } else if (rows.size() > kMaxTableRows) {
            spdlog::debug("Delimited input has {} rows; table materialization skipped",
                          rows.size());
            result.addWarning("extraction", "Table too large to materialize; content kept as text");
        }
    } else if (normalized == mime::kMarkdown) {
        result.metadata.title = markdownTitle(result.content);
    } else if (normalized == mime::kJson) {
        if (!nlohmann::json::accept(result.content)) {
            result.addWarning("extraction", "JSON document is not well-formed");
        }
    }

    size_t lines = static_cast<size_t>(std::count(result.content.begin(), result.content.end(), '\n'));
    if (!result.content.empty() && result.content.back() != '\n') {
        ++lines;
    }
    result.metadata.set("line_count", lines);
    return result;
}

std::vector<std::vector<std::string>> PlainTextExtractor::parseDelimited(std::string_view text,
                                                                         char separator) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;

    auto endRow = [&] {
        if (fieldStarted || !field.empty() || !row.empty()) {
            row.push_back(std::move(field));
            rows.push_back(std::move(row));
        }
        row.clear();
        field.clear();
        fieldStarted = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"' && field.empty()) {
            inQuotes = true;
            fieldStarted = true;
        } else if (c == separator) {
            row.push_back(std::move(field));
            field.clear();
            fieldStarted = true;
        } else if (c == '\n') {
            endRow();
        } else if (c != '\r') {
            field += c;
        }
    }
    endRow();
    return rows;
}

} // namespace quarry::extraction
