#include <quarry/core/mime.h>
#include <quarry/extraction/html_extractor.h>
#include <quarry/extraction/text_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace quarry::extraction {

namespace {

size_t find_caseless(const std::string& haystack, std::string_view needle, size_t offset = 0) {
    if (offset >= haystack.size()) {
        return std::string::npos;
    }
    auto it = std::search(
        haystack.begin() + static_cast<std::ptrdiff_t>(offset), haystack.end(), needle.begin(),
        needle.end(),
        [](unsigned char c1, unsigned char c2) { return std::tolower(c1) == std::tolower(c2); });
    if (it == haystack.end()) {
        return std::string::npos;
    }
    return static_cast<size_t>(std::distance(haystack.begin(), it));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

constexpr std::array<std::string_view, 30> kBlockTags = {
    "p",     "div",   "h1",     "h2",     "h3",      "h4",      "h5",     "h6",
    "ul",    "ol",    "li",     "blockquote", "pre", "hr",      "table",  "tr",
    "td",    "th",    "section", "article", "header", "footer", "nav",   "aside",
    "main",  "br",    "dl",     "dt",     "dd",      "figcaption"};

// Reads the value of attribute @p attr from a single tag's text
std::string attributeValue(const std::string& tag, const std::string& attr) {
    auto tagLower = lower(tag);
    size_t pos = 0;
    while ((pos = tagLower.find(attr, pos)) != std::string::npos) {
        bool boundary = pos > 0 && std::isspace(static_cast<unsigned char>(tagLower[pos - 1]));
        size_t p = pos + attr.size();
        while (p < tag.size() && std::isspace(static_cast<unsigned char>(tag[p]))) {
            ++p;
        }
        if (!boundary || p >= tag.size() || tag[p] != '=') {
            pos += attr.size();
            continue;
        }
        ++p;
        while (p < tag.size() && std::isspace(static_cast<unsigned char>(tag[p]))) {
            ++p;
        }
        if (p >= tag.size()) {
            return {};
        }
        char quote = tag[p];
        if (quote == '"' || quote == '\'') {
            auto end = tag.find(quote, p + 1);
            if (end == std::string::npos) {
                return {};
            }
            return tag.substr(p + 1, end - p - 1);
        }
        auto end = tag.find_first_of(" \t\r\n>", p);
        return tag.substr(p, end == std::string::npos ? std::string::npos : end - p);
    }
    return {};
}

} // namespace

std::vector<std::string> HtmlExtractor::supportedMimeTypes() const {
    return {std::string(mime::kHtml), "application/xhtml+xml"};
}

Result<ExtractionResult> HtmlExtractor::extract(std::span<const std::byte> data,
                                                const std::string& mimeType,
                                                const ExtractionConfig& /*config*/) {
    auto decoded = decodeText(data);
    if (!decoded) {
        return decoded.error();
    }
    const std::string& html = decoded.value().text;

    ExtractionResult result;
    result.mimeType = mimeType;
    result.content = extractTextFromHtml(html);
    result.tables = extractTables(html);
    result.metadata.set("format", "html");
    result.metadata.set("encoding", decoded.value().encoding);

    if (auto title = extractTitle(html); !title.empty()) {
        result.metadata.title = title;
    }
    if (auto description = extractMetaContent(html, "description"); !description.empty()) {
        result.metadata.subject = description;
    }
    if (auto author = extractMetaContent(html, "author"); !author.empty()) {
        result.metadata.authors.push_back(author);
    }
    if (auto keywords = extractMetaContent(html, "keywords"); !keywords.empty()) {
        size_t start = 0;
        while (start <= keywords.size()) {
            auto comma = keywords.find(',', start);
            auto token = keywords.substr(start, comma == std::string::npos ? std::string::npos
                                                                           : comma - start);
            token = normalizeWhitespace(token);
            if (!token.empty()) {
                result.metadata.keywords.push_back(token);
            }
            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
    }
    auto langPos = find_caseless(html, "<html");
    if (langPos != std::string::npos) {
        auto tagEnd = html.find('>', langPos);
        if (tagEnd != std::string::npos) {
            auto lang = attributeValue(html.substr(langPos, tagEnd - langPos), "lang");
            if (!lang.empty()) {
                result.metadata.language = lang;
            }
        }
    }
    return result;
}

std::string HtmlExtractor::extractTextFromHtml(const std::string& html) {
    if (html.empty()) {
        return "";
    }

    constexpr size_t kLargeDocument = 5 * 1024 * 1024;
    if (html.size() > kLargeDocument) {
        spdlog::debug("Large HTML document ({} bytes), skipping block-tag conversion",
                      html.size());
        auto text = removeScriptAndStyle(html);
        text = stripHtmlTags(text);
        text = decodeHtmlEntities(text);
        return cleanWhitespace(text);
    }

    std::string text = removeScriptAndStyle(html);
    text = convertBlockTagsToNewlines(text);
    text = stripHtmlTags(text);
    text = decodeHtmlEntities(text);
    return cleanWhitespace(text);
}

std::string HtmlExtractor::removeScriptAndStyle(const std::string& html) {
    std::string result;
    result.reserve(html.size());
    size_t last_pos = 0;

    while (last_pos < html.size()) {
        size_t script_start = find_caseless(html, "<script", last_pos);
        size_t style_start = find_caseless(html, "<style", last_pos);
        size_t comment_start = html.find("<!--", last_pos);

        size_t next_block = std::min({script_start, style_start, comment_start});
        if (next_block == std::string::npos) {
            result.append(html, last_pos, std::string::npos);
            break;
        }

        result.append(html, last_pos, next_block - last_pos);

        std::string_view closing = next_block == script_start  ? "</script>"
                                   : next_block == style_start ? "</style>"
                                                               : "-->";
        size_t end_tag = next_block == comment_start ? html.find("-->", next_block)
                                                     : find_caseless(html, closing, next_block);
        if (end_tag == std::string::npos) {
            // Unterminated block: drop the remainder
            break;
        }
        last_pos = end_tag + closing.size();
    }
    return result;
}

std::string HtmlExtractor::convertBlockTagsToNewlines(const std::string& html) {
    std::string result;
    result.reserve(html.size() + html.size() / 10);

    size_t pos = 0;
    while (pos < html.size()) {
        if (html[pos] != '<') {
            result += html[pos];
            pos++;
            continue;
        }

        size_t tag_end = html.find('>', pos);
        if (tag_end == std::string::npos) {
            result += html[pos];
            pos++;
            continue;
        }

        std::string tag_content = html.substr(pos + 1, tag_end - pos - 1);
        bool is_closing = !tag_content.empty() && tag_content[0] == '/';
        if (is_closing) {
            tag_content = tag_content.substr(1);
        }
        size_t space_pos = tag_content.find_first_of(" \t\n\r/");
        std::string tag_lower = lower(tag_content.substr(0, space_pos));

        if (std::find(kBlockTags.begin(), kBlockTags.end(), tag_lower) != kBlockTags.end()) {
            // Cells stay on their row
            result += (tag_lower == "td" || tag_lower == "th") ? '\t' : '\n';
        }
        // Keep the tag for the stripping pass
        result.append(html, pos, tag_end - pos + 1);
        pos = tag_end + 1;
    }

    return result;
}

std::string HtmlExtractor::stripHtmlTags(const std::string& html) {
    std::string result;
    result.reserve(html.length());
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>') {
            in_tag = false;
        } else if (!in_tag) {
            result += c;
        }
    }
    return result;
}

std::string HtmlExtractor::decodeHtmlEntities(const std::string& text) {
    static const std::vector<std::pair<std::string_view, std::string_view>> entities = {
        {"&amp;", "&"},      {"&lt;", "<"},          {"&gt;", ">"},       {"&quot;", "\""},
        {"&apos;", "'"},     {"&nbsp;", " "},        {"&ndash;", "–"}, {"&mdash;", "—"},
        {"&copy;", "©"}, {"&reg;", "®"},   {"&trade;", "™"}, {"&hellip;", "…"},
        {"&bull;", "•"}, {"&ldquo;", "“"}, {"&rdquo;", "”"}, {"&lsquo;", "‘"},
        {"&rsquo;", "’"}, {"&euro;", "€"}, {"&eacute;", "é"}, {"&uuml;", "ü"},
        {"&ouml;", "ö"}, {"&auml;", "ä"}};

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            result += text[pos];
            pos++;
            continue;
        }

        bool decoded = false;
        for (const auto& [entity, replacement] : entities) {
            if (text.compare(pos, entity.length(), entity) == 0) {
                result += replacement;
                pos += entity.length();
                decoded = true;
                break;
            }
        }
        if (decoded) {
            continue;
        }

        // Numeric entities: &#123; and &#x1F;
        if (pos + 2 < text.size() && text[pos + 1] == '#') {
            const bool hex = text[pos + 2] == 'x' || text[pos + 2] == 'X';
            const size_t digitsStart = pos + (hex ? 3 : 2);
            size_t end = text.find(';', digitsStart);
            if (end != std::string::npos && end > digitsStart && end - pos < 12) {
                uint32_t code = 0;
                auto [ptr, ec] = std::from_chars(text.data() + digitsStart, text.data() + end,
                                                 code, hex ? 16 : 10);
                if (ec == std::errc{} && ptr == text.data() + end && code > 0) {
                    appendUtf8(code, result);
                    pos = end + 1;
                    continue;
                }
            }
        }

        result += text[pos];
        pos++;
    }

    return result;
}

std::string HtmlExtractor::cleanWhitespace(const std::string& text) {
    return normalizeWhitespace(text);
}

std::string HtmlExtractor::extractTitle(const std::string& html) {
    size_t title_start = find_caseless(html, "<title");
    if (title_start == std::string::npos) {
        return "";
    }
    size_t content_start = html.find('>', title_start);
    if (content_start == std::string::npos) {
        return "";
    }
    content_start++;
    size_t content_end = find_caseless(html, "</title>", content_start);
    if (content_end == std::string::npos) {
        return "";
    }
    std::string title = html.substr(content_start, content_end - content_start);
    title = stripHtmlTags(title);
    title = decodeHtmlEntities(title);
    return cleanWhitespace(title);
}

std::string HtmlExtractor::extractMetaContent(const std::string& html,
                                              const std::string& metaName) {
    const std::string wanted = lower(metaName);
    size_t pos = 0;
    while (pos < html.size()) {
        size_t meta_start = find_caseless(html, "<meta", pos);
        if (meta_start == std::string::npos) {
            break;
        }
        size_t meta_end = html.find('>', meta_start);
        if (meta_end == std::string::npos) {
            break;
        }
        std::string tag = html.substr(meta_start, meta_end - meta_start + 1);
        auto nameAttr = lower(attributeValue(tag, "name"));
        auto propertyAttr = lower(attributeValue(tag, "property"));
        if (nameAttr == wanted || propertyAttr == "og:" + wanted) {
            auto content = attributeValue(tag, "content");
            if (!content.empty()) {
                return decodeHtmlEntities(content);
            }
        }
        pos = meta_end + 1;
    }
    return "";
}

std::vector<Table> HtmlExtractor::extractTables(const std::string& html) {
    std::vector<Table> tables;
    size_t pos = 0;
    while ((pos = find_caseless(html, "<table", pos)) != std::string::npos) {
        size_t end = find_caseless(html, "</table>", pos);
        if (end == std::string::npos) {
            break;
        }
        const std::string body = html.substr(pos, end - pos);
        std::vector<std::vector<std::string>> rows;
        size_t rowPos = 0;
        while ((rowPos = find_caseless(body, "<tr", rowPos)) != std::string::npos) {
            size_t rowEnd = find_caseless(body, "</tr>", rowPos);
            const std::string row =
                body.substr(rowPos, rowEnd == std::string::npos ? std::string::npos
                                                                : rowEnd - rowPos);
            std::vector<std::string> cells;
            size_t cellPos = 0;
            while (cellPos < row.size()) {
                size_t td = find_caseless(row, "<td", cellPos);
                size_t th = find_caseless(row, "<th", cellPos);
                size_t cellStart = std::min(td, th);
                if (cellStart == std::string::npos) {
                    break;
                }
                size_t open = row.find('>', cellStart);
                if (open == std::string::npos) {
                    break;
                }
                size_t closeTd = find_caseless(row, "</td", open);
                size_t closeTh = find_caseless(row, "</th", open);
                size_t nextCell = std::min(find_caseless(row, "<td", open + 1),
                                           find_caseless(row, "<th", open + 1));
                size_t cellEnd = std::min({closeTd, closeTh, nextCell, row.size()});
                auto cell = decodeHtmlEntities(stripHtmlTags(row.substr(open + 1, cellEnd - open - 1)));
                cells.push_back(normalizeWhitespace(cell));
                cellPos = cellEnd;
            }
            if (!cells.empty()) {
                rows.push_back(std::move(cells));
            }
            if (rowEnd == std::string::npos) {
                break;
            }
            rowPos = rowEnd + 5;
        }
        if (!rows.empty()) {
            Table t;
            t.markdown = renderMarkdownTable(rows);
            t.cells = std::move(rows);
            tables.push_back(std::move(t));
        }
        pos = end + 8;
    }
    return tables;
}

} // namespace quarry::extraction
