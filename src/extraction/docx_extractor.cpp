#include <quarry/core/mime.h>
#include <quarry/extraction/docx_extractor.h>
#include <quarry/extraction/ooxml.h>
#include <quarry/extraction/text_utils.h>
#include <quarry/extraction/xml_document.h>
#include <quarry/extraction/archive_reader.h>

#include <spdlog/spdlog.h>

namespace quarry::extraction {

namespace {

constexpr const char* kDocumentPart = "word/document.xml";

// Concatenates run text; tabs and breaks become whitespace
std::string paragraphText(XmlNode paragraph) {
    std::string out;
    std::vector<XmlNode> stack{paragraph};
    while (!stack.empty()) {
        XmlNode node = stack.back();
        stack.pop_back();
        if (node.type() == pugi::node_element) {
            auto name = XmlDocument::localName(node);
            if (name == "t" || name == "delText") {
                if (name == "t") {
                    out += XmlDocument::text(node);
                }
                continue;
            }
            if (name == "tab") {
                out += '\t';
                continue;
            }
            if (name == "br" || name == "cr") {
                out += '\n';
                continue;
            }
        }
        for (XmlNode child = node.last_child(); child; child = child.previous_sibling()) {
            stack.push_back(child);
        }
    }
    return out;
}

int headingLevel(XmlNode paragraph) {
    auto pPr = XmlDocument::firstChild(paragraph, "pPr");
    auto style = XmlDocument::attribute(XmlDocument::firstChild(pPr, "pStyle"), "val");
    if (style == "Title") {
        return 1;
    }
    if (style.size() == 8 && style.starts_with("Heading") && style[7] >= '1' && style[7] <= '6') {
        return style[7] - '0';
    }
    return 0;
}

Table tableFrom(XmlNode tbl) {
    Table table;
    for (auto tr : XmlDocument::children(tbl, "tr")) {
        std::vector<std::string> row;
        for (auto tc : XmlDocument::children(tr, "tc")) {
            std::string cell;
            for (auto p : XmlDocument::children(tc, "p")) {
                auto text = paragraphText(p);
                if (!cell.empty() && !text.empty()) {
                    cell += ' ';
                }
                cell += text;
            }
            row.push_back(normalizeWhitespace(cell));
        }
        if (!row.empty()) {
            table.cells.push_back(std::move(row));
        }
    }
    table.markdown = renderMarkdownTable(table.cells);
    return table;
}

} // namespace

std::vector<std::string> DocxExtractor::supportedMimeTypes() const {
    return {std::string(mime::kDocx)};
}

Result<ExtractionResult> DocxExtractor::extract(std::span<const std::byte> data,
                                                const std::string& mimeType,
                                                const ExtractionConfig& /*config*/) {
    ArchiveReader zip(data);
    auto parts = zip.readEntries([](const std::string& name) {
        return name == kDocumentPart || ooxml::isPropertiesPart(name);
    });
    if (!parts) {
        return parts.error();
    }
    auto docIt = parts.value().find(kDocumentPart);
    if (docIt == parts.value().end()) {
        return Error{ErrorCode::Parsing, "Invalid DOCX: missing word/document.xml"};
    }
    auto doc = XmlDocument::parse(docIt->second, kDocumentPart);
    if (!doc) {
        return doc.error();
    }

    ExtractionResult result;
    result.mimeType = mimeType;
    ooxml::applyCoreProperties(parts.value(), result.metadata);

    auto body = XmlDocument::firstChild(doc.value().root(), "body");
    if (!body) {
        return Error{ErrorCode::Parsing, "Invalid DOCX: document has no body"};
    }

    std::string content;
    nlohmann::json headings = nlohmann::json::array();
    size_t paragraphs = 0;
    for (XmlNode node = body.first_child(); node; node = node.next_sibling()) {
        if (node.type() != pugi::node_element) {
            continue;
        }
        auto name = XmlDocument::localName(node);
        if (name == "p") {
            auto text = paragraphText(node);
            if (text.empty()) {
                continue;
            }
            if (int level = headingLevel(node); level > 0) {
                headings.push_back({{"level", level}, {"text", text}});
            }
            if (!content.empty()) {
                content += "\n\n";
            }
            content += text;
            ++paragraphs;
        } else if (name == "tbl") {
            auto table = tableFrom(node);
            if (table.cells.empty()) {
                continue;
            }
            if (!content.empty()) {
                content += "\n\n";
            }
            for (size_t r = 0; r < table.cells.size(); ++r) {
                if (r > 0) {
                    content += '\n';
                }
                for (size_t c = 0; c < table.cells[r].size(); ++c) {
                    if (c > 0) {
                        content += '\t';
                    }
                    content += table.cells[r][c];
                }
            }
            result.tables.push_back(std::move(table));
        }
    }

    result.content = std::move(content);
    result.metadata.set("paragraph_count", paragraphs);
    if (!headings.empty()) {
        result.metadata.set("headings", std::move(headings));
    }
    spdlog::debug("DOCX: {} paragraphs, {} tables", paragraphs, result.tables.size());
    return result;
}

} // namespace quarry::extraction
