#include <quarry/core/mime.h>
#include <quarry/extraction/ooxml.h>
#include <quarry/extraction/pptx_extractor.h>
#include <quarry/extraction/text_utils.h>
#include <quarry/extraction/xml_document.h>
#include <quarry/extraction/archive_reader.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace quarry::extraction {

namespace {

bool isSlidePart(const std::string& name) {
    return name.starts_with("ppt/slides/slide") && name.ends_with(".xml") &&
           name.find('/', 11) == std::string::npos;
}

bool isNotesPart(const std::string& name) {
    return name.starts_with("ppt/notesSlides/notesSlide") && name.ends_with(".xml");
}

std::string drawingParagraphs(XmlNode root) {
    std::string out;
    for (auto p : XmlDocument::descendants(root, "p")) {
        // Table paragraphs are emitted with their table
        bool inTable = false;
        for (XmlNode up = p.parent(); up; up = up.parent()) {
            if (up.type() == pugi::node_element && XmlDocument::localName(up) == "tbl") {
                inTable = true;
                break;
            }
        }
        if (inTable) {
            continue;
        }
        std::string line;
        for (auto t : XmlDocument::descendants(p, "t")) {
            line += XmlDocument::text(t);
        }
        if (line.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += line;
    }
    return out;
}

std::vector<Table> slideTables(XmlNode root, size_t slideNumber) {
    std::vector<Table> tables;
    for (auto tbl : XmlDocument::descendants(root, "tbl")) {
        Table table;
        for (auto tr : XmlDocument::children(tbl, "tr")) {
            std::vector<std::string> row;
            for (auto tc : XmlDocument::children(tr, "tc")) {
                std::string cell;
                for (auto t : XmlDocument::descendants(tc, "t")) {
                    if (!cell.empty()) {
                        cell += ' ';
                    }
                    cell += XmlDocument::text(t);
                }
                row.push_back(normalizeWhitespace(cell));
            }
            table.cells.push_back(std::move(row));
        }
        if (table.cells.empty()) {
            continue;
        }
        table.markdown = renderMarkdownTable(table.cells);
        table.pageNumber = slideNumber;
        tables.push_back(std::move(table));
    }
    return tables;
}

} // namespace

std::vector<std::string> PptxExtractor::supportedMimeTypes() const {
    return {std::string(mime::kPptx), std::string(mime::kPpsx)};
}

Result<ExtractionResult> PptxExtractor::extract(std::span<const std::byte> data,
                                                const std::string& mimeType,
                                                const ExtractionConfig& config) {
    ArchiveReader zip(data);
    auto parts = zip.readEntries([](const std::string& name) {
        return isSlidePart(name) || isNotesPart(name) || ooxml::isPropertiesPart(name);
    });
    if (!parts) {
        return parts.error();
    }

    std::vector<std::pair<size_t, std::string>> slides;
    for (const auto& [name, _] : parts.value()) {
        if (isSlidePart(name)) {
            slides.emplace_back(ooxml::partNumber(name), name);
        }
    }
    if (slides.empty()) {
        return Error{ErrorCode::Parsing, "Invalid PPTX: no slides found"};
    }
    std::sort(slides.begin(), slides.end());

    ExtractionResult result;
    result.mimeType = mimeType;
    ooxml::applyCoreProperties(parts.value(), result.metadata);

    std::vector<PageContent> pages;
    pages.reserve(slides.size());
    size_t pageNumber = 0;
    for (const auto& [number, partName] : slides) {
        ++pageNumber;
        PageContent page;
        page.pageNumber = pageNumber;

        auto doc = XmlDocument::parse(parts.value().at(partName), partName);
        if (!doc) {
            spdlog::warn("Skipping unreadable slide {}: {}", partName, doc.error().message);
            result.addWarning("extraction", "Slide " + std::to_string(pageNumber) +
                                                " could not be parsed: " + doc.error().message);
            pages.push_back(std::move(page));
            continue;
        }
        auto root = doc.value().root();
        page.content = drawingParagraphs(root);
        page.tables = slideTables(root, pageNumber);
        page.hasVisualContent = !XmlDocument::descendants(root, "pic").empty();

        const auto notesName = "ppt/notesSlides/notesSlide" + std::to_string(number) + ".xml";
        if (auto notesIt = parts.value().find(notesName); notesIt != parts.value().end()) {
            if (auto notes = XmlDocument::parse(notesIt->second, notesName); notes) {
                auto text = drawingParagraphs(notes.value().root());
                if (!text.empty()) {
                    result.metadata.additional["slide_notes"][std::to_string(pageNumber)] = text;
                }
            }
        }
        pages.push_back(std::move(page));
    }

    result.metadata.set("slide_count", pages.size());
    assemblePages(result, std::move(pages), config);
    return result;
}

} // namespace quarry::extraction
