#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <quarry/core/mime.h>
#include <quarry/detection/format_classifier.h>
#include <quarry/extraction/docx_extractor.h>
#include <quarry/extraction/extractor_registry.h>
#include <quarry/extraction/pptx_extractor.h>
#include <quarry/extraction/xlsx_extractor.h>
#include <quarry/plugins/plugin_registry.h>

using namespace quarry;
using namespace quarry::extraction;

namespace {

constexpr const char* kWordNs =
    R"(xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main")";
constexpr const char* kSheetNs = R"(xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
                                 R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships")";
constexpr const char* kDrawingNs =
    R"(xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" )"
    R"(xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main")";

std::string core_properties(const std::string& title, const std::string& creator) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8"?>)") +
           R"(<cp:coreProperties xmlns:cp="http://schemas.openxmlformats.org/package/2006/metadata/core-properties" )"
           R"(xmlns:dc="http://purl.org/dc/elements/1.1/">)" +
           "<dc:title>" + title + "</dc:title><dc:creator>" + creator +
           "</dc:creator><cp:keywords>alpha, beta</cp:keywords></cp:coreProperties>";
}

std::vector<std::byte> make_docx() {
    const std::string document = std::string("<w:document ") + kWordNs + "><w:body>" +
                                 R"(<w:p><w:pPr><w:pStyle w:val="Heading1"/></w:pPr>)"
                                 "<w:r><w:t>Introduction</w:t></w:r></w:p>"
                                 "<w:p><w:r><w:t>First </w:t></w:r><w:r><w:t>paragraph.</w:t></w:r></w:p>"
                                 "<w:tbl><w:tr><w:tc><w:p><w:r><w:t>k</w:t></w:r></w:p></w:tc>"
                                 "<w:tc><w:p><w:r><w:t>v</w:t></w:r></w:p></w:tc></w:tr>"
                                 "<w:tr><w:tc><w:p><w:r><w:t>1</w:t></w:r></w:p></w:tc>"
                                 "<w:tc><w:p><w:r><w:t>2</w:t></w:r></w:p></w:tc></w:tr></w:tbl>"
                                 "<w:p><w:r><w:t>Closing words.</w:t></w:r></w:p>"
                                 "</w:body></w:document>";
    return test::make_zip({{"[Content_Types].xml", "<Types/>"},
                           {"word/document.xml", document},
                           {"docProps/core.xml", core_properties("Design Notes", "Alex Doe")}});
}

std::string slide(const std::string& text) {
    return std::string("<p:sld ") + kDrawingNs + "><p:cSld><p:spTree><p:sp><p:txBody>" +
           "<a:p><a:r><a:t>" + text + "</a:t></a:r></a:p>" +
           "</p:txBody></p:sp></p:spTree></p:cSld></p:sld>";
}

std::string worksheet(const std::string& dimension, const std::string& rows) {
    std::string xml = std::string("<worksheet ") + kSheetNs + ">";
    if (!dimension.empty()) {
        xml += R"(<dimension ref=")" + dimension + R"("/>)";
    }
    return xml + "<sheetData>" + rows + "</sheetData></worksheet>";
}

std::vector<std::byte> make_xlsx(const std::string& sheetXml) {
    const std::string workbook = std::string("<workbook ") + kSheetNs +
                                 R"(><sheets><sheet name="Data" sheetId="1" r:id="rId1"/></sheets></workbook>)";
    const std::string rels =
        R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
        R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" )"
        R"(Target="worksheets/sheet1.xml"/></Relationships>)";
    const std::string shared = std::string("<sst ") + kSheetNs +
                               R"( count="2" uniqueCount="2"><si><t>Name</t></si><si><r><t>Qu</t></r><r><t>antity</t></r></si></sst>)";
    return test::make_zip({{"[Content_Types].xml", "<Types/>"},
                           {"xl/workbook.xml", workbook},
                           {"xl/_rels/workbook.xml.rels", rels},
                           {"xl/sharedStrings.xml", shared},
                           {"xl/worksheets/sheet1.xml", sheetXml}});
}

} // namespace

TEST_CASE("DOCX paragraphs, headings, tables and properties", "[extraction][docx]") {
    DocxExtractor extractor;
    const auto bytes = make_docx();
    auto result = extractor.extract(bytes, std::string(mime::kDocx), {});
    REQUIRE(result.has_value());
    const auto& r = result.value();

    CHECK(r.content.starts_with("Introduction\n\nFirst paragraph."));
    CHECK(r.content.find("k\tv\n1\t2") != std::string::npos);
    CHECK(r.content.ends_with("Closing words."));
    REQUIRE(r.tables.size() == 1);
    CHECK(r.tables[0].cells[1][1] == "2");

    CHECK(r.metadata.title == std::optional<std::string>("Design Notes"));
    REQUIRE(r.metadata.authors.size() == 1);
    CHECK(r.metadata.authors[0] == "Alex Doe");
    CHECK(r.metadata.keywords == std::vector<std::string>{"alpha", "beta"});
    CHECK(r.metadata.additional["headings"][0]["level"] == 1);
    CHECK(r.metadata.additional["paragraph_count"] == 3);
}

TEST_CASE("DOCX without a document part is a parsing error", "[extraction][docx]") {
    DocxExtractor extractor;
    const auto bytes = test::make_zip({{"word/styles.xml", "<w:styles/>"}});
    auto result = extractor.extract(bytes, std::string(mime::kDocx), {});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::Parsing);

    auto notZip = extractor.extract(test::as_bytes("plainly not a zip"), std::string(mime::kDocx), {});
    REQUIRE_FALSE(notZip.has_value());
}

TEST_CASE("PPTX slides are ordered numerically and become pages", "[extraction][pptx]") {
    const auto bytes = test::make_zip({
        {"ppt/presentation.xml", "<p:presentation/>"},
        {"ppt/slides/slide10.xml", slide("Tenth")},
        {"ppt/slides/slide2.xml", slide("Second")},
        {"ppt/slides/slide1.xml", slide("First")},
        {"ppt/notesSlides/notesSlide2.xml", slide("Speaker note")},
    });

    PptxExtractor extractor;
    ExtractionConfig cfg;
    cfg.pages = PageConfig{.extractPages = true};
    auto result = extractor.extract(bytes, std::string(mime::kPptx), cfg);
    REQUIRE(result.has_value());
    const auto& r = result.value();

    CHECK(r.content == "First\n\nSecond\n\nTenth");
    REQUIRE(r.pages.has_value());
    REQUIRE(r.pages->size() == 3);
    CHECK(r.pages->at(2).content == "Tenth");
    CHECK(r.metadata.additional["slide_count"] == 3);
    CHECK(r.metadata.additional["slide_notes"]["2"] == "Speaker note");
}

TEST_CASE("XLSX cell references and dimensions", "[extraction][xlsx]") {
    auto b12 = XlsxExtractor::parseCellReference("B12");
    REQUIRE(b12.has_value());
    CHECK(b12->row == 12);
    CHECK(b12->col == 2);

    auto absolute = XlsxExtractor::parseCellReference("$AB$3");
    REQUIRE(absolute.has_value());
    CHECK(absolute->col == 28);

    CHECK_FALSE(XlsxExtractor::parseCellReference("XFE1").has_value());
    CHECK_FALSE(XlsxExtractor::parseCellReference("A0").has_value());
    CHECK_FALSE(XlsxExtractor::parseCellReference("A1048577").has_value());
    CHECK_FALSE(XlsxExtractor::parseCellReference("12").has_value());

    auto huge = XlsxExtractor::parseDimension("A1:XFD1048575");
    REQUIRE(huge.has_value());
    CHECK(huge->cellCount() == uint64_t{16384} * 1048575);
    CHECK(huge->cellCount() > kMaxDenseCells);

    CHECK(XlsxExtractor::columnName(1) == "A");
    CHECK(XlsxExtractor::columnName(28) == "AB");
    CHECK(XlsxExtractor::columnName(16384) == "XFD");
}

TEST_CASE("XLSX sheets become tables with shared strings", "[extraction][xlsx]") {
    const auto bytes = make_xlsx(worksheet(
        "A1:B3", R"(<row r="1"><c r="A1" t="s"><v>0</v></c><c r="B1" t="s"><v>1</v></c></row>)"
                 R"(<row r="2"><c r="A2" t="inlineStr"><is><t>bolts</t></is></c><c r="B2"><v>40</v></c></row>)"
                 R"(<row r="3"><c r="A3" t="inlineStr"><is><t>nuts</t></is></c><c r="B3" t="b"><v>1</v></c></row>)"));

    XlsxExtractor extractor;
    auto result = extractor.extract(bytes, std::string(mime::kXlsx), {});
    REQUIRE(result.has_value());
    const auto& r = result.value();

    REQUIRE(r.tables.size() == 1);
    const auto& cells = r.tables[0].cells;
    REQUIRE(cells.size() == 3);
    CHECK(cells[0] == std::vector<std::string>{"Name", "Quantity"});
    CHECK(cells[1] == std::vector<std::string>{"bolts", "40"});
    CHECK(cells[2][1] == "TRUE");
    CHECK(r.content.starts_with("## Data"));
    CHECK(r.content.find("| Name | Quantity |") != std::string::npos);
    CHECK(r.metadata.additional["sheet_names"][0] == "Data");
    CHECK_FALSE(r.metadata.has("sparse_sheets"));
}

TEST_CASE("XLSX with an enormous declared dimension stays bounded", "[extraction][xlsx]") {
    // 26 cells in one row under a dimension claiming ~17 billion cells
    std::string row = R"(<row r="1">)";
    for (uint32_t col = 1; col <= 26; ++col) {
        const auto ref = XlsxExtractor::columnName(col) + "1";
        row += R"(<c r=")" + ref + R"(" t="inlineStr"><is><t>v)" + std::to_string(col) +
               "</t></is></c>";
    }
    row += "</row>";
    const auto bytes = make_xlsx(worksheet("A1:XFD1048575", row));

    XlsxExtractor extractor;
    auto result = extractor.extract(bytes, std::string(mime::kXlsx), {});
    REQUIRE(result.has_value());
    const auto& r = result.value();

    REQUIRE(r.tables.size() == 1);
    REQUIRE(r.tables[0].cells.size() == 1);
    CHECK(r.tables[0].cells[0].size() == 26);
    CHECK(r.tables[0].cells[0][25] == "v26");
    CHECK(r.metadata.additional["sparse_sheets"] == 1);
}

TEST_CASE("XLSX without a declared dimension uses the populated extent", "[extraction][xlsx]") {
    const auto bytes = make_xlsx(worksheet(
        "", R"(<row r="5"><c r="C5" t="inlineStr"><is><t>x</t></is></c>)"
            R"(<c r="D5" t="inlineStr"><is><t>y</t></is></c></row>)"));

    XlsxExtractor extractor;
    auto result = extractor.extract(bytes, std::string(mime::kXlsx), {});
    REQUIRE(result.has_value());
    REQUIRE(result.value().tables.size() == 1);
    CHECK(result.value().tables[0].cells == std::vector<std::vector<std::string>>{{"x", "y"}});
    CHECK_FALSE(result.value().metadata.has("sparse_sheets"));
}

TEST_CASE("Classification and extractor resolution agree for OOXML", "[extraction][registry]") {
    plugins::PluginRegistry plugins;
    ExtractorRegistry registry(plugins);
    const auto docx = make_docx();

    auto classified = detection::FormatClassifier::instance().classify(docx);
    REQUIRE(classified.has_value());
    auto resolved = registry.resolve(classified.value().mimeType);
    REQUIRE(resolved.has_value());
    CHECK(resolved.value().name == "docx");
    CHECK_FALSE(resolved.value().fromPlugin);

    // Resolving the same type again returns the same extractor
    auto again = registry.resolve(classified.value().mimeType);
    REQUIRE(again.has_value());
    CHECK(again.value().extractor == resolved.value().extractor);
}
