#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <quarry/core/mime.h>
#include <quarry/extraction/extractor_registry.h>
#include <quarry/extraction/html_extractor.h>
#include <quarry/extraction/image_extractor.h>
#include <quarry/extraction/pdf_extractor.h>
#include <quarry/extraction/plain_text_extractor.h>
#include <quarry/extraction/text_utils.h>
#include <quarry/plugins/plugin_registry.h>

#include <cstdio>

using namespace quarry;
using namespace quarry::extraction;

namespace {

// Single-page PDF with one text run; offsets in the xref table are computed
std::string make_pdf(const std::string& text) {
    const std::string stream = "BT /F1 12 Tf 72 720 Td (" + text + ") Tj ET";
    std::vector<std::string> objects{
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
        "/Resources << /Font << /F1 5 0 R >> >> >>",
        "<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream +
            "\nendstream",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
        "<< /Title (Quarterly Report) /Author (Dana Smith) >>"};

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    const size_t xref = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
    for (auto offset : offsets) {
        char line[32];
        std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offset);
        pdf += line;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
           " /Root 1 0 R /Info 6 0 R >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return pdf;
}

} // namespace

TEST_CASE("Plain text keeps content and reports encoding", "[extraction][text]") {
    PlainTextExtractor extractor;
    const std::string content = "Hello, World!\nThis is a test file.\nWith multiple lines.";
    auto result = extractor.extract(test::as_bytes(content), std::string(mime::kPlainText), {});
    REQUIRE(result.has_value());
    CHECK(result.value().content == content);
    CHECK(result.value().metadata.additional["line_count"] == 3);
    CHECK(result.value().metadata.additional["encoding"] == "UTF-8");
}

TEST_CASE("Plain text decodes UTF-16 with a byte order mark", "[extraction][text]") {
    const std::string utf16("\xff\xfeH\0i\0", 6);
    PlainTextExtractor extractor;
    auto result = extractor.extract(test::as_bytes(utf16), std::string(mime::kPlainText), {});
    REQUIRE(result.has_value());
    CHECK(result.value().content == "Hi");
}

TEST_CASE("Markdown title comes from the first heading", "[extraction][text]") {
    PlainTextExtractor extractor;
    auto result = extractor.extract(test::as_bytes("intro\n# Release   Notes\n\nbody"),
                                    std::string(mime::kMarkdown), {});
    REQUIRE(result.has_value());
    REQUIRE(result.value().metadata.title.has_value());
    CHECK(*result.value().metadata.title == "Release Notes");
}

TEST_CASE("CSV parsing handles quotes and embedded separators", "[extraction][text]") {
    auto rows = PlainTextExtractor::parseDelimited("name,quote\n\"Smith, J\",\"said \"\"hi\"\"\"\n"
                                                   "x,\"multi\nline\"\n",
                                                   ',');
    REQUIRE(rows.size() == 3);
    CHECK(rows[1][0] == "Smith, J");
    CHECK(rows[1][1] == "said \"hi\"");
    CHECK(rows[2][1] == "multi\nline");

    PlainTextExtractor extractor;
    auto result = extractor.extract(test::as_bytes("a,b\n1,2\n"), std::string(mime::kCsv), {});
    REQUIRE(result.has_value());
    REQUIRE(result.value().tables.size() == 1);
    CHECK(result.value().tables[0].cells == std::vector<std::vector<std::string>>{{"a", "b"},
                                                                                  {"1", "2"}});
    CHECK(result.value().tables[0].markdown.find("| a | b |") != std::string::npos);
}

TEST_CASE("HTML becomes readable text with tables and metadata", "[extraction][html]") {
    const std::string html = R"(<!DOCTYPE html>
<html><head><title>Fish &amp; Chips</title>
<meta name="description" content="A menu">
<meta name="author" content="Pat">
<style>body { color: red; }</style>
<script>var x = "<p>hidden</p>";</script></head>
<body><h1>Menu</h1><p>Cod&nbsp;&mdash; fresh</p><!-- comment -->
<table><tr><th>Item</th><th>Price</th></tr><tr><td>Cod</td><td>9</td></tr></table>
</body></html>)";

    HtmlExtractor extractor;
    auto result = extractor.extract(test::as_bytes(html), std::string(mime::kHtml), {});
    REQUIRE(result.has_value());
    const auto& r = result.value();
    CHECK(r.content.find("Menu") != std::string::npos);
    CHECK(r.content.find("Cod") != std::string::npos);
    CHECK(r.content.find("hidden") == std::string::npos);
    CHECK(r.content.find("color") == std::string::npos);
    CHECK(r.content.find("comment") == std::string::npos);
    REQUIRE(r.metadata.title.has_value());
    CHECK(*r.metadata.title == "Fish & Chips");
    CHECK(r.metadata.subject == std::optional<std::string>("A menu"));
    REQUIRE(r.tables.size() == 1);
    CHECK(r.tables[0].cells[1][0] == "Cod");
}

TEST_CASE("HTML entity decoding", "[extraction][html]") {
    CHECK(HtmlExtractor::decodeHtmlEntities("&lt;b&gt; &#65;&#x42; &quot;q&quot;") ==
          "<b> AB \"q\"");
    CHECK(HtmlExtractor::decodeHtmlEntities("&unknown;") == "&unknown;");
}

TEST_CASE("Image probe reads dimensions without decoding", "[extraction][image]") {
    const std::string png = std::string("\x89PNG\r\n\x1a\n", 8) +
                            std::string("\0\0\0\rIHDR\0\0\x01\x00\0\0\0\x80\x08\x02\0\0\0", 21);
    auto info = ImageExtractor::probe(test::as_bytes(png));
    REQUIRE(info.has_value());
    CHECK(info->format == "png");
    CHECK(info->width == 256);
    CHECK(info->height == 128);

    CHECK_FALSE(ImageExtractor::probe(test::as_bytes("not an image")).has_value());

    ImageExtractor extractor;
    ExtractionConfig cfg;
    cfg.images = ImageExtractionConfig{};
    auto result = extractor.extract(test::as_bytes(png), std::string(mime::kPng), cfg);
    REQUIRE(result.has_value());
    CHECK(result.value().content.empty());
    REQUIRE(result.value().pages.has_value());
    CHECK(result.value().pages->front().hasVisualContent);
    REQUIRE(result.value().images.has_value());
    CHECK(result.value().images->front().width == std::optional<uint32_t>(256));

    auto bad = extractor.extract(test::as_bytes("garbage"), std::string(mime::kPng), {});
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == ErrorCode::ImageProcessing);
}

TEST_CASE("PDF text, metadata and pages", "[extraction][pdf]") {
    const auto pdf = make_pdf("Hello from page one");
    PdfExtractor extractor;
    ExtractionConfig cfg;
    cfg.pages = PageConfig{.extractPages = true};
    auto result = extractor.extract(test::as_bytes(pdf), std::string(mime::kPdf), cfg);
    REQUIRE(result.has_value());
    const auto& r = result.value();
    CHECK(r.content.find("Hello from page one") != std::string::npos);
    CHECK(r.metadata.title == std::optional<std::string>("Quarterly Report"));
    REQUIRE(r.pages.has_value());
    REQUIRE(r.pages->size() == 1);
    CHECK(r.pages->front().pageNumber == 1);
    CHECK_FALSE(r.pages->front().hasVisualContent);

    auto broken = extractor.extract(test::as_bytes("%PDF-1.4\nnothing here"),
                                    std::string(mime::kPdf), {});
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error().code == ErrorCode::Parsing);
}

TEST_CASE("PDF dates are normalized", "[extraction][pdf]") {
    CHECK(PdfExtractor::normalizePdfDate("D:20240131235959+01'00'") == "2024-01-31T23:59:59+01:00");
}

TEST_CASE("Page markers are inserted between pages", "[extraction]") {
    std::vector<PageContent> pages(2);
    pages[0].pageNumber = 1;
    pages[0].content = "first";
    pages[1].pageNumber = 2;
    pages[1].content = "second";

    ExtractionConfig plain;
    CHECK(joinPageContent(pages, plain) == "first\n\nsecond");

    ExtractionConfig marked;
    marked.pages = PageConfig{.insertPageMarkers = true, .markerFormat = "[{page_num}]"};
    const auto joined = joinPageContent(pages, marked);
    CHECK(joined.find("[1]") != std::string::npos);
    CHECK(joined.find("[2]") != std::string::npos);
    CHECK(joined.find("second") > joined.find("[2]"));
}

TEST_CASE("Text utilities", "[extraction]") {
    CHECK(normalizeWhitespace("  a \t b  \n\n\n\n c ") == "a b\n\nc");
    CHECK(formatPageMarker("-- {page_num} of {page_num} --", 3) == "-- 3 of 3 --");
    CHECK(renderMarkdownTable({{"h1", "h2"}, {"a|b", "c"}}).find("| h1 | h2 |") !=
          std::string::npos);
}

TEST_CASE("Registry resolves every supported media type", "[extraction][registry]") {
    plugins::PluginRegistry plugins;
    ExtractorRegistry registry(plugins);

    for (const auto& type : registry.supportedMimeTypes()) {
        auto resolved = registry.resolve(type);
        INFO(type);
        CHECK(resolved.has_value());
    }

    auto unknown = registry.resolve("application/x-unknown-thing");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::UnsupportedFormat);
}
