#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <quarry/core/mime.h>
#include <quarry/detection/format_classifier.h>

using namespace quarry;
using namespace quarry::detection;

namespace {

const std::string kPngHeader = std::string("\x89PNG\r\n\x1a\n", 8) +
                               std::string("\0\0\0\rIHDR\0\0\0\x10\0\0\0\x08\x08\x02\0\0\0", 21);

FormatClassifier& classifier() {
    static FormatClassifier instance(ClassifierConfig{.useLibMagic = false});
    return instance;
}

} // namespace

TEST_CASE("Byte signatures identify binary formats", "[detection]") {
    auto pdf = classifier().classify(test::as_bytes("%PDF-1.7\n%\xe2\xe3\xcf\xd3\n1 0 obj"));
    REQUIRE(pdf.has_value());
    CHECK(pdf.value().mimeType == mime::kPdf);
    CHECK(pdf.value().source == DetectionSource::Magic);

    auto png = classifier().classify(test::as_bytes(kPngHeader));
    REQUIRE(png.has_value());
    CHECK(png.value().mimeType == mime::kPng);
    CHECK(png.value().isBinary);
}

TEST_CASE("ZIP containers are disambiguated by their entries", "[detection]") {
    auto docx = test::make_zip({{"[Content_Types].xml", "<Types/>"},
                                {"word/document.xml", "<w:document/>"}});
    auto xlsx = test::make_zip({{"xl/workbook.xml", "<workbook/>"}});
    auto pptx = test::make_zip({{"ppt/presentation.xml", "<p:presentation/>"}});
    auto plain = test::make_zip({{"readme.txt", "hello"}});

    CHECK(classifier().classify(docx).value().mimeType == mime::kDocx);
    CHECK(classifier().classify(xlsx).value().mimeType == mime::kXlsx);
    CHECK(classifier().classify(pptx).value().mimeType == mime::kPptx);
    CHECK(classifier().classify(docx).value().source == DetectionSource::Container);
    CHECK(classifier().classify(plain).value().mimeType == mime::kZip);
}

TEST_CASE("Text is sniffed and refined by hints", "[detection]") {
    auto html = classifier().classify(test::as_bytes("<!DOCTYPE html><html><body>x</body></html>"));
    REQUIRE(html.has_value());
    CHECK(html.value().mimeType == mime::kHtml);
    CHECK_FALSE(html.value().isBinary);

    auto json = classifier().classify(test::as_bytes(R"({"a": [1, 2, 3]})"));
    REQUIRE(json.has_value());
    CHECK(json.value().mimeType == mime::kJson);

    auto text = classifier().classify(test::as_bytes("just some words\n"));
    REQUIRE(text.has_value());
    CHECK(text.value().mimeType == mime::kPlainText);

    auto csv = classifier().classify(test::as_bytes("a,b\n1,2\n"), std::filesystem::path("t.csv"));
    REQUIRE(csv.has_value());
    CHECK(csv.value().mimeType == mime::kCsv);
    CHECK(csv.value().source == DetectionSource::Extension);

    auto md = classifier().classify(test::as_bytes("# Title\n\nBody\n"), std::nullopt,
                                    std::string("text/markdown; charset=utf-8"));
    REQUIRE(md.has_value());
    CHECK(md.value().mimeType == mime::kMarkdown);
    CHECK(md.value().source == DetectionSource::Declared);
}

TEST_CASE("Content wins over a contradicting declared type", "[detection]") {
    auto result = classifier().classify(test::as_bytes("%PDF-1.4\n"), std::filesystem::path("x.docx"),
                                        std::string("text/plain"));
    REQUIRE(result.has_value());
    CHECK(result.value().mimeType == mime::kPdf);
    REQUIRE(result.value().overriddenHint.has_value());

    auto text = classifier().classify(test::as_bytes("plain words"), std::nullopt,
                                      std::string("application/pdf"));
    REQUIRE(text.has_value());
    CHECK(text.value().mimeType == mime::kPlainText);
    REQUIRE(text.value().overriddenHint.has_value());
    CHECK(*text.value().overriddenHint == "application/pdf");
}

TEST_CASE("Unrecognizable input is UnsupportedFormat", "[detection]") {
    const std::string binary("\x01\x02\x03\x04\x00\x00\xfe\xfd\x00\x11", 10);
    auto unknown = classifier().classify(test::as_bytes(binary));
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::UnsupportedFormat);

    auto empty = classifier().classify({});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == ErrorCode::UnsupportedFormat);

    auto hinted = classifier().classify({}, std::filesystem::path("notes.md"));
    REQUIRE(hinted.has_value());
    CHECK(hinted.value().mimeType == mime::kMarkdown);
}

TEST_CASE("classifyFile reads from disk", "[detection]") {
    test::TempDir dir("quarry_detect_");
    const auto docx = test::make_zip({{"word/document.xml", "<w:document/>"}});
    const auto path = dir / "report.bin";
    test::write_file(path, std::string_view(reinterpret_cast<const char*>(docx.data()), docx.size()));

    auto result = classifier().classifyFile(path);
    REQUIRE(result.has_value());
    CHECK(result.value().mimeType == mime::kDocx);

    auto missing = classifier().classifyFile(dir / "absent.pdf");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::Io);
}

TEST_CASE("Extension table", "[detection]") {
    CHECK(FormatClassifier::mimeFromExtension(".PDF") == mime::kPdf);
    CHECK(FormatClassifier::mimeFromExtension("xlsx") == mime::kXlsx);
    CHECK(FormatClassifier::mimeFromExtension(".nope") == mime::kOctetStream);
    CHECK(FormatClassifier::mimeFromExtension(".tar") == mime::kTar);
    CHECK(FormatClassifier::mimeFromExtension(".tgz") == mime::kGzip);
}

TEST_CASE("Tar and gzip archives are recognized by signature", "[detection]") {
    auto tar = test::make_archive(test::ArchiveKind::Tar, {{"a.txt", "alpha"}});
    auto tarResult = classifier().classify(tar);
    REQUIRE(tarResult.has_value());
    CHECK(tarResult.value().mimeType == mime::kTar);
    CHECK(tarResult.value().source == DetectionSource::Magic);

    auto tgz = test::make_archive(test::ArchiveKind::TarGz, {{"a.txt", "alpha"}});
    CHECK(classifier().classify(tgz).value().mimeType == mime::kGzip);
}

TEST_CASE("Sniff results are cached", "[detection]") {
    FormatClassifier local(ClassifierConfig{.useLibMagic = false});
    auto bytes = test::as_bytes("%PDF-1.5\n");
    REQUIRE(local.classify(bytes).has_value());
    REQUIRE(local.classify(bytes).has_value());
    auto stats = local.cacheStats();
    CHECK(stats.hits >= 1);
    local.clearCache();
    CHECK(local.cacheStats().entries == 0);
}
