#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <quarry/postprocess/keyword_extractor.h>
#include <quarry/postprocess/language_detector.h>
#include <quarry/postprocess/output_formatter.h>
#include <quarry/postprocess/quality.h>
#include <quarry/postprocess/text_analysis.h>
#include <quarry/postprocess/token_reducer.h>

#include <algorithm>
#include <string>

using namespace quarry;
using namespace quarry::postprocess;
using Catch::Matchers::WithinAbs;

namespace {

std::string repeat(const std::string& sentence, size_t times) {
    std::string out;
    for (size_t i = 0; i < times; ++i) {
        out += sentence;
    }
    return out;
}

const std::string kEnglish = repeat("The report was written by the team and it is ready for review. ", 8);
const std::string kGerman = repeat("Der Bericht ist fertig und wir haben ihn mit dem Team geprüft. ", 8);

} // namespace

TEST_CASE("Tokenizer keeps apostrophes and UTF-8 words", "[postprocess][text]") {
    auto tokens = tokenizeWords("Don't stop, größe-42!");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[0].lower == "don't");
    CHECK(tokens[1].lower == "stop");
    CHECK(tokens[2].offset == 12);
    CHECK(tokens[3].lower == "42");
    CHECK(toIso639_3("en") == "eng");
    CHECK(toIso639_3("DEU") == "deu");
    CHECK(stopwords("xx").contains("the"));
}

TEST_CASE("Quality prefers clean structured text", "[postprocess][quality]") {
    ExtractionResult good;
    good.content = "# Findings\n\n" + kEnglish + "\n\n" + kEnglish;
    ExtractionResult noisy;
    noisy.content = "\x01\x02\x03 zq#@!x \x04\x05 \xEF\xBF\xBD\xEF\xBF\xBD 9f8g7h6j5k";

    const auto goodScore = scoreQuality(good);
    const auto noisyScore = scoreQuality(noisy);
    CHECK(goodScore.score > noisyScore.score);
    CHECK(goodScore.score <= 1.0);
    CHECK(goodScore.length == 1.0);

    ExtractionResult empty;
    empty.content = " \n\t";
    CHECK(scoreQuality(empty).score == 0.0);
}

TEST_CASE("Failed OCR lowers the quality score", "[postprocess][quality]") {
    ExtractionResult result;
    result.content = kEnglish;
    const auto baseline = scoreQuality(result).score;

    result.metadata.set("ocr_status", "failed");
    const auto penalized = scoreQuality(result);
    CHECK(penalized.ocrFactor == kOcrFailurePenalty);
    CHECK_THAT(penalized.score, WithinAbs(baseline * kOcrFailurePenalty, 1e-9));

    applyQualityScore(result);
    REQUIRE(result.qualityScore.has_value());
    CHECK(result.metadata.additional["quality_breakdown"].contains("ocr_factor"));
}

TEST_CASE("Language detection", "[postprocess][language]") {
    LanguageDetectionConfig config;

    CHECK(LanguageDetector::detect(kEnglish, config) == std::vector<std::string>{"eng"});
    CHECK(LanguageDetector::detect(kGerman, config) == std::vector<std::string>{"deu"});

    SECTION("too little evidence is undetermined") {
        CHECK(LanguageDetector::detect("Hello world", config).empty());
        CHECK(LanguageDetector::score("Hello world").empty());
    }

    SECTION("mixed documents report both languages") {
        config.detectMultiple = true;
        auto languages = LanguageDetector::detect(kEnglish + "\n\n" + kGerman, config);
        REQUIRE(languages.size() == 2);
        CHECK(std::find(languages.begin(), languages.end(), "eng") != languages.end());
        CHECK(std::find(languages.begin(), languages.end(), "deu") != languages.end());
    }

    SECTION("the stage fills metadata.language only when empty") {
        ExtractionResult result;
        result.content = kGerman;
        LanguageDetector::apply(result, config);
        CHECK(result.metadata.language == std::optional<std::string>("deu"));

        ExtractionResult declared;
        declared.content = kGerman;
        declared.metadata.language = "de-AT";
        LanguageDetector::apply(declared, config);
        CHECK(declared.metadata.language == std::optional<std::string>("de-AT"));
        REQUIRE(declared.detectedLanguages.has_value());
        CHECK(*declared.detectedLanguages == std::vector<std::string>{"deu"});
    }
}

TEST_CASE("Frequency keywords favour repeated phrases", "[postprocess][keywords]") {
    const std::string text =
        "Machine learning improves search. Machine learning models need data. "
        "Search engines use machine learning.";
    KeywordConfig config;
    config.maxKeywords = 5;

    auto keywords = KeywordExtractor::extract(text, config);
    REQUIRE_FALSE(keywords.empty());
    CHECK(keywords.size() <= 5);
    CHECK(keywords.front().text == "machine learning");
    CHECK(keywords.front().score == 1.0);
    CHECK(keywords.front().positions.size() == 3);
    CHECK(keywords.front().algorithm == "frequency");
    for (size_t i = 1; i < keywords.size(); ++i) {
        CHECK(keywords[i].score <= keywords[i - 1].score);
    }
    for (const auto& k : keywords) {
        CHECK_FALSE(stopwords("eng").contains(k.text));
    }

    config.minScore = 1.0;
    CHECK(KeywordExtractor::extract(text, config).size() == 1);

    config.maxKeywords = 0;
    CHECK(KeywordExtractor::extract(text, config).empty());
}

TEST_CASE("Co-occurrence keywords", "[postprocess][keywords]") {
    KeywordConfig config;
    config.algorithm = KeywordAlgorithm::Cooccurrence;
    auto keywords = KeywordExtractor::extract(
        "Compatibility of systems of linear constraints over the set of natural numbers.", config);
    REQUIRE_FALSE(keywords.empty());
    CHECK(keywords.front().algorithm == "cooccurrence");
    CHECK(keywords.front().score == 1.0);
    CHECK(keywords.front().text.find(' ') != std::string::npos);
}

TEST_CASE("Token reduction modes", "[postprocess][tokens]") {
    TokenReductionConfig config;

    SECTION("off leaves text alone") {
        CHECK(TokenReducer::reduce("  a   b  ", config) == "  a   b  ");
    }

    SECTION("light strips invisible characters and blank runs") {
        config.mode = ReductionMode::Light;
        CHECK(TokenReducer::reduce("  Hello\xE2\x80\x8B   world \n\n\n\n next  ", config) ==
              "Hello world\n\nnext");
    }

    SECTION("moderate keeps capitalized stopwords") {
        config.mode = ReductionMode::Moderate;
        CHECK(TokenReducer::reduce("The cat sat on the mat", config) == "The cat sat mat");
        config.preserveImportantWords = false;
        CHECK(TokenReducer::reduce("The cat sat on the mat", config) == "cat sat mat");
    }

    SECTION("aggressive drops repeats and punctuation runs") {
        config.mode = ReductionMode::Aggressive;
        auto reduced = TokenReducer::reduce("the the data data data!!!!", config);
        CHECK(reduced.find("data") == reduced.rfind("data"));
        CHECK(reduced.find("!!") == std::string::npos);
    }
}

TEST_CASE("Token reduction is idempotent", "[postprocess][tokens]") {
    const std::string text = "  The quick\tbrown fox -- jumps over the lazy dog!!! \n\n\n"
                             "It was the best of times, it was the worst of times... 2024 \xE2\x80\x8B";
    for (auto mode : {ReductionMode::Light, ReductionMode::Moderate, ReductionMode::Aggressive}) {
        TokenReductionConfig config;
        config.mode = mode;
        INFO(toString(mode));
        const auto once = TokenReducer::reduce(text, config);
        CHECK(TokenReducer::reduce(once, config) == once);
        CHECK(once.size() <= text.size());
    }
}

TEST_CASE("Token reduction stage records its ratio", "[postprocess][tokens]") {
    ExtractionResult result;
    result.content = "This is a sentence with some of the words that are stopwords.";
    TokenReductionConfig config;
    config.mode = ReductionMode::Moderate;
    config.preserveImportantWords = false;
    TokenReducer::apply(result, config);

    const auto& info = result.metadata.additional["token_reduction"];
    CHECK(info["mode"] == "moderate");
    CHECK(info["reduced_length"].get<size_t>() == result.content.size());
    CHECK(info["reduction_ratio"].get<double>() > 0.0);
}

TEST_CASE("Output formats", "[postprocess][output]") {
    ExtractionResult result;
    result.content = "Body <b> & more";
    result.metadata.title = "Report";

    SECTION("markdown adds the title heading") {
        applyOutputFormat(result, OutputFormat::Markdown);
        CHECK(result.content == "# Report\n\nBody <b> & more");
        CHECK(result.metadata.additional["output_format"] == "markdown");
    }

    SECTION("markdown input is left as is") {
        result.mimeType = "text/markdown";
        applyOutputFormat(result, OutputFormat::Markdown);
        CHECK(result.content == "Body <b> & more");
    }

    SECTION("html escapes content") {
        applyOutputFormat(result, OutputFormat::Html);
        CHECK(result.content.find("<title>Report</title>") != std::string::npos);
        CHECK(result.content.find("<pre>Body &lt;b&gt; &amp; more</pre>") != std::string::npos);
    }

    SECTION("plain records the format only") {
        applyOutputFormat(result, OutputFormat::Plain);
        CHECK(result.content == "Body <b> & more");
        CHECK(result.metadata.additional["output_format"] == "plain");
    }

    CHECK(escapeHtml("'\"") == "&#39;&quot;");
}
