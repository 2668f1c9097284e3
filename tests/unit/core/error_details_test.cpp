#include <catch2/catch_test_macros.hpp>

#include <quarry/core/base64.h>
#include <quarry/core/error_details.h>
#include <quarry/core/mime.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace quarry;

TEST_CASE("Error codes are stable", "[core][errors]") {
    CHECK(static_cast<int>(ErrorCode::Success) == 0);
    CHECK(static_cast<int>(ErrorCode::Unknown) == 1);
    CHECK(static_cast<int>(ErrorCode::Panic) == 2);
    CHECK(static_cast<int>(ErrorCode::InvalidArgument) == 3);
    CHECK(static_cast<int>(ErrorCode::Io) == 4);
    CHECK(static_cast<int>(ErrorCode::Parsing) == 5);
    CHECK(static_cast<int>(ErrorCode::Ocr) == 6);
    CHECK(static_cast<int>(ErrorCode::MissingDependency) == 7);
    CHECK(static_cast<int>(ErrorCode::Validation) == 8);
    CHECK(static_cast<int>(ErrorCode::UnsupportedFormat) == 9);
    CHECK(static_cast<int>(ErrorCode::Cache) == 10);
    CHECK(static_cast<int>(ErrorCode::ImageProcessing) == 11);
    CHECK(static_cast<int>(ErrorCode::Plugin) == 12);
    CHECK(kErrorCodeCount == 13);

    static_assert(std::string_view(errorCodeName(ErrorCode::MissingDependency)) ==
                  "missing_dependency");
}

TEST_CASE("Kind names round-trip to codes", "[core][errors]") {
    for (int32_t i = 0; i < kErrorCodeCount; ++i) {
        const auto code = static_cast<ErrorCode>(i);
        auto parsed = errorCodeFromName(errorCodeName(code));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == code);
    }
    CHECK_FALSE(errorCodeFromName("no_such_kind").has_value());
}

TEST_CASE("Free-text messages are classified", "[core][errors]") {
    CHECK(classifyMessage("open failed: No such file or directory") == ErrorCode::Io);
    CHECK(classifyMessage("Permission denied") == ErrorCode::Io);
    CHECK(classifyMessage("tesseract returned nothing") == ErrorCode::Ocr);
    CHECK(classifyMessage("Unsupported format: foo") == ErrorCode::UnsupportedFormat);
    CHECK(classifyMessage("malformed header at byte 12") == ErrorCode::Parsing);
    CHECK(classifyMessage("libfoo is not installed") == ErrorCode::MissingDependency);
    CHECK(classifyMessage("plugin crashed") == ErrorCode::Plugin);
    CHECK(classifyMessage("something odd happened") == ErrorCode::Unknown);
    CHECK(classifyMessage("") == ErrorCode::Unknown);
}

TEST_CASE("normalizeError fills in kind and message", "[core][errors]") {
    auto e = normalizeError(Error{ErrorCode::Unknown, "cache write failed"});
    CHECK(e.code == ErrorCode::Cache);

    auto blank = normalizeError(Error{ErrorCode::Validation, ""});
    CHECK(blank.message == errorToString(ErrorCode::Validation));
}

TEST_CASE("ErrorDetails serializes to JSON and back", "[core][errors]") {
    ErrorDetails details = ErrorDetails::fromError(pluginError("upper", "Plugin 'upper' failed"));
    CHECK(details.code == ErrorCode::Plugin);
    REQUIRE(details.pluginName.has_value());
    CHECK(*details.pluginName == "upper");

    details.context = ErrorContext::here("unit test");
    auto j = details.toJson();
    CHECK(j["kind"] == "plugin");
    CHECK(j["code"] == 12);
    CHECK(j["plugin_name"] == "upper");
    CHECK(j["dependency"].is_null());
    CHECK(j["context"]["info"] == "unit test");
    CHECK(j["context"]["line"].get<uint32_t>() > 0);

    auto back = ErrorDetails::fromJson(j);
    REQUIRE(back.has_value());
    CHECK(back.value().code == ErrorCode::Plugin);
    CHECK(back.value().message == details.message);
    CHECK(back.value().toError().subject == "upper");
}

TEST_CASE("ErrorDetails rejects unknown kinds", "[core][errors]") {
    auto parsed = ErrorDetails::fromJson(nlohmann::json{{"kind", "weird"}, {"message", "x"}});
    REQUIRE_FALSE(parsed.has_value());
}

TEST_CASE("MissingDependency carries the dependency name", "[core][errors]") {
    auto details = ErrorDetails::fromError(missingDependency("tesseract", "not available"));
    REQUIRE(details.dependency.has_value());
    CHECK(*details.dependency == "tesseract");
    CHECK(details.toJson()["kind"] == "missing_dependency");
}

TEST_CASE("guardBoundary converts exceptions into Panic", "[core][errors]") {
    clearFaultContext();

    auto ok = guardBoundary("test", []() -> Result<int> { return 7; });
    REQUIRE(ok.has_value());
    CHECK(ok.value() == 7);

    auto passthrough =
        guardBoundary("test", []() -> Result<int> { return Error{ErrorCode::Io, "gone"}; });
    REQUIRE_FALSE(passthrough.has_value());
    CHECK(passthrough.error().code == ErrorCode::Io);
    CHECK_FALSE(lastFaultContext().has_value());

    auto panicked = guardBoundary("unit boundary", []() -> Result<int> {
        try {
            throw std::runtime_error("inner");
        } catch (...) {
            std::throw_with_nested(std::logic_error("outer"));
        }
    });
    REQUIRE_FALSE(panicked.has_value());
    CHECK(panicked.error().code == ErrorCode::Panic);
    CHECK(panicked.error().message.find("unit boundary") != std::string::npos);

    auto fault = lastFaultContext();
    REQUIRE(fault.has_value());
    CHECK(fault->boundary == "unit boundary");
    CHECK(fault->message == "outer");
    CHECK(fault->trace.find("inner") != std::string::npos);
    CHECK(fault->toJson().contains("thread_id"));
}

TEST_CASE("MIME helpers normalize and classify", "[core][mime]") {
    CHECK(mime::normalize("Text/HTML; charset=utf-8") == "text/html");
    CHECK(mime::isImage("image/png"));
    CHECK_FALSE(mime::isImage("application/pdf"));
    CHECK(mime::isGeneric("application/zip"));
    CHECK(mime::isGeneric("text/plain"));
    CHECK_FALSE(mime::isGeneric(mime::kDocx));
}

TEST_CASE("Base64 encodes binary payloads", "[core][base64]") {
    const std::vector<uint8_t> data{'q', 'u', 'a', 'r', 'r', 'y', 0x00, 0xff};
    const auto encoded = base64Encode(data);
    CHECK(encoded == "cXVhcnJ5AP8=");

    auto decoded = base64Decode(encoded);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == data);

    CHECK_FALSE(base64Decode("not*base64").has_value());
}
