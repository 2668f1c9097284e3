#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace quarry {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error taxonomy. Numeric values are stable and exposed across the C boundary.
enum class ErrorCode : int32_t {
    Success = 0,
    Unknown = 1,
    Panic = 2,
    InvalidArgument = 3,
    Io = 4,
    Parsing = 5,
    Ocr = 6,
    MissingDependency = 7,
    Validation = 8,
    UnsupportedFormat = 9,
    Cache = 10,
    ImageProcessing = 11,
    Plugin = 12,
};

inline constexpr int32_t kErrorCodeCount = 13;

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::Unknown:
            return "Unknown error";
        case ErrorCode::Panic:
            return "Unrecoverable fault";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::Io:
            return "I/O error";
        case ErrorCode::Parsing:
            return "Parsing error";
        case ErrorCode::Ocr:
            return "OCR error";
        case ErrorCode::MissingDependency:
            return "Missing dependency";
        case ErrorCode::Validation:
            return "Validation error";
        case ErrorCode::UnsupportedFormat:
            return "Unsupported format";
        case ErrorCode::Cache:
            return "Cache error";
        case ErrorCode::ImageProcessing:
            return "Image processing error";
        case ErrorCode::Plugin:
            return "Plugin error";
    }
    return "Unknown error";
}

// Machine-friendly name, used in serialized error payloads
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "success";
        case ErrorCode::Unknown:
            return "unknown";
        case ErrorCode::Panic:
            return "panic";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::Io:
            return "io";
        case ErrorCode::Parsing:
            return "parsing";
        case ErrorCode::Ocr:
            return "ocr";
        case ErrorCode::MissingDependency:
            return "missing_dependency";
        case ErrorCode::Validation:
            return "validation";
        case ErrorCode::UnsupportedFormat:
            return "unsupported_format";
        case ErrorCode::Cache:
            return "cache";
        case ErrorCode::ImageProcessing:
            return "image_processing";
        case ErrorCode::Plugin:
            return "plugin";
    }
    return "unknown";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    // Offending plugin for Plugin errors, missing component for MissingDependency
    std::string subject;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string subj)
        : code(c), message(std::move(msg)), subject(std::move(subj)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

inline Error pluginError(std::string pluginName, std::string message) {
    return Error{ErrorCode::Plugin, std::move(message), std::move(pluginName)};
}

inline Error missingDependency(std::string dependency, std::string message) {
    return Error{ErrorCode::MissingDependency, std::move(message), std::move(dependency)};
}

// Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace quarry

// Format support for ErrorCode
#include <format>
template <> struct std::formatter<quarry::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(quarry::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", quarry::errorToString(error));
    }
};

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<quarry::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(quarry::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", quarry::errorToString(error));
    }
};
#endif

namespace quarry {

inline constexpr size_t HASH_SIZE = 32;        // SHA-256
inline constexpr size_t HASH_STRING_SIZE = 64; // Hex encoded
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;
inline constexpr size_t SNIFF_PREFIX_SIZE = 8 * 1024;

} // namespace quarry
