#pragma once

#include <quarry/core/types.h>

#include <nlohmann/json.hpp>

#include <exception>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace quarry {

/**
 * @brief Where an error was raised or captured.
 */
struct ErrorContext {
    std::string sourceFile;
    std::string sourceFunction;
    uint32_t line = 0;
    std::string info;

    static ErrorContext here(std::string info = {},
                             std::source_location loc = std::source_location::current());
};

/**
 * @brief Structured, serializable error value handed across call boundaries.
 *
 * Every kind maps to a stable numeric code (ErrorCode) so callers can branch on
 * it without matching message text.
 */
struct ErrorDetails {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::optional<std::string> pluginName;
    std::optional<std::string> dependency;
    std::optional<ErrorContext> context;
    std::optional<std::string> faultTrace;

    [[nodiscard]] std::string kindName() const { return errorCodeName(code); }
    [[nodiscard]] int32_t numericCode() const { return static_cast<int32_t>(code); }

    [[nodiscard]] static ErrorDetails fromError(const Error& error);
    [[nodiscard]] Error toError() const;

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static Result<ErrorDetails> fromJson(const nlohmann::json& j);
};

/**
 * @brief Best-effort classification of free-text failure messages.
 *
 * Used for failures that arrive without a structured kind (third-party library
 * messages, exceptions). Returns ErrorCode::Unknown when nothing matches.
 */
ErrorCode classifyMessage(std::string_view message);

/**
 * @brief Fill in a kind for errors raised without one.
 */
Error normalizeError(Error error);

/**
 * @brief Parse a kind name ("io", "parsing", ...) back to its code.
 */
std::optional<ErrorCode> errorCodeFromName(std::string_view name);

/**
 * @brief Snapshot of the most recent unrecoverable fault caught at a boundary.
 */
struct FaultContext {
    std::string message;
    std::string exceptionType;
    std::string boundary;
    std::string trace;
    std::string threadId;
    TimePoint capturedAt;

    [[nodiscard]] nlohmann::json toJson() const;
};

// Process-wide record of the last captured fault
void recordFault(FaultContext fault);
std::optional<FaultContext> lastFaultContext();
void clearFaultContext();

// Describe an in-flight exception, walking nested exceptions into a trace.
FaultContext describeException(std::exception_ptr ep, std::string_view boundary);

/**
 * @brief Run @p fn and convert anything it throws into a Panic error.
 *
 * The caught fault is recorded as the last fault context. Errors returned
 * normally by @p fn pass through unchanged.
 */
template <typename F>
auto guardBoundary(std::string_view boundary, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (...) {
        auto fault = describeException(std::current_exception(), boundary);
        std::string message = "Unrecoverable fault in " + std::string(boundary) + ": " + fault.message;
        recordFault(std::move(fault));
        return Error{ErrorCode::Panic, std::move(message)};
    }
}

} // namespace quarry
