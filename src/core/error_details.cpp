#include <quarry/core/error_details.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <sstream>
#include <thread>
#include <typeinfo>

namespace quarry {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

struct Rule {
    std::string_view needle;
    ErrorCode code;
};

// Order matters: more specific phrases come before generic ones.
constexpr std::array kClassificationRules{
    Rule{"permission denied", ErrorCode::Io},
    Rule{"no such file", ErrorCode::Io},
    Rule{"file not found", ErrorCode::Io},
    Rule{"i/o error", ErrorCode::Io},
    Rule{"io error", ErrorCode::Io},
    Rule{"broken pipe", ErrorCode::Io},
    Rule{"missing dependency", ErrorCode::MissingDependency},
    Rule{"not installed", ErrorCode::MissingDependency},
    Rule{"dependency", ErrorCode::MissingDependency},
    Rule{"tesseract", ErrorCode::Ocr},
    Rule{"ocr", ErrorCode::Ocr},
    Rule{"unsupported", ErrorCode::UnsupportedFormat},
    Rule{"unknown format", ErrorCode::UnsupportedFormat},
    Rule{"mime type", ErrorCode::UnsupportedFormat},
    Rule{"unexpected token", ErrorCode::Parsing},
    Rule{"malformed", ErrorCode::Parsing},
    Rule{"corrupt", ErrorCode::Parsing},
    Rule{"parse", ErrorCode::Parsing},
    Rule{"invalid format", ErrorCode::Parsing},
    Rule{"validation", ErrorCode::Validation},
    Rule{"invalid value", ErrorCode::Validation},
    Rule{"cache", ErrorCode::Cache},
    Rule{"image", ErrorCode::ImageProcessing},
    Rule{"plugin", ErrorCode::Plugin},
    Rule{"invalid argument", ErrorCode::InvalidArgument},
};

std::mutex g_faultMutex;
std::optional<FaultContext> g_lastFault;

void appendNested(const std::exception& e, std::ostringstream& trace, int depth) {
    trace << std::string(static_cast<size_t>(depth) * 2, ' ') << typeid(e).name() << ": "
          << e.what() << '\n';
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        appendNested(nested, trace, depth + 1);
    } catch (...) {
        trace << std::string(static_cast<size_t>(depth + 1) * 2, ' ')
              << "<non-standard exception>\n";
    }
}

} // namespace

ErrorContext ErrorContext::here(std::string info, std::source_location loc) {
    ErrorContext ctx;
    ctx.sourceFile = loc.file_name();
    ctx.sourceFunction = loc.function_name();
    ctx.line = loc.line();
    ctx.info = std::move(info);
    return ctx;
}

ErrorDetails ErrorDetails::fromError(const Error& error) {
    ErrorDetails details;
    Error normalized = normalizeError(error);
    details.code = normalized.code;
    details.message = normalized.message;
    if (!normalized.subject.empty()) {
        if (normalized.code == ErrorCode::Plugin) {
            details.pluginName = normalized.subject;
        } else if (normalized.code == ErrorCode::MissingDependency) {
            details.dependency = normalized.subject;
        }
    }
    return details;
}

Error ErrorDetails::toError() const {
    std::string subject;
    if (pluginName) {
        subject = *pluginName;
    } else if (dependency) {
        subject = *dependency;
    }
    return Error{code, message, std::move(subject)};
}

nlohmann::json ErrorDetails::toJson() const {
    nlohmann::json j{{"kind", kindName()}, {"code", numericCode()}, {"message", message}};
    j["plugin_name"] = pluginName ? nlohmann::json(*pluginName) : nlohmann::json(nullptr);
    j["dependency"] = dependency ? nlohmann::json(*dependency) : nlohmann::json(nullptr);
    if (context) {
        j["context"] = nlohmann::json{{"source_file", context->sourceFile},
                                      {"source_function", context->sourceFunction},
                                      {"line", context->line},
                                      {"info", context->info}};
    } else {
        j["context"] = nullptr;
    }
    j["fault_trace"] = faultTrace ? nlohmann::json(*faultTrace) : nlohmann::json(nullptr);
    return j;
}

Result<ErrorDetails> ErrorDetails::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Error details must be a JSON object"};
    }
    ErrorDetails details;
    try {
        if (j.contains("code") && j["code"].is_number_integer()) {
            auto raw = j["code"].get<int32_t>();
            if (raw < 0 || raw >= kErrorCodeCount) {
                return Error{ErrorCode::InvalidArgument,
                             "Unknown error code: " + std::to_string(raw)};
            }
            details.code = static_cast<ErrorCode>(raw);
        } else if (j.contains("kind") && j["kind"].is_string()) {
            auto code = errorCodeFromName(j["kind"].get<std::string>());
            if (!code) {
                return Error{ErrorCode::InvalidArgument,
                             "Unknown error kind: " + j["kind"].get<std::string>()};
            }
            details.code = *code;
        }
        details.message = j.value("message", std::string{});
        if (j.contains("plugin_name") && j["plugin_name"].is_string()) {
            details.pluginName = j["plugin_name"].get<std::string>();
        }
        if (j.contains("dependency") && j["dependency"].is_string()) {
            details.dependency = j["dependency"].get<std::string>();
        }
        if (j.contains("context") && j["context"].is_object()) {
            const auto& c = j["context"];
            ErrorContext ctx;
            ctx.sourceFile = c.value("source_file", std::string{});
            ctx.sourceFunction = c.value("source_function", std::string{});
            ctx.line = c.value("line", 0u);
            ctx.info = c.value("info", std::string{});
            details.context = std::move(ctx);
        }
        if (j.contains("fault_trace") && j["fault_trace"].is_string()) {
            details.faultTrace = j["fault_trace"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::Parsing, std::string("Malformed error details: ") + e.what()};
    }
    return details;
}

ErrorCode classifyMessage(std::string_view message) {
    if (message.empty()) {
        return ErrorCode::Unknown;
    }
    const auto lowered = toLower(message);
    for (const auto& rule : kClassificationRules) {
        if (lowered.find(rule.needle) != std::string::npos) {
            return rule.code;
        }
    }
    return ErrorCode::Unknown;
}

Error normalizeError(Error error) {
    if (error.code == ErrorCode::Unknown) {
        auto classified = classifyMessage(error.message);
        if (classified != ErrorCode::Unknown) {
            error.code = classified;
        }
    }
    if (error.message.empty()) {
        error.message = errorToString(error.code);
    }
    return error;
}

std::optional<ErrorCode> errorCodeFromName(std::string_view name) {
    const auto lowered = toLower(name);
    for (int32_t i = 0; i < kErrorCodeCount; ++i) {
        auto code = static_cast<ErrorCode>(i);
        if (lowered == errorCodeName(code)) {
            return code;
        }
    }
    return std::nullopt;
}

nlohmann::json FaultContext::toJson() const {
    auto epoch =
        std::chrono::duration_cast<std::chrono::milliseconds>(capturedAt.time_since_epoch())
            .count();
    return nlohmann::json{{"message", message},     {"exception_type", exceptionType},
                          {"boundary", boundary},   {"trace", trace},
                          {"thread_id", threadId},  {"captured_at_ms", epoch}};
}

void recordFault(FaultContext fault) {
    spdlog::error("Captured fault at boundary '{}': {} ({})", fault.boundary, fault.message,
                  fault.exceptionType);
    std::lock_guard<std::mutex> lock(g_faultMutex);
    g_lastFault = std::move(fault);
}

std::optional<FaultContext> lastFaultContext() {
    std::lock_guard<std::mutex> lock(g_faultMutex);
    return g_lastFault;
}

void clearFaultContext() {
    std::lock_guard<std::mutex> lock(g_faultMutex);
    g_lastFault.reset();
}

FaultContext describeException(std::exception_ptr ep, std::string_view boundary) {
    FaultContext fault;
    fault.boundary = std::string(boundary);
    fault.capturedAt = std::chrono::system_clock::now();
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    fault.threadId = tid.str();

    if (!ep) {
        fault.message = "no active exception";
        fault.exceptionType = "none";
        return fault;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        fault.message = e.what();
        fault.exceptionType = typeid(e).name();
        std::ostringstream trace;
        appendNested(e, trace, 0);
        fault.trace = trace.str();
    } catch (const std::string& s) {
        fault.message = s;
        fault.exceptionType = "std::string";
        fault.trace = s;
    } catch (const char* s) {
        fault.message = s ? s : "";
        fault.exceptionType = "const char*";
        fault.trace = fault.message;
    } catch (...) {
        fault.message = "non-standard exception";
        fault.exceptionType = "unknown";
    }
    return fault;
}

} // namespace quarry
