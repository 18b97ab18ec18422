#include "faultline/core.hpp"

#include "faultline/attributes.h"
#include "faultline/stack_trace.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faultline {

namespace utils {

namespace {

constexpr std::string_view kWhitespace{" \t\r\n\f\v"};

[[nodiscard]] std::string_view trim(std::string_view str) noexcept {
    const auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

[[nodiscard]] std::optional<std::uint32_t> parseLineNumber(std::string_view digits) noexcept {
    std::uint32_t value{0};
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

template <typename Fn>
void forEachLine(std::string_view text, Fn&& fn) {
    while (!text.empty()) {
        const auto end = text.find('\n');
        const auto line = trim(text.substr(0, end));
        if (!line.empty()) {
            fn(line);
        }
        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }
}

[[nodiscard]] StackTrace withFallback(StackTrace trace, std::span<const StackFrame> fallback) {
    if (trace.empty()) {
        trace.assign(fallback.begin(), fallback.end());
    }
    return trace;
}

}  // namespace

}  // namespace utils

namespace {

namespace pattern {

constexpr std::string_view kUnityLocation{"(at "};
constexpr std::string_view kJavaFramePrefix{"at"};

[[nodiscard]] bool isDigits(std::string_view str) noexcept {
    return !str.empty() && std::ranges::all_of(str, [](char c) { return c >= '0' && c <= '9'; });
}

struct ClassAndMessage {
    std::string errorClass;
    std::string message;
};

// "<class>: <message>". The class is the leading run of non-whitespace up to its last ':', the
// message is everything after that, across lines. Scanning is linear in the input length.
[[nodiscard]] std::optional<ClassAndMessage> splitClassAndMessage(std::string_view text) {
    const auto token = text.substr(0, text.find_first_of(utils::kWhitespace));
    const auto colon = token.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    return ClassAndMessage{.errorClass = std::string{token.substr(0, colon)},
                           .message = std::string{utils::trim(text.substr(colon + 1))}};
}

struct Location {
    std::string_view file;
    std::string_view lineNumber;
};

// "<file>:<digits>"
[[nodiscard]] std::optional<Location> splitLocation(std::string_view text) noexcept {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || !isDigits(text.substr(colon + 1))) {
        return std::nullopt;
    }
    return Location{.file = text.substr(0, colon), .lineNumber = text.substr(colon + 1)};
}

}  // namespace pattern

namespace frames {

// "Class:Method (args) (at Assets/File.cs:42)"
StackFrame fromUnityLine(std::string_view line) {
    if (line.ends_with(')')) {
        const auto body = line.substr(0, line.size() - 1);
        const auto colon = body.rfind(':');
        if (colon != std::string_view::npos && pattern::isDigits(body.substr(colon + 1))) {
            // The first "(at " opens the location, and the file name must not be empty
            const auto at = body.find(pattern::kUnityLocation);
            const auto fileStart = at + pattern::kUnityLocation.size();
            if (at != std::string_view::npos && fileStart < colon) {
                return StackFrame{
                    .method = std::string{utils::trim(body.substr(0, at))},
                    .file = std::string{body.substr(fileStart, colon - fileStart)},
                    .lineNumber = utils::parseLineNumber(body.substr(colon + 1))};
            }
        }
    }
    return StackFrame{.method = std::string{line}, .file = {}};
}

// "at com.example.Class.method(File.java:42)"
std::optional<StackFrame> fromJavaLine(std::string_view line) {
    // "Caused by: ...", "... 12 more" and the exception header are not frames
    if (!line.starts_with(pattern::kJavaFramePrefix) || !line.ends_with(')')) {
        return std::nullopt;
    }
    auto rest = line.substr(pattern::kJavaFramePrefix.size());
    const auto methodStart = rest.find_first_not_of(utils::kWhitespace);
    if (methodStart == 0 || methodStart == std::string_view::npos) {
        return std::nullopt;
    }
    rest.remove_prefix(methodStart);
    const auto open = rest.find_first_of(" \t\r\n\f\v(");
    if (open == 0 || open == std::string_view::npos || rest[open] != '(') {
        return std::nullopt;
    }
    const auto inner = rest.substr(open + 1, rest.size() - open - 2);
    StackFrame frame{.method = std::string{rest.substr(0, open)}, .file = std::string{inner}};
    if (const auto location = pattern::splitLocation(inner); location.has_value()) {
        frame.file = std::string{location->file};
        frame.lineNumber = utils::parseLineNumber(location->lineNumber);
    }
    return frame;
}

}  // namespace frames

[[nodiscard]] ExceptionRecord toRecord(const SourceException& node,
                                       std::span<const StackFrame> fallback) {
    return ExceptionRecord{node.typeName, node.message,
                           utils::withFallback(node.stackTrace, fallback)};
}

}  // namespace

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

SourceException::~SourceException() {
    std::vector<std::shared_ptr<const SourceException>> pending;
    pending.push_back(std::move(cause));
    std::ranges::move(loaderExceptions, std::back_inserter(pending));
    while (!pending.empty()) {
        auto next = std::move(pending.back());
        pending.pop_back();
        // Shared descendants stay with their other owners
        if (next != nullptr && next.use_count() == 1) {
            pending.push_back(std::move(next->cause));
            std::ranges::move(next->loaderExceptions, std::back_inserter(pending));
            next->loaderExceptions.clear();
        }
    }
}

HandledState classify(ReportContext context, Severity severity) noexcept {
    switch (context) {
        case ReportContext::kExplicitHandledReport:
            return HandledState{false, severity,
                                SeverityReason{.type = SeverityReason::Type::kHandledException}};
        case ReportContext::kUnityLogEvent:
            return HandledState{severity == Severity::kError, severity,
                                SeverityReason{.type = SeverityReason::Type::kLog,
                                               .logLevel = severity}};
        case ReportContext::kForcedUnhandled:
            return HandledState{
                true, Severity::kError,
                SeverityReason{.type = SeverityReason::Type::kUnhandledException}};
    }
    FAULTLINE_UNREACHABLE();
}

Severity severity_for(LogType type) noexcept {
    switch (type) {
        case LogType::kError:
        case LogType::kAssert:
        case LogType::kException:
            return Severity::kError;
        case LogType::kWarning:
            return Severity::kWarning;
        case LogType::kLog:
            return Severity::kInfo;
    }
    FAULTLINE_UNREACHABLE();
}

std::vector<ExceptionRecord> flatten(const SourceException* root,
                                     std::span<const StackFrame> fallback) {
    std::vector<ExceptionRecord> records;
    std::vector<const SourceException*> pending;
    if (root != nullptr) {
        pending.push_back(root);
    }
    // LIFO: children are pushed in reverse so the first one is visited next
    while (!pending.empty()) {
        const SourceException* node = pending.back();
        pending.pop_back();
        records.push_back(toRecord(*node, fallback));
        if (node->aggregate) {
            for (const auto& loaderException : std::ranges::reverse_view(node->loaderExceptions)) {
                if (loaderException != nullptr) {
                    pending.push_back(loaderException.get());
                }
            }
        } else if (node->cause != nullptr) {
            pending.push_back(node->cause.get());
        }
    }
    return records;
}

StackTrace parse_stack_trace(std::string_view text, TraceFormat format) {
    StackTrace trace;
    utils::forEachLine(text, [&trace, format](std::string_view line) {
        switch (format) {
            case TraceFormat::kUnity:
                trace.push_back(frames::fromUnityLine(line));
                return;
            case TraceFormat::kAndroidJava:
                if (auto frame = frames::fromJavaLine(line); frame.has_value()) {
                    trace.push_back(std::move(*frame));
                }
                return;
        }
        FAULTLINE_UNREACHABLE();
    });
    return trace;
}

ClassifiedLogMessage classify_log_message(const LogMessage& message,
                                          std::span<const StackFrame> fallback, Severity severity,
                                          bool forceUnhandled, const ClassifierConfig& config) {
    StackTrace trace =
        utils::withFallback(parse_stack_trace(message.stackTrace, TraceFormat::kUnity), fallback);
    HandledState handledState = forceUnhandled ? classify(ReportContext::kForcedUnhandled)
                                               : classify(ReportContext::kUnityLogEvent, severity);

    auto parsed = pattern::splitClassAndMessage(message.condition);
    if (!parsed.has_value()) {
        return ClassifiedLogMessage{
            .exception = ExceptionRecord{std::string{kSyntheticLogClassPrefix}.append(
                                             to_string(message.type)),
                                         message.condition, std::move(trace)},
            .handledState = handledState};
    }

    if (!config.wrappedNativeErrorClass.empty() &&
        parsed->errorClass == config.wrappedNativeErrorClass) {
        // The wrapped exception's own "<class>: <message>" sits inside the outer message
        if (auto nested = pattern::splitClassAndMessage(parsed->message); nested.has_value()) {
            parsed = std::move(nested);
        } else {
            parsed = pattern::ClassAndMessage{.errorClass = std::move(parsed->message),
                                              .message = {}};
        }
        trace = utils::withFallback(
            parse_stack_trace(message.stackTrace, TraceFormat::kAndroidJava), fallback);
        // Native runtime exceptions surfacing through the log are uncaught crashes
        handledState = classify(ReportContext::kForcedUnhandled);
    }

    return ClassifiedLogMessage{
        .exception = ExceptionRecord{std::move(parsed->errorClass), std::move(parsed->message),
                                     std::move(trace)},
        .handledState = handledState};
}

bool should_send(std::string_view condition, std::string_view stackTrace,
                 const ClassifierConfig& config) noexcept {
#if FAULTLINE_EXCEPTIONS
    try {
#endif
        const auto parsed = pattern::splitClassAndMessage(condition);
        if (!parsed.has_value() || config.wrappedNativeErrorClass.empty() ||
            parsed->errorClass != config.wrappedNativeErrorClass) {
            return true;
        }
        if (stackTrace.empty() || config.nativeAgentMarker.empty()) {
            return true;
        }
        return stackTrace.find(config.nativeAgentMarker) == std::string_view::npos;
#if FAULTLINE_EXCEPTIONS
    } catch (const std::exception&) {
        return true;  // bad_alloc: report rather than risk losing the event
    }
#endif
}

}  // namespace v1

}  // namespace faultline
