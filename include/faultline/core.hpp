/*
 * faultline - A C++ library that normalizes native exceptions, nested and aggregate exception
 * graphs, and free-text platform log messages into structured reportable exceptions for a
 * crash-reporting backend, and keeps per-session handled/unhandled event counts
 *
 * Licensed under the MIT License.
 */

/**
   @brief Exception flattening:
    Walks a cause graph depth-first, root first. Aggregate nodes (a bundle of independent loader
    failures) contribute each bundled sub-tree in order; every other node contributes its single
    cause. Every visited node becomes one ExceptionRecord. A node without resolvable frames
    receives the caller supplied fallback trace.

   @brief Log message classification:
    Splits "<Class>: <message>" condition text into error class and message. Conditions that do
    not follow that shape are reported under a synthetic "UnityLog<Type>" class. Wrapped native
    exceptions (by default "AndroidJavaException: <java class>: <java message>") are unwrapped,
    re-traced with the Java trace format and always classified as unhandled.

   @brief Handled state:
    One HandledState is attached to a whole flattened set. It is a property of the reporting
    event, never of an individual cause.

    @Note All functions in this header are reentrant and hold no shared state.
 */

#ifndef FAULTLINE_CORE_HPP
#define FAULTLINE_CORE_HPP

#if (defined(_MSVC_LANG) && _MSVC_LANG < 202002L) || (!defined(_MSVC_LANG) && __cplusplus < 202002L)
#error "faultline headers require C++20."
#endif

#include "faultline/config.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <faultline/attributes.h>
#include <faultline/faultline_export.h>

namespace faultline {

constexpr std::string_view kAndroidJavaErrorClass{"AndroidJavaException"};
constexpr std::string_view kNativeAgentMarker{"libbugsnag"};
constexpr std::string_view kSyntheticLogClassPrefix{"UnityLog"};

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

struct FAULTLINE_EXPORT StackFrame {
    std::string method;
    std::string file;
    std::optional<std::uint32_t> lineNumber{};

    bool operator==(const StackFrame&) const = default;
};

using StackTrace = std::vector<StackFrame>;

enum class Severity : std::uint8_t { kError, kWarning, kInfo };

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::kError:
            return "error";
        case Severity::kWarning:
            return "warning";
        case Severity::kInfo:
            return "info";
    }
    FAULTLINE_UNREACHABLE();
}

// Platform log categories, as tagged by the engine's log callback
enum class LogType : std::uint8_t { kError, kAssert, kWarning, kLog, kException };

[[nodiscard]] constexpr std::string_view to_string(LogType type) noexcept {
    switch (type) {
        case LogType::kError:
            return "Error";
        case LogType::kAssert:
            return "Assert";
        case LogType::kWarning:
            return "Warning";
        case LogType::kLog:
            return "Log";
        case LogType::kException:
            return "Exception";
    }
    FAULTLINE_UNREACHABLE();
}

enum class ReportContext : std::uint8_t {
    kExplicitHandledReport,  // caught by the application and reported on purpose
    kUnityLogEvent,          // surfaced through the platform log channel
    kForcedUnhandled         // crash path, or caller insists on unhandled
};

struct FAULTLINE_EXPORT SeverityReason {
    enum class Type : std::uint8_t { kHandledException, kUnhandledException, kLog };

    Type type{Type::kHandledException};
    std::optional<Severity> logLevel{};  // set for Type::kLog only

    bool operator==(const SeverityReason&) const = default;
};

[[nodiscard]] constexpr std::string_view to_string(SeverityReason::Type type) noexcept {
    switch (type) {
        case SeverityReason::Type::kHandledException:
            return "handledException";
        case SeverityReason::Type::kUnhandledException:
            return "unhandledException";
        case SeverityReason::Type::kLog:
            return "log";
    }
    FAULTLINE_UNREACHABLE();
}

class FAULTLINE_EXPORT HandledState {
   public:
    constexpr HandledState(bool unhandled, Severity severity, SeverityReason reason) noexcept
        : unhandled_{unhandled}, severity_{severity}, reason_{reason} {}

    [[nodiscard]] constexpr bool unhandled() const noexcept {
        return unhandled_;
    }
    [[nodiscard]] constexpr Severity severity() const noexcept {
        return severity_;
    }
    [[nodiscard]] constexpr const SeverityReason& severityReason() const noexcept {
        return reason_;
    }

    bool operator==(const HandledState&) const = default;

   private:
    bool unhandled_;
    Severity severity_;
    SeverityReason reason_;
};

/**
 * @brief One normalized exception entry. errorClass and message may still be enriched by the
 * caller before the owning report is transmitted; the trace is fixed at construction.
 */
class FAULTLINE_EXPORT ExceptionRecord {
   public:
    ExceptionRecord(std::string errorClass, std::string message, StackTrace stackTrace = {})
        : errorClass_{std::move(errorClass)},
          message_{std::move(message)},
          stackTrace_{std::move(stackTrace)} {}

    [[nodiscard]] const std::string& errorClass() const noexcept {
        return errorClass_;
    }
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }
    [[nodiscard]] const StackTrace& stackTrace() const noexcept {
        return stackTrace_;
    }

    void setErrorClass(std::string errorClass) {
        errorClass_ = std::move(errorClass);
    }
    void setMessage(std::string message) {
        message_ = std::move(message);
    }

   private:
    std::string errorClass_;
    std::string message_;
    StackTrace stackTrace_;
};

/**
 * @brief Node of an exception cause graph, as handed over by a native capture (see
 * faultline/exception.hpp) or by a platform collaborator bridging its own exception objects.
 * Nodes are shared and never mutated once published.
 */
struct FAULTLINE_EXPORT SourceException {
    // Releases descendants owned only by this node with a work-list, so that destroying a
    // chain of any depth does not recurse
    ~SourceException();

    std::string typeName;
    std::string message;
    StackTrace stackTrace;
    // Mutable so a node being released can hand its descendants to the destructor's work-list
    mutable std::shared_ptr<const SourceException> cause;
    // Aggregate nodes bundle independent failures; their cause is ignored
    bool aggregate{false};
    mutable std::vector<std::shared_ptr<const SourceException>> loaderExceptions;
};

struct LogMessage {
    std::string condition;
    std::string stackTrace;
    LogType type{LogType::kLog};
};

/**
 * @brief Platform specific conventions of the log channel. The defaults describe the Android
 * player, where uncaught Java exceptions arrive as "AndroidJavaException: <class>: <message>"
 * and crashes already captured by the native agent carry its library name in their trace.
 */
struct FAULTLINE_EXPORT ClassifierConfig {
    std::string wrappedNativeErrorClass{kAndroidJavaErrorClass};
    std::string nativeAgentMarker{kNativeAgentMarker};
};

struct ClassifiedLogMessage {
    ExceptionRecord exception;
    HandledState handledState;
};

/**
 * @brief Produces the handled state for a reporting event.
 *
 * @param context how the event reached the reporter
 * @param severity requested severity. Ignored for ReportContext::kForcedUnhandled, which is
 * always an error.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT HandledState
classify(ReportContext context, Severity severity = Severity::kWarning) noexcept;

/**
 * @brief Maps a platform log category onto a report severity. Error, Assert and Exception are
 * errors, Warning is a warning, and plain Log is info.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT Severity severity_for(LogType type) noexcept;

/**
 * @brief Flattens a cause graph into an ordered sequence of records, root first, depth first,
 * preserving bundle order on aggregate nodes. Uses an explicit work-list, so chain depth is
 * bounded by memory only. Releasing such a graph does not recurse either.
 *
 * @param root graph root. A null root yields an empty sequence.
 * @param fallback frames substituted, in full, for every node that has none of its own
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT std::vector<ExceptionRecord> flatten(
    const SourceException* root, std::span<const StackFrame> fallback = {});

[[nodiscard]] inline std::vector<ExceptionRecord> flatten(
    const std::shared_ptr<const SourceException>& root, std::span<const StackFrame> fallback = {}) {
    return flatten(root.get(), fallback);
}

/**
 * @brief Parses a log event into a single record plus the handled state of the event.
 *
 * @param message condition text, trace text and log category
 * @param fallback frames used when the trace text yields none (usually the reporting call site)
 * @param severity severity the message was logged at
 * @param forceUnhandled classifies the event as an unhandled crash regardless of its content
 * @param config wrapped native exception convention of the running platform
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT ClassifiedLogMessage
classify_log_message(const LogMessage& message, std::span<const StackFrame> fallback,
                     Severity severity, bool forceUnhandled = false,
                     const ClassifierConfig& config = {});

/**
 * @brief Duplicate suppression gate, to be evaluated before classify_log_message. Returns false
 * only for wrapped native exceptions whose trace shows that the native agent has already
 * reported them.
 *
 * @note Never fails: an internal error yields true, preferring a duplicate to a lost report.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT bool should_send(std::string_view condition,
                                                      std::string_view stackTrace,
                                                      const ClassifierConfig& config = {}) noexcept;

[[nodiscard]] inline bool should_send(const LogMessage& message,
                                      const ClassifierConfig& config = {}) noexcept {
    return should_send(message.condition, message.stackTrace, config);
}

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_CORE_HPP
