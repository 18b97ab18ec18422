#ifndef FAULTLINE_PAYLOAD_HPP
#define FAULTLINE_PAYLOAD_HPP

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <faultline/core.hpp>
#include <faultline/faultline_export.h>
#include <faultline/report.hpp>
#include <faultline/session.hpp>

namespace faultline {

constexpr std::string_view kNotifierName{"faultline"};

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

// Projection of the typed records onto the backend's key/value payload. Field names are part of
// the wire contract.

NLOHMANN_JSON_SERIALIZE_ENUM(Severity, {{Severity::kError, "error"},
                                        {Severity::kWarning, "warning"},
                                        {Severity::kInfo, "info"}})

// {"method", "file", "lineNumber"}, lineNumber omitted when unknown
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const StackFrame& frame);

// {"errorClass", "message", "stacktrace"}
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const ExceptionRecord& record);

// {"type"}, plus {"attributes": {"level"}} for log reasons
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const SeverityReason& reason);

// {"unhandled", "severity", "severityReason"}, merged as-is into event objects
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const HandledState& state);

// {"handled", "unhandled"}
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const SessionCounters::Snapshot& snapshot);

// {"id", "startedAt", "events"}
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const Session& session);

// Event object: {"exceptions", "unhandled", "severity", "severityReason", "metaData"}, and
// "context" when set
FAULTLINE_EXPORT void to_json(nlohmann::json& j, const Report& report);

/**
 * @brief ISO-8601 UTC with millisecond precision, e.g. "2026-03-01T12:30:05.042Z".
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT std::string format_timestamp(
    std::chrono::system_clock::time_point timePoint);

struct AppInfo {
    std::string name;
    std::string version;
    std::string releaseStage;
};

/**
 * @brief Complete notification body for one report: api key, notifier identity and a single
 * event, carrying the session (if any) it was recorded in.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT nlohmann::json notify_payload(std::string_view apiKey,
                                                                   const Report& report,
                                                                   const AppInfo& app,
                                                                   const Session* session);

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_PAYLOAD_HPP
