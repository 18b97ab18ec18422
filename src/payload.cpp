#include "faultline/payload.hpp"

#include "faultline/version.h"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace faultline {

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

void to_json(nlohmann::json& j, const StackFrame& frame) {
    j = nlohmann::json{{"method", frame.method}, {"file", frame.file}};
    if (frame.lineNumber.has_value()) {
        j["lineNumber"] = *frame.lineNumber;
    }
}

void to_json(nlohmann::json& j, const ExceptionRecord& record) {
    j = nlohmann::json{{"errorClass", record.errorClass()},
                       {"message", record.message()},
                       {"stacktrace", record.stackTrace()}};
}

void to_json(nlohmann::json& j, const SeverityReason& reason) {
    j = nlohmann::json{{"type", to_string(reason.type)}};
    if (reason.type == SeverityReason::Type::kLog && reason.logLevel.has_value()) {
        j["attributes"] = nlohmann::json{{"level", *reason.logLevel}};
    }
}

void to_json(nlohmann::json& j, const HandledState& state) {
    j = nlohmann::json{{"unhandled", state.unhandled()},
                       {"severity", state.severity()},
                       {"severityReason", state.severityReason()}};
}

void to_json(nlohmann::json& j, const SessionCounters::Snapshot& snapshot) {
    j = nlohmann::json{{"handled", snapshot.handled}, {"unhandled", snapshot.unhandled}};
}

void to_json(nlohmann::json& j, const Session& session) {
    j = nlohmann::json{{"id", session.id()},
                       {"startedAt", format_timestamp(session.startedAt())},
                       {"events", session.events().snapshot()}};
}

void to_json(nlohmann::json& j, const Report& report) {
    to_json(j, report.handledState());
    j["exceptions"] = report.exceptions();
    j["metaData"] = report.metadata();
    if (!report.context().empty()) {
        j["context"] = report.context();
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point timePoint) {
    const auto sinceEpoch = timePoint.time_since_epoch();
    const auto secs = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch - secs);

    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::time_point{std::chrono::duration_cast<
            std::chrono::system_clock::duration>(secs)});
    std::tm tmInfo{};
#ifdef _WIN32
    gmtime_s(&tmInfo, &t);
#else
    gmtime_r(&t, &tmInfo);
#endif
    std::array<char, 24> baseTime{};
    std::strftime(baseTime.data(), baseTime.size(), "%Y-%m-%dT%H:%M:%S", &tmInfo);
    std::array<char, 32> result{};
    std::snprintf(result.data(), result.size(), "%s.%03dZ", baseTime.data(),
                  static_cast<int>(ms.count()));
    return std::string{result.data()};
}

nlohmann::json notify_payload(std::string_view apiKey, const Report& report, const AppInfo& app,
                              const Session* session) {
    nlohmann::json event = report;
    event["app"] = nlohmann::json{
        {"name", app.name}, {"version", app.version}, {"releaseStage", app.releaseStage}};
    if (session != nullptr) {
        nlohmann::json sessionJson;
        to_json(sessionJson, *session);
        event["session"] = std::move(sessionJson);
    }
    return nlohmann::json{
        {"apiKey", std::string{apiKey}},
        {"notifier",
         {{"name", std::string{kNotifierName}}, {"version", FAULTLINE_VERSION_STRING}}},
        {"events", nlohmann::json::array({std::move(event)})}};
}

}  // namespace v1

}  // namespace faultline
