#include "faultline/client.hpp"

#include "faultline/adapter/stacktrace.hpp"
#include "faultline/exception.hpp"
#include "faultline/payload.hpp"

#include <cstdio>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace faultline {

namespace {

namespace diagnostics {

constexpr std::string_view kPrefix{"[faultline] "};

void writeToStdErr(std::string_view message, std::string_view detail = {}) noexcept {
    std::fwrite(kPrefix.data(), 1, kPrefix.size(), stderr);
    std::fwrite(message.data(), 1, message.size(), stderr);
    std::fwrite(detail.data(), 1, detail.size(), stderr);
    std::fputc('\n', stderr);
}

}  // namespace diagnostics

// Severity is ordered from most (kError) to least (kInfo) severe
[[nodiscard]] constexpr bool isAtLeast(Severity severity, Severity threshold) noexcept {
    return static_cast<int>(severity) <= static_cast<int>(threshold);
}

[[nodiscard]] std::string_view describe(const Report& report) noexcept {
    return report.exceptions().empty() ? std::string_view{"<empty report>"}
                                       : std::string_view{report.exceptions().front().errorClass()};
}

}  // namespace

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

InitResult validate(const Config& config) noexcept {
    InitResult result{.success = true, .warnings = ConfigWarning::kNone};
    if (config.apiKey.empty()) {
        result.success = false;
        result.warnings = result.warnings | ConfigWarning::kMissingApiKey;
    }
    if (config.delivery == nullptr) {
        result.warnings = result.warnings | ConfigWarning::kMissingDelivery;
    }
    if (config.classifier.wrappedNativeErrorClass.empty()) {
        result.warnings = result.warnings | ConfigWarning::kEmptyWrappedClass;
    }
    if (config.classifier.nativeAgentMarker.empty()) {
        result.warnings = result.warnings | ConfigWarning::kEmptyNativeMarker;
    }
    return result;
}

Client::Client(Config config) : config_{std::move(config)} {
    const auto result = validate(config_);
    if (!result) {
        log(DiagnosticLevel::kError, "No api key configured. Reports will be rejected.");
    }
    if (has_warning(result.warnings, ConfigWarning::kMissingDelivery)) {
        log(DiagnosticLevel::kWarning, "No delivery hook configured. Reports will be dropped.");
    }
    if (has_warning(result.warnings, ConfigWarning::kEmptyWrappedClass)) {
        log(DiagnosticLevel::kInfo, "Wrapped native exception unwrapping is disabled.");
    }
    if (has_warning(result.warnings, ConfigWarning::kEmptyNativeMarker)) {
        log(DiagnosticLevel::kInfo,
            "Native agent marker is empty. Natively reported crashes may be sent twice.");
    }
    if (config_.autoTrackSessions) {
        session_ = std::make_shared<Session>();
    }
}

Report Client::createReport(const std::exception_ptr& exception, const HandledState& state) const {
    // The in-flight exception may carry a throw site trace recorded by cpptrace
    const auto root = exception != nullptr && exception == std::current_exception()
                          ? capture_current()
                          : capture(exception);
    const auto fallback = adapter::call_site_trace(1);
    Report report{flatten(root, fallback), state};
    decorate(report);
    return report;
}

Report Client::createReport(const SourceException& root, const HandledState& state) const {
    const auto fallback = adapter::call_site_trace(1);
    Report report{flatten(&root, fallback), state};
    decorate(report);
    return report;
}

std::optional<Report> Client::createReport(const LogMessage& message, bool forceUnhandled) const {
    const auto severity = severity_for(message.type);
    if (!forceUnhandled && !isAtLeast(severity, config_.notifyLogLevel)) {
        return std::nullopt;
    }
    if (!should_send(message, config_.classifier)) {
        log(DiagnosticLevel::kDebug,
            "Skipping log message already reported by the native agent: " + message.condition);
        return std::nullopt;
    }
    const auto fallback = adapter::call_site_trace(1);
    auto classified =
        classify_log_message(message, fallback, severity, forceUnhandled, config_.classifier);
    std::vector<ExceptionRecord> exceptions;
    exceptions.push_back(std::move(classified.exception));
    Report report{std::move(exceptions), classified.handledState};
    decorate(report);
    return report;
}

bool Client::deliver(const Report& report) noexcept {
    try {
        if (config_.delivery == nullptr) {
            log(DiagnosticLevel::kWarning,
                std::string{"Dropping report without delivery hook: "}.append(describe(report)));
            return false;
        }
        const auto current = session();
        const auto payload = notify_payload(config_.apiKey, report,
                                            AppInfo{.name = config_.appName,
                                                    .version = config_.appVersion,
                                                    .releaseStage = config_.releaseStage},
                                            current.get());
        if (!config_.delivery(payload)) {
            log(DiagnosticLevel::kWarning, std::format("Delivery failed for {}", describe(report)));
            return false;
        }
        // Report completion: only delivered reports count towards the session
        if (current != nullptr) {
            current->addEvent(report);
        }
        return true;
    } catch (const std::exception& e) {
        log(DiagnosticLevel::kError, std::string{"Delivery threw: "}.append(e.what()));
    } catch (...) {
        log(DiagnosticLevel::kError, "Delivery threw an unknown exception");
    }
    return false;
}

bool Client::notify(const std::exception_ptr& exception, Severity severity) {
    if (exception == nullptr) {
        log(DiagnosticLevel::kWarning, "notify called without an exception");
        return false;
    }
    return deliver(
        createReport(exception, classify(ReportContext::kExplicitHandledReport, severity)));
}

bool Client::notify(const SourceException& root, const HandledState& state) {
    return deliver(createReport(root, state));
}

bool Client::notifyUnhandled(const std::exception_ptr& exception) {
    if (exception == nullptr) {
        log(DiagnosticLevel::kWarning, "notifyUnhandled called without an exception");
        return false;
    }
    return deliver(createReport(exception, classify(ReportContext::kForcedUnhandled)));
}

bool Client::notifyLog(const LogMessage& message, bool forceUnhandled) {
    const auto report = createReport(message, forceUnhandled);
    if (!report.has_value()) {
        return false;
    }
    return deliver(*report);
}

std::shared_ptr<Session> Client::startSession() {
    auto fresh = std::make_shared<Session>();
    std::lock_guard lock{sessionMutex_};
    session_ = fresh;
    return fresh;
}

std::shared_ptr<Session> Client::session() const {
    std::lock_guard lock{sessionMutex_};
    return session_;
}

void Client::log(DiagnosticLevel level, std::string_view message) const noexcept {
    // Debug lines only reach the hook
    if (config_.printMsgToStdErr && level != DiagnosticLevel::kDebug) {
        try {
            diagnostics::writeToStdErr(std::format("{}: {}", to_string(level), message));
        } catch (const std::exception&) {
            diagnostics::writeToStdErr(message);
        }
    }
    if (config_.logHook != nullptr) {
        try {
            config_.logHook(level, message);
        } catch (const std::exception& e) {
            diagnostics::writeToStdErr("Log hook threw: ", e.what());
        } catch (...) {
            diagnostics::writeToStdErr("Log hook threw an unknown exception");
        }
    }
}

void Client::decorate(Report& report) const {
    if (!config_.context.empty()) {
        report.setContext(config_.context);
    }
    if (config_.metadataProvider == nullptr) {
        return;
    }
    try {
        report.mergeMetadata(config_.metadataProvider());
    } catch (const std::exception& e) {
        log(DiagnosticLevel::kError, std::format("Metadata provider threw: {}", e.what()));
    }
}

}  // namespace v1

}  // namespace faultline
