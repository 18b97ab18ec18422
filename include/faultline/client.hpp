#ifndef FAULTLINE_CLIENT_HPP
#define FAULTLINE_CLIENT_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <faultline/core.hpp>
#include <faultline/faultline_export.h>
#include <faultline/report.hpp>
#include <faultline/session.hpp>

namespace faultline {

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

enum class ConfigWarning : std::uint8_t {
    kNone = 0,
    kMissingApiKey = 1 << 0,
    kMissingDelivery = 1 << 1,
    kEmptyWrappedClass = 1 << 2,
    kEmptyNativeMarker = 1 << 3
};

constexpr ConfigWarning operator|(ConfigWarning a, ConfigWarning b) {
    return static_cast<ConfigWarning>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

[[nodiscard]] constexpr bool has_warning(ConfigWarning flags, ConfigWarning flag) noexcept {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

struct InitResult {
    bool success{true};
    ConfigWarning warnings{ConfigWarning::kNone};

    explicit operator bool() const {
        return success;
    }
};

enum class DiagnosticLevel : std::uint8_t { kDebug, kInfo, kWarning, kError };

[[nodiscard]] constexpr std::string_view to_string(DiagnosticLevel level) noexcept {
    switch (level) {
        case DiagnosticLevel::kDebug:
            return "debug";
        case DiagnosticLevel::kInfo:
            return "info";
        case DiagnosticLevel::kWarning:
            return "warning";
        case DiagnosticLevel::kError:
            return "error";
    }
    FAULTLINE_UNREACHABLE();
}

// Hands a notification body over to transport. Returns whether the hand-off succeeded.
using DeliveryHook = std::function<bool(const nlohmann::json& payload)>;
// Receives every diagnostic line faultline emits. Only kInfo and above are printed to stderr.
using LogHook = std::function<void(DiagnosticLevel level, std::string_view message)>;
// Device and application data collected by the platform layer, merged into every report
using MetadataProvider = std::function<Metadata()>;

struct FAULTLINE_EXPORT Config {
    std::string apiKey;
    std::string appName;
    std::string appVersion;
    std::string releaseStage{"production"};
    std::string context;
    // Log messages mapping to a lower severity (see faultline::severity_for) are not reported
    Severity notifyLogLevel{Severity::kError};
    bool autoTrackSessions{true};
    bool printMsgToStdErr{true};
    ClassifierConfig classifier{};
    DeliveryHook delivery{nullptr};
    LogHook logHook{nullptr};
    MetadataProvider metadataProvider{nullptr};
};

/**
 * @brief Checks a configuration before use. Fails only without an api key; the remaining flags
 * are warnings.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT InitResult validate(const Config& config) noexcept;

/**
 * @brief Report assembly and delivery front end. Builds reports from native exceptions,
 * collaborator exception graphs and log messages, hands them to the delivery hook and counts
 * every delivered report in the current session.
 *
 * @note Thread-safe. Configuration is fixed at construction; the current session may be swapped
 * concurrently with notifications.
 */
class FAULTLINE_EXPORT Client {
   public:
    explicit Client(Config config);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;
    ~Client() = default;

    [[nodiscard]] const Config& config() const noexcept {
        return config_;
    }

    // Report for an exception caught and reported by the application
    [[nodiscard]] Report createReport(const std::exception_ptr& exception,
                                      const HandledState& state) const;
    [[nodiscard]] Report createReport(const SourceException& root,
                                      const HandledState& state) const;
    // std::nullopt when the message is below notifyLogLevel or already reported natively
    [[nodiscard]] std::optional<Report> createReport(const LogMessage& message,
                                                     bool forceUnhandled = false) const;

    /**
     * @brief Serializes and hands the report to the delivery hook. A successful hand-off is
     * counted in the current session.
     *
     * @return whether the delivery hook accepted the report
     */
    bool deliver(const Report& report) noexcept;

    bool notify(const std::exception_ptr& exception, Severity severity = Severity::kWarning);
    bool notify(const SourceException& root, const HandledState& state);
    bool notifyUnhandled(const std::exception_ptr& exception);
    bool notifyLog(const LogMessage& message, bool forceUnhandled = false);

    // Replaces the current session with a fresh one and returns it
    std::shared_ptr<Session> startSession();
    // Current session, or nullptr before the first one is started
    [[nodiscard]] std::shared_ptr<Session> session() const;

   private:
    void log(DiagnosticLevel level, std::string_view message) const noexcept;
    void decorate(Report& report) const;

    Config config_;
    mutable std::mutex sessionMutex_;
    std::shared_ptr<Session> session_;
};

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_CLIENT_HPP
