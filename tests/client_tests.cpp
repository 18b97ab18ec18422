#define BOOST_TEST_MODULE ClientTests
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/test/included/unit_test.hpp>
#include <faultline/client.hpp>
#include <faultline/exception.hpp>
#include <nlohmann/json.hpp>

#include "test_print.hpp"

namespace {

using faultline::Client;
using faultline::ConfigWarning;
using faultline::DiagnosticLevel;
using faultline::LogMessage;
using faultline::LogType;
using faultline::Severity;
using nlohmann::json;

struct DiagnosticLine {
    DiagnosticLevel level;
    std::string message;
};

// Records every delivered payload and diagnostic line
struct ClientFixture {
    std::mutex mutex;
    std::vector<json> delivered;
    std::vector<DiagnosticLine> diagnostics;
    bool accept{true};

    faultline::Config config() {
        return faultline::Config{
            .apiKey = "a1b2c3",
            .appName = "Game",
            .appVersion = "2.0.1",
            .releaseStage = "development",
            .printMsgToStdErr = false,
            .delivery =
                [this](const json& payload) {
                    std::lock_guard lock{mutex};
                    delivered.push_back(payload);
                    return accept;
                },
            .logHook =
                [this](DiagnosticLevel level, std::string_view message) {
                    std::lock_guard lock{mutex};
                    diagnostics.push_back({level, std::string{message}});
                }};
    }

    [[nodiscard]] bool logged(DiagnosticLevel level, std::string_view fragment) {
        std::lock_guard lock{mutex};
        for (const auto& line : diagnostics) {
            if (line.level == level && line.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] const json& lastEvent() const {
        return delivered.back()["events"][0];
    }
};

void loadLevel() {
    throw std::runtime_error("level file missing");
}

}  // namespace

BOOST_AUTO_TEST_SUITE(Configuration)

BOOST_AUTO_TEST_CASE(ApiKeyIsRequired) {
    const auto result = faultline::validate(faultline::Config{});
    BOOST_TEST(!result);
    BOOST_TEST(faultline::has_warning(result.warnings, ConfigWarning::kMissingApiKey));
    BOOST_TEST(faultline::has_warning(result.warnings, ConfigWarning::kMissingDelivery));
    BOOST_TEST(!faultline::has_warning(result.warnings, ConfigWarning::kEmptyWrappedClass));
}

BOOST_AUTO_TEST_CASE(WarningsDoNotFail) {
    faultline::Config config{.apiKey = "key"};
    config.classifier.wrappedNativeErrorClass.clear();
    config.classifier.nativeAgentMarker.clear();
    const auto result = faultline::validate(config);
    BOOST_TEST(static_cast<bool>(result));
    BOOST_TEST(faultline::has_warning(result.warnings, ConfigWarning::kEmptyWrappedClass));
    BOOST_TEST(faultline::has_warning(result.warnings, ConfigWarning::kEmptyNativeMarker));
    BOOST_TEST(!faultline::has_warning(result.warnings, ConfigWarning::kMissingApiKey));
}

BOOST_FIXTURE_TEST_CASE(ConstructionLogsProblems, ClientFixture) {
    auto settings = config();
    settings.apiKey.clear();
    settings.delivery = nullptr;
    const Client client{std::move(settings)};
    BOOST_TEST(logged(DiagnosticLevel::kError, "api key"));
    BOOST_TEST(logged(DiagnosticLevel::kWarning, "delivery hook"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(Delivery, ClientFixture)

BOOST_AUTO_TEST_CASE(HandledExceptionIsCounted) {
    Client client{config()};
    try {
        loadLevel();
    } catch (const std::exception&) {
        BOOST_TEST(client.notify(std::current_exception()));
    }

    BOOST_REQUIRE_EQUAL(delivered.size(), 1U);
    const auto& event = lastEvent();
    BOOST_TEST((event["unhandled"] == false));
    BOOST_TEST((event["severity"] == "warning"));
    BOOST_TEST((event["severityReason"]["type"] == "handledException"));
    BOOST_TEST((event["exceptions"][0]["message"] == "level file missing"));
    BOOST_TEST(event["exceptions"][0]["errorClass"].get<std::string>().find("runtime_error") !=
               std::string::npos);
    BOOST_TEST(!event["exceptions"][0]["stacktrace"].empty());
    BOOST_TEST((event["app"]["releaseStage"] == "development"));
    BOOST_TEST((delivered.back()["apiKey"] == "a1b2c3"));

    const auto session = client.session();
    BOOST_REQUIRE(session != nullptr);
    BOOST_TEST((event["session"]["id"] == session->id()));
    BOOST_TEST(session->events().handled() == 1U);
    BOOST_TEST(session->events().unhandled() == 0U);
}

BOOST_AUTO_TEST_CASE(UnhandledExceptionIsCounted) {
    Client client{config()};
    BOOST_TEST(client.notifyUnhandled(std::make_exception_ptr(std::logic_error{"corrupt save"})));
    BOOST_TEST((lastEvent()["unhandled"] == true));
    BOOST_TEST((lastEvent()["severity"] == "error"));
    BOOST_TEST((lastEvent()["severityReason"]["type"] == "unhandledException"));
    BOOST_TEST(client.session()->events().unhandled() == 1U);
}

BOOST_AUTO_TEST_CASE(ExplicitSeverity) {
    Client client{config()};
    BOOST_TEST(client.notify(std::make_exception_ptr(std::runtime_error{"x"}), Severity::kError));
    BOOST_TEST((lastEvent()["severity"] == "error"));
    BOOST_TEST((lastEvent()["unhandled"] == false));
}

BOOST_AUTO_TEST_CASE(NullExceptionIsRejected) {
    Client client{config()};
    BOOST_TEST(!client.notify(std::exception_ptr{}));
    BOOST_TEST(!client.notifyUnhandled(nullptr));
    BOOST_TEST(delivered.empty());
    BOOST_TEST(logged(DiagnosticLevel::kWarning, "without an exception"));
}

BOOST_AUTO_TEST_CASE(FailedDeliveryIsNotCounted) {
    accept = false;
    Client client{config()};
    BOOST_TEST(!client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(delivered.size() == 1U);
    BOOST_TEST(client.session()->events().handled() == 0U);
    BOOST_TEST(logged(DiagnosticLevel::kWarning, "Delivery failed"));
}

BOOST_AUTO_TEST_CASE(ThrowingDeliveryIsContained) {
    auto settings = config();
    settings.delivery = [](const json&) -> bool { throw std::runtime_error("socket closed"); };
    Client client{std::move(settings)};
    BOOST_TEST(!client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(client.session()->events().handled() == 0U);
    BOOST_TEST(logged(DiagnosticLevel::kError, "socket closed"));
}

BOOST_AUTO_TEST_CASE(MissingDeliveryDropsReport) {
    auto settings = config();
    settings.delivery = nullptr;
    Client client{std::move(settings)};
    BOOST_TEST(!client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(client.session()->events().handled() == 0U);
}

BOOST_AUTO_TEST_CASE(DeliveryThrowingNonStandardTypeIsContained) {
    auto settings = config();
    settings.delivery = [](const json&) -> bool { throw 42; };
    Client client{std::move(settings)};
    BOOST_TEST(!client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(client.session()->events().handled() == 0U);
    BOOST_TEST(logged(DiagnosticLevel::kError, "unknown exception"));
}

BOOST_AUTO_TEST_CASE(LogHookThrowingNonStandardTypeIsContained) {
    auto settings = config();
    settings.delivery = nullptr;
    settings.logHook = [](DiagnosticLevel, std::string_view) { throw 42; };
    Client client{std::move(settings)};
    BOOST_TEST(!client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(!client.notifyLog({.condition = "E: x", .type = LogType::kError}));
}

BOOST_AUTO_TEST_CASE(CollaboratorGraph) {
    Client client{config()};
    auto cause = std::make_shared<faultline::SourceException>();
    cause->typeName = "System.IO.FileNotFoundException";
    cause->message = "level3.bundle";
    cause->stackTrace = {{.method = "Loader.Open()", .file = "Loader.cs", .lineNumber = 20}};
    faultline::SourceException root{.typeName = "LevelLoadException",
                                    .message = "could not load level 3",
                                    .cause = cause};

    BOOST_TEST(
        client.notify(root, faultline::classify(faultline::ReportContext::kForcedUnhandled)));
    const auto& exceptions = lastEvent()["exceptions"];
    BOOST_REQUIRE_EQUAL(exceptions.size(), 2U);
    BOOST_TEST((exceptions[0]["errorClass"] == "LevelLoadException"));
    BOOST_TEST(!exceptions[0]["stacktrace"].empty());
    BOOST_TEST((exceptions[1]["errorClass"] == "System.IO.FileNotFoundException"));
    BOOST_TEST((exceptions[1]["stacktrace"][0]["method"] == "Loader.Open()"));
    BOOST_TEST(client.session()->events().unhandled() == 1U);
}

BOOST_AUTO_TEST_CASE(ReportsCanBeEnrichedBeforeDelivery) {
    Client client{config()};
    auto report =
        client.createReport(std::make_exception_ptr(std::runtime_error{"raw"}),
                            faultline::classify(faultline::ReportContext::kExplicitHandledReport));
    report.exceptions().front().setMessage("raw (while saving profile)");
    report.addMetadata("user", "id", "42");
    BOOST_TEST(client.deliver(report));
    BOOST_TEST((lastEvent()["exceptions"][0]["message"] == "raw (while saving profile)"));
    BOOST_TEST((lastEvent()["metaData"]["user"]["id"] == "42"));
}

BOOST_AUTO_TEST_CASE(ContextAndMetadata) {
    auto settings = config();
    settings.context = "Level3";
    settings.metadataProvider = [] {
        return faultline::Metadata{{"device", {{"model", "Pixel 8"}}}};
    };
    Client client{std::move(settings)};
    BOOST_TEST(client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST((lastEvent()["context"] == "Level3"));
    BOOST_TEST((lastEvent()["metaData"]["device"]["model"] == "Pixel 8"));
}

BOOST_AUTO_TEST_CASE(ThrowingMetadataProviderIsContained) {
    auto settings = config();
    settings.metadataProvider = []() -> faultline::Metadata {
        throw std::runtime_error("battery service unavailable");
    };
    Client client{std::move(settings)};
    BOOST_TEST(client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(logged(DiagnosticLevel::kError, "battery service unavailable"));
}

BOOST_AUTO_TEST_CASE(ConcurrentReports) {
    constexpr int kThreads{4};
    constexpr int kReports{50};
    Client client{config()};
    {
        std::vector<std::jthread> workers;
        for (int t{0}; t < kThreads; ++t) {
            workers.emplace_back([&client, t] {
                for (int i{0}; i < kReports; ++i) {
                    const auto error = std::make_exception_ptr(std::runtime_error{"x"});
                    if (t % 2 == 0) {
                        (void)client.notify(error);
                    } else {
                        (void)client.notifyUnhandled(error);
                    }
                }
            });
        }
    }
    const auto snapshot = client.session()->events().snapshot();
    BOOST_TEST(snapshot.handled == static_cast<std::uint64_t>(kThreads / 2 * kReports));
    BOOST_TEST(snapshot.unhandled == static_cast<std::uint64_t>(kThreads / 2 * kReports));
    BOOST_TEST(delivered.size() == static_cast<std::size_t>(kThreads * kReports));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(LogMessages, ClientFixture)

BOOST_AUTO_TEST_CASE(BelowThresholdIsIgnored) {
    Client client{config()};
    BOOST_TEST(!client.notifyLog({.condition = "Texture missing", .type = LogType::kWarning}));
    BOOST_TEST(!client.notifyLog({.condition = "Loaded scene", .type = LogType::kLog}));
    BOOST_TEST(delivered.empty());
}

BOOST_AUTO_TEST_CASE(LoweredThreshold) {
    auto settings = config();
    settings.notifyLogLevel = Severity::kWarning;
    Client client{std::move(settings)};
    BOOST_TEST(client.notifyLog({.condition = "Texture missing", .type = LogType::kWarning}));
    BOOST_TEST(!client.notifyLog({.condition = "Loaded scene", .type = LogType::kLog}));
    BOOST_TEST((lastEvent()["exceptions"][0]["errorClass"] == "UnityLogWarning"));
    BOOST_TEST((lastEvent()["severityReason"]["attributes"]["level"] == "warning"));
    BOOST_TEST(client.session()->events().handled() == 1U);
}

BOOST_AUTO_TEST_CASE(ErrorLogIsUnhandled) {
    Client client{config()};
    BOOST_TEST(client.notifyLog({.condition = "NullReferenceException: Object reference not set",
                                 .stackTrace = "Player:Update () (at Assets/Player.cs:12)",
                                 .type = LogType::kException}));
    const auto& event = lastEvent();
    BOOST_TEST((event["exceptions"][0]["errorClass"] == "NullReferenceException"));
    BOOST_TEST((event["exceptions"][0]["stacktrace"][0]["file"] == "Assets/Player.cs"));
    BOOST_TEST((event["severityReason"]["type"] == "log"));
    BOOST_TEST(client.session()->events().unhandled() == 1U);
}

BOOST_AUTO_TEST_CASE(ForcedUnhandledBypassesThreshold) {
    Client client{config()};
    BOOST_TEST(client.notifyLog({.condition = "Watchdog fired", .type = LogType::kLog}, true));
    BOOST_TEST((lastEvent()["severityReason"]["type"] == "unhandledException"));
    BOOST_TEST(client.session()->events().unhandled() == 1U);
}

BOOST_AUTO_TEST_CASE(NativelyReportedCrashIsNotSentTwice) {
    Client client{config()};
    const LogMessage message{
        .condition = "AndroidJavaException: java.lang.Error: signal 11",
        .stackTrace =
            "java.lang.Error: signal 11\n\tat com.bugsnag.android.Ndk.crash(libbugsnag-ndk.so)",
        .type = LogType::kException};
    BOOST_TEST(!client.notifyLog(message));
    BOOST_TEST(!client.notifyLog(message, true));
    BOOST_TEST(delivered.empty());
    BOOST_TEST(logged(DiagnosticLevel::kDebug, "already reported"));
}

BOOST_AUTO_TEST_CASE(WrappedJavaException) {
    Client client{config()};
    BOOST_TEST(client.notifyLog(
        {.condition = "AndroidJavaException: java.lang.IllegalStateException: not attached",
         .stackTrace = "\tat com.unity3d.player.UnityPlayer.run(UnityPlayer.java:310)",
         .type = LogType::kException}));
    const auto& event = lastEvent();
    BOOST_TEST((event["exceptions"][0]["errorClass"] == "java.lang.IllegalStateException"));
    BOOST_TEST((event["exceptions"][0]["message"] == "not attached"));
    BOOST_TEST((event["exceptions"][0]["stacktrace"][0]["lineNumber"] == 310));
    BOOST_TEST((event["unhandled"] == true));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(Sessions, ClientFixture)

BOOST_AUTO_TEST_CASE(WithoutAutomaticTracking) {
    auto settings = config();
    settings.autoTrackSessions = false;
    Client client{std::move(settings)};
    BOOST_TEST(client.session() == nullptr);
    BOOST_TEST(client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    BOOST_TEST(!lastEvent().contains("session"));

    const auto started = client.startSession();
    BOOST_TEST(client.session() == started);
    BOOST_TEST(client.notify(std::make_exception_ptr(std::runtime_error{"y"})));
    BOOST_TEST(started->events().handled() == 1U);
}

BOOST_AUTO_TEST_CASE(NewSessionStartsFromZero) {
    Client client{config()};
    const auto first = client.session();
    BOOST_TEST(client.notify(std::make_exception_ptr(std::runtime_error{"x"})));
    const auto second = client.startSession();
    BOOST_TEST(first->id() != second->id());
    BOOST_TEST(first->events().handled() == 1U);
    BOOST_TEST(second->events().handled() == 0U);
}

BOOST_AUTO_TEST_SUITE_END()
