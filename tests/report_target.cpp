#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <cpptrace/exceptions.hpp>
#include <cpptrace/from_current.hpp>
#include <faultline/client.hpp>
#include <faultline/exception.hpp>
#include <nlohmann/json.hpp>

namespace po = boost::program_options;

namespace {

[[noreturn]] void readSaveFile(const std::string& message) {
    throw cpptrace::runtime_error(message);
}

void loadProfile(const std::string& message) {
    try {
        readSaveFile(message);
    } catch (...) {
        std::throw_with_nested(std::runtime_error("profile could not be loaded"));
    }
}

[[nodiscard]] std::exception_ptr pluginScan(const std::string& message) {
    std::vector<std::exception_ptr> failures;
    failures.push_back(std::make_exception_ptr(std::invalid_argument(message)));
    try {
        loadProfile("plugin profile");
    } catch (...) {
        failures.push_back(std::current_exception());
    }
    return std::make_exception_ptr(
        faultline::AggregateException("2 plugins failed to load", std::move(failures)));
}

}  // namespace

int main(int argc, char** argv) {  // NOLINT(bugprone-exception-escape)
    po::options_description desc("Report options");
    std::string userMsg;
    std::string trace;
    desc.add_options()("help,h", "Show help")(
        "mode,m", po::value<std::string>()->required(),
        "Report to deliver: throw, nested, aggregate, unhandled, log, wrapped_log")(
        "message", po::value<std::string>(&userMsg)->default_value("Test exception"),
        "Exception message, or log condition for the log modes")(
        "trace", po::value<std::string>(&trace)->default_value(""),
        "Trace text for the log modes");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.contains("help")) {
        std::cout << desc << "\n";
        return EXIT_SUCCESS;
    }
    po::notify(vm);
    const auto mode = vm["mode"].as<std::string>();

    // Every delivered body goes to stdout, one per line
    faultline::Client client{faultline::Config{
        .apiKey = "report-target-key",
        .appName = "report_target",
        .appVersion = "1.0.0",
        .releaseStage = "test",
        .delivery =
            [](const nlohmann::json& payload) {
                std::cout << payload.dump() << std::endl;
                return true;
            }}};

    bool delivered{false};
    if (mode == "throw") {
        cpptrace::try_catch([&] { readSaveFile(userMsg); },
                            [&](const std::exception&) {
                                delivered = client.notify(std::current_exception());
                            });
    } else if (mode == "nested") {
        try {
            loadProfile(userMsg);
        } catch (const std::exception&) {
            delivered = client.notify(std::current_exception(), faultline::Severity::kError);
        }
    } else if (mode == "aggregate") {
        delivered = client.notify(pluginScan(userMsg));
    } else if (mode == "unhandled") {
        delivered = client.notifyUnhandled(std::make_exception_ptr(std::logic_error(userMsg)));
    } else if (mode == "log") {
        delivered = client.notifyLog(
            {.condition = userMsg, .stackTrace = trace, .type = faultline::LogType::kError});
    } else if (mode == "wrapped_log") {
        delivered = client.notifyLog(
            {.condition = userMsg, .stackTrace = trace, .type = faultline::LogType::kException});
    } else {
        std::cerr << "Unknown mode: " << mode << "\n";
        return EXIT_FAILURE;
    }

    const auto session = client.session();
    const auto counts = session->events().snapshot();
    std::cerr << "handled=" << counts.handled << " unhandled=" << counts.unhandled << "\n";
    return delivered ? EXIT_SUCCESS : 2;
}
