#include "faultline/session.hpp"

#include "faultline/report.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace faultline {

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

void SessionCounters::incrementHandled() noexcept {
    std::lock_guard lock{handledMutex_};
    ++handled_;
}

void SessionCounters::incrementUnhandled() noexcept {
    std::lock_guard lock{unhandledMutex_};
    ++unhandled_;
}

std::uint64_t SessionCounters::handled() const noexcept {
    std::lock_guard lock{handledMutex_};
    return handled_;
}

std::uint64_t SessionCounters::unhandled() const noexcept {
    std::lock_guard lock{unhandledMutex_};
    return unhandled_;
}

SessionCounters::Snapshot SessionCounters::snapshot() const noexcept {
    // One lock at a time: a snapshot never holds both
    return Snapshot{.handled = handled(), .unhandled = unhandled()};
}

std::string generate_session_id() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

Session::Session() : Session(Clock::now(), 0, 0) {}

Session::Session(Clock::time_point startedAt, std::uint64_t handled, std::uint64_t unhandled)
    : id_{generate_session_id()}, startedAt_{startedAt}, events_{handled, unhandled} {}

void Session::addEvent(const HandledState& state) noexcept {
    if (state.unhandled()) {
        events_.incrementUnhandled();
    } else {
        events_.incrementHandled();
    }
}

void Session::addEvent(const Report& report) noexcept {
    addEvent(report.handledState());
}

}  // namespace v1

}  // namespace faultline
