#ifndef FAULTLINE_SESSION_HPP
#define FAULTLINE_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <faultline/core.hpp>
#include <faultline/faultline_export.h>

namespace faultline {

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

class Report;

/**
 * @brief Handled and unhandled event counts of one session.
 *
 * @note Thread-safe. Each counter has its own lock, so a handled increment never waits on an
 * unhandled one. Snapshots read each counter under its own lock and are not consistent across
 * the pair.
 */
class FAULTLINE_EXPORT SessionCounters {
   public:
    struct Snapshot {
        std::uint64_t handled{0};
        std::uint64_t unhandled{0};

        bool operator==(const Snapshot&) const = default;
    };

    // Non-zero initial values resume a session reloaded from persistence
    explicit SessionCounters(std::uint64_t handled = 0, std::uint64_t unhandled = 0) noexcept
        : handled_{handled}, unhandled_{unhandled} {}

    SessionCounters(const SessionCounters&) = delete;
    SessionCounters& operator=(const SessionCounters&) = delete;
    SessionCounters(SessionCounters&&) = delete;
    SessionCounters& operator=(SessionCounters&&) = delete;
    ~SessionCounters() = default;

    void incrementHandled() noexcept;
    void incrementUnhandled() noexcept;

    [[nodiscard]] std::uint64_t handled() const noexcept;
    [[nodiscard]] std::uint64_t unhandled() const noexcept;
    [[nodiscard]] Snapshot snapshot() const noexcept;

   private:
    mutable std::mutex handledMutex_;
    std::uint64_t handled_;
    mutable std::mutex unhandledMutex_;
    std::uint64_t unhandled_;
};

class FAULTLINE_EXPORT Session {
   public:
    using Clock = std::chrono::system_clock;

    // Fresh session, started now with no events
    Session();
    Session(Clock::time_point startedAt, std::uint64_t handled, std::uint64_t unhandled);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
    ~Session() = default;

    [[nodiscard]] const std::string& id() const noexcept {
        return id_;
    }
    [[nodiscard]] Clock::time_point startedAt() const noexcept {
        return startedAt_;
    }
    [[nodiscard]] const SessionCounters& events() const noexcept {
        return events_;
    }

    // Records a completed report against the handled or unhandled counter
    void addEvent(const HandledState& state) noexcept;
    void addEvent(const Report& report) noexcept;

   private:
    std::string id_;
    Clock::time_point startedAt_;
    SessionCounters events_;
};

/**
 * @brief Random (version 4) UUID in its canonical 36 character form.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT std::string generate_session_id();

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_SESSION_HPP
