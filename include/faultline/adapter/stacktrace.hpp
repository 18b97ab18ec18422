#ifndef FAULTLINE_ADAPTER_STACKTRACE_HPP
#define FAULTLINE_ADAPTER_STACKTRACE_HPP

#include <format>
#include <optional>

#include <cpptrace/basic.hpp>
#include <faultline/core.hpp>

namespace faultline::adapter {  // NOLINT(modernize-concat-nested-namespaces)

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

[[nodiscard]] inline StackFrame from_cpptrace(const cpptrace::stacktrace_frame& cppFrame) {
    StackFrame frame{.method = cppFrame.symbol, .file = cppFrame.filename};
    if (frame.method.empty()) {
        frame.method = std::format("{:#x}", cppFrame.raw_address);
    }
    if (cppFrame.line.has_value()) {
        frame.lineNumber = cppFrame.line.value();
    }
    return frame;
}

// Treat std::optional like std::expected (no c++23 here)
[[nodiscard]] inline std::optional<StackTrace> from_cpptrace(
    const cpptrace::stacktrace& cppTrace) noexcept {
#if FAULTLINE_EXCEPTIONS
    try {
#endif
        StackTrace trace;
        trace.reserve(cppTrace.frames.size());
        for (const auto& cppFrame : cppTrace.frames) {
            trace.push_back(from_cpptrace(cppFrame));
        }
        return trace;
#if FAULTLINE_EXCEPTIONS
    } catch (const std::exception&) {
        return std::nullopt;
    }
#endif
}

/**
 * @brief Resolved trace of the caller of this function, for use as a fallback trace.
 *
 * @param skip additional frames to drop above the caller
 */
[[nodiscard]] inline StackTrace call_site_trace(std::size_t skip = 0) noexcept {
#if FAULTLINE_EXCEPTIONS
    try {
#endif
        return from_cpptrace(cpptrace::generate_trace(skip + 1)).value_or(StackTrace{});
#if FAULTLINE_EXCEPTIONS
    } catch (const std::exception&) {
        return {};
    }
#endif
}

}  // namespace v1

}  // namespace faultline::adapter

#endif  // FAULTLINE_ADAPTER_STACKTRACE_HPP
