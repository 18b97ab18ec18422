#ifndef FAULTLINE_STACK_TRACE_HPP
#define FAULTLINE_STACK_TRACE_HPP

#include <cstdint>
#include <string_view>

#include <faultline/core.hpp>
#include <faultline/faultline_export.h>

namespace faultline {

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

enum class TraceFormat : std::uint8_t {
    // "Namespace.Class:Method (args) (at Assets/File.cs:42)", location optional
    kUnity,
    // "\tat com.example.Class.method(File.java:42)", other lines ignored
    kAndroidJava
};

/**
 * @brief Parses free-text trace output, one frame per line. Blank lines are skipped and no line
 * is ever rejected as malformed: a Unity line without a location keeps its whole text as the
 * method name.
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT StackTrace parse_stack_trace(
    std::string_view text, TraceFormat format = TraceFormat::kUnity);

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_STACK_TRACE_HPP
