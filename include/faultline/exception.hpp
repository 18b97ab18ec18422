#ifndef FAULTLINE_EXCEPTION_HPP
#define FAULTLINE_EXCEPTION_HPP

#include <exception>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <faultline/core.hpp>
#include <faultline/faultline_export.h>

namespace faultline {

constexpr std::string_view kUnknownExceptionType{"unknown exception"};
constexpr std::string_view kDefaultAggregateMessage{"One or more errors occurred."};

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

/**
 * @brief Several independent failures raised as one exception, e.g. every plugin that failed to
 * load during a scan. Captured as an aggregate node: each bundled exception is reported with its
 * own cause chain, in bundle order.
 */
class FAULTLINE_EXPORT AggregateException : public std::runtime_error {
   public:
    // Throws std::invalid_argument on an empty bundle
    explicit AggregateException(std::vector<std::exception_ptr> innerExceptions);
    AggregateException(const std::string& message, std::vector<std::exception_ptr> innerExceptions);

    [[nodiscard]] const std::vector<std::exception_ptr>& innerExceptions() const noexcept {
        return innerExceptions_;
    }

   private:
    std::vector<std::exception_ptr> innerExceptions_;
};

/**
 * @brief Builds the cause graph of a native exception: std::nested_exception links become causes
 * and AggregateException bundles become loader exceptions. Type names are demangled. A node
 * carries frames when it is a cpptrace::exception; others are left empty for the fallback.
 * At most FAULTLINE_MAX_CAPTURED_EXCEPTIONS nodes are captured.
 *
 * @return graph root, or nullptr for a null exception_ptr or when capture ran out of memory
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT std::shared_ptr<const SourceException> capture(
    const std::exception_ptr& exception) noexcept;

/**
 * @brief capture() for the exception currently being handled. When called inside a cpptrace
 * catch handler (CPPTRACE_TRY / cpptrace::try_catch), the throw site trace recorded by cpptrace
 * is given to the root node if it has none of its own.
 *
 * @note Must be called from within a catch block
 */
FAULTLINE_NODISCARD FAULTLINE_EXPORT std::shared_ptr<const SourceException>
capture_current() noexcept;

[[nodiscard]] inline std::vector<ExceptionRecord> flatten(
    const std::exception_ptr& exception, std::span<const StackFrame> fallback = {}) {
    return flatten(capture(exception), fallback);
}

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_EXCEPTION_HPP
