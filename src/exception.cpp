#include "faultline/exception.hpp"

#include "faultline/adapter/stacktrace.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <cpptrace/exceptions.hpp>
#include <cpptrace/from_current.hpp>
#include <cpptrace/utils.hpp>

namespace faultline {

namespace {

namespace capture_detail {

std::vector<std::exception_ptr> requireNonEmpty(std::vector<std::exception_ptr> exceptions) {
    if (exceptions.empty()) {
        throw std::invalid_argument("AggregateException requires at least one inner exception");
    }
    return exceptions;
}

[[nodiscard]] std::string typeNameOf(const std::exception& e) {
    return cpptrace::demangle(typeid(e).name());
}

[[nodiscard]] std::exception_ptr nestedOf(const std::exception& e) noexcept {
    if (const auto* nested = dynamic_cast<const std::nested_exception*>(&e); nested != nullptr) {
        return nested->nested_ptr();
    }
    return nullptr;
}

// Where a node's children are written once they are described
struct Pending {
    std::exception_ptr exception;
    std::shared_ptr<const SourceException>* slot;
};

/**
 * @brief Describes one exception, without following its causes. The children still to be
 * captured are returned through cause and bundle.
 */
std::shared_ptr<SourceException> describe(const std::exception_ptr& exception,
                                          std::exception_ptr& cause,
                                          std::vector<std::exception_ptr>& bundle) {
    auto node = std::make_shared<SourceException>();
    try {
        std::rethrow_exception(exception);
    } catch (const AggregateException& e) {
        node->typeName = typeNameOf(e);
        node->message = e.what();
        node->aggregate = true;
        bundle = e.innerExceptions();
    } catch (const cpptrace::exception& e) {
        node->typeName = typeNameOf(e);
        node->message = e.message();  // what() embeds the formatted trace
        node->stackTrace = adapter::from_cpptrace(e.trace()).value_or(StackTrace{});
        cause = nestedOf(e);
    } catch (const std::exception& e) {
        node->typeName = typeNameOf(e);
        node->message = e.what() != nullptr ? e.what() : "";
        cause = nestedOf(e);
    } catch (...) {
        // Not a std::exception: nothing but its existence can be reported
        node->typeName = std::string{kUnknownExceptionType};
    }
    return node;
}

std::shared_ptr<const SourceException> captureGraph(const std::exception_ptr& exception) {
    std::shared_ptr<const SourceException> root;
    if (exception == nullptr) {
        return root;
    }
    std::vector<Pending> pending{{.exception = exception, .slot = &root}};
    std::size_t captured{0};
    while (!pending.empty() && captured < FAULTLINE_MAX_CAPTURED_EXCEPTIONS) {
        Pending current = std::move(pending.back());
        pending.pop_back();

        std::exception_ptr cause;
        std::vector<std::exception_ptr> bundle;
        std::shared_ptr<SourceException> node = describe(current.exception, cause, bundle);
        ++captured;

        // Slots point into nodes that are already owned by the graph, so they stay valid
        if (node->aggregate) {
            node->loaderExceptions.resize(bundle.size());
            for (std::size_t i{bundle.size()}; i-- > 0;) {
                if (bundle[i] != nullptr) {
                    pending.push_back({.exception = std::move(bundle[i]),
                                       .slot = &node->loaderExceptions[i]});
                }
            }
        } else if (cause != nullptr) {
            pending.push_back({.exception = std::move(cause), .slot = &node->cause});
        }
        *current.slot = std::move(node);
    }
    return root;
}

}  // namespace capture_detail

}  // namespace

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

AggregateException::AggregateException(std::vector<std::exception_ptr> innerExceptions)
    : AggregateException(std::string{kDefaultAggregateMessage}, std::move(innerExceptions)) {}

AggregateException::AggregateException(const std::string& message,
                                       std::vector<std::exception_ptr> innerExceptions)
    : std::runtime_error(message.empty() ? std::string{kDefaultAggregateMessage} : message),
      innerExceptions_{capture_detail::requireNonEmpty(std::move(innerExceptions))} {}

std::shared_ptr<const SourceException> capture(const std::exception_ptr& exception) noexcept {
#if FAULTLINE_EXCEPTIONS
    try {
        return capture_detail::captureGraph(exception);
    } catch (const std::exception&) {
        return nullptr;  // out of memory while building the graph
    }
#else
    (void)exception;
    return nullptr;
#endif
}

std::shared_ptr<const SourceException> capture_current() noexcept {
#if FAULTLINE_EXCEPTIONS
    auto root = capture(std::current_exception());
    if (root == nullptr || !root->stackTrace.empty()) {
        return root;
    }
    try {
        // Only populated when the exception was caught through a cpptrace try/catch
        auto trace = adapter::from_cpptrace(cpptrace::from_current_exception());
        if (!trace.has_value() || trace->empty()) {
            return root;
        }
        auto withTrace = std::make_shared<SourceException>(*root);
        withTrace->stackTrace = std::move(*trace);
        return withTrace;
    } catch (const std::exception&) {
        return root;
    }
#else
    return nullptr;
#endif
}

}  // namespace v1

}  // namespace faultline
