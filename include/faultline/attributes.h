#ifndef FAULTLINE_ATTRIBUTES_H
#define FAULTLINE_ATTRIBUTES_H

// nodiscard
#if __cplusplus >= 201703L
#define FAULTLINE_NODISCARD [[nodiscard]]
#elif defined(__GNUC__) || defined(__clang__)
#define FAULTLINE_NODISCARD __attribute__((warn_unused_result))
#elif defined(_MSC_VER)
#define FAULTLINE_NODISCARD _Check_return_
#else
#define FAULTLINE_NODISCARD
#endif

// unreachable
#if __cplusplus >= 202302L
#include <utility>
#define FAULTLINE_UNREACHABLE() std::unreachable()
#elif defined(__GNUC__) || defined(__clang__)
#define FAULTLINE_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define FAULTLINE_UNREACHABLE() __assume(false)
#else
#include <cstdlib>
#define FAULTLINE_UNREACHABLE() std::abort()
#endif

#endif  // FAULTLINE_ATTRIBUTES_H
