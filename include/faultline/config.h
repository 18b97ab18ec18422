#ifndef FAULTLINE_CONFIG_H
#define FAULTLINE_CONFIG_H

// --- API Version ---
#if !defined(FAULTLINE_API_VERSION)
#define FAULTLINE_API_VERSION 1
#endif

// --- Exception Support ---
#if defined(__cpp_exceptions)
#define FAULTLINE_EXCEPTIONS 1
#else
#define FAULTLINE_EXCEPTIONS 0
#endif

// --- Capture Limits ---
// Upper bound on the number of nodes captured from a single std::exception_ptr graph
#if !defined(FAULTLINE_MAX_CAPTURED_EXCEPTIONS)
#define FAULTLINE_MAX_CAPTURED_EXCEPTIONS 128
#endif

#endif  // FAULTLINE_CONFIG_H
