// Export.hpp - symbol visibility for UIAExtend.Patterns
#pragma once

#if defined(UIAEXTEND_PATTERNS_STATIC)
  #define UIAEXTEND_PATTERNS_API
#elif defined(_WIN32) || defined(_WIN64)
  #if defined(UIAEXTEND_PATTERNS_EXPORTS)
    #define UIAEXTEND_PATTERNS_API __declspec(dllexport)
  #else
    #define UIAEXTEND_PATTERNS_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  // Shared builds compile with hidden visibility; exported entry points opt back in.
  #define UIAEXTEND_PATTERNS_API __attribute__((visibility("default")))
#else
  #define UIAEXTEND_PATTERNS_API
#endif
