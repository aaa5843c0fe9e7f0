// api.h - Symbol visibility macros for jsonb_delta

#pragma once

/// @file api.h
/// @brief Export/import decoration for the jsonb_delta library.
///
/// - Static build (default): JSONB_DELTA_API expands to nothing.
/// - Shared build: CMake defines JSONB_DELTA_SHARED (public) and
///   JSONB_DELTA_EXPORTS (private to the library target).
///
/// @code
/// [[nodiscard]] JSONB_DELTA_API Result<Value> shallow_merge(const Value&, const Value&);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSONB_DELTA_SHARED
        #ifdef JSONB_DELTA_EXPORTS
            #define JSONB_DELTA_API __declspec(dllexport)
        #else
            #define JSONB_DELTA_API __declspec(dllimport)
        #endif
    #else
        #define JSONB_DELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSONB_DELTA_SHARED) && defined(JSONB_DELTA_EXPORTS)
        #define JSONB_DELTA_API __attribute__((visibility("default")))
    #else
        #define JSONB_DELTA_API
    #endif
#else
    #define JSONB_DELTA_API
#endif
