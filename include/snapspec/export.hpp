#ifndef SNAPSPEC_EXPORT_HPP
#define SNAPSPEC_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Cross-platform shared library export/import macros.
 *
 * When building snapspec as a shared library:
 * - Define SNAPSPEC_SHARED when using the library
 * - SNAPSPEC_BUILDING_SHARED is defined automatically during library compilation
 *
 * Usage in headers:
 *   SNAPSPEC_API ValidationResult validate_document(const json& doc);
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef SNAPSPEC_BUILDING_SHARED
        #define SNAPSPEC_API __declspec(dllexport)
    #elif defined(SNAPSPEC_SHARED)
        #define SNAPSPEC_API __declspec(dllimport)
    #else
        #define SNAPSPEC_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef SNAPSPEC_BUILDING_SHARED
        #define SNAPSPEC_API __attribute__((visibility("default")))
    #else
        #define SNAPSPEC_API
    #endif
#else
    #define SNAPSPEC_API
#endif

#endif // SNAPSPEC_EXPORT_HPP
