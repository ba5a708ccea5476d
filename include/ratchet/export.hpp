#ifndef RATCHET_EXPORT_HPP
#define RATCHET_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Cross-platform shared library export/import macros.
 *
 * When building ratchet as a shared library:
 * - Define RATCHET_SHARED when using the library
 * - RATCHET_BUILDING_SHARED is defined automatically during library compilation
 *
 * Usage in headers:
 *   RATCHET_API void my_function();
 *   class RATCHET_API MyClass { ... };
 */

#if defined(_WIN32) || defined(_WIN64)
    // Windows
    #ifdef RATCHET_BUILDING_SHARED
        #define RATCHET_API __declspec(dllexport)
    #elif defined(RATCHET_SHARED)
        #define RATCHET_API __declspec(dllimport)
    #else
        #define RATCHET_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang - use visibility attribute for shared libraries
    #ifdef RATCHET_BUILDING_SHARED
        #define RATCHET_API __attribute__((visibility("default")))
    #else
        #define RATCHET_API
    #endif
#else
    // Other compilers - no decoration
    #define RATCHET_API
#endif

#endif // RATCHET_EXPORT_HPP
