#ifndef NAVSTACK_EXPORT_HPP
#define NAVSTACK_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building navstack as a shared library:
 * - Define NAVSTACK_SHARED when using the library
 * - NAVSTACK_BUILDING_SHARED is defined by the build during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef NAVSTACK_BUILDING_SHARED
        #define NAVSTACK_API __declspec(dllexport)
    #elif defined(NAVSTACK_SHARED)
        #define NAVSTACK_API __declspec(dllimport)
    #else
        #define NAVSTACK_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef NAVSTACK_BUILDING_SHARED
        #define NAVSTACK_API __attribute__((visibility("default")))
    #else
        #define NAVSTACK_API
    #endif
#else
    #define NAVSTACK_API
#endif

#endif // NAVSTACK_EXPORT_HPP
