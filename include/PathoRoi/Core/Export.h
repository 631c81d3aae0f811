#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PATHOROI_BUILD_SHARED: when building PathoRoi as shared library
 *   - PATHOROI_USE_SHARED: when using PathoRoi as shared library
 *   - PATHOROI_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PATHOROI_BUILD_SHARED)
        #define PATHOROI_API __declspec(dllexport)
    #elif defined(PATHOROI_USE_SHARED)
        #define PATHOROI_API __declspec(dllimport)
    #else
        #define PATHOROI_API
    #endif
#else
    #if defined(PATHOROI_BUILD_SHARED)
        #define PATHOROI_API __attribute__((visibility("default")))
    #else
        #define PATHOROI_API
    #endif
#endif
