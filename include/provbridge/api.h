// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - DLL export/import macros for provbridge

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for provbridge library.
///
/// Usage:
/// - When building provbridge as a SHARED library:
///   - CMake defines PROVBRIDGE_EXPORTS (private) and PROVBRIDGE_SHARED (public)
///   - Functions/classes marked with PROVBRIDGE_API will be exported
///
/// - When using provbridge as a SHARED library:
///   - Link against the provbridge target (CMake propagates PROVBRIDGE_SHARED)
///
/// - When building/using as a STATIC library:
///   - No macros defined, PROVBRIDGE_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PROVBRIDGE_SHARED
        #ifdef PROVBRIDGE_EXPORTS
            #define PROVBRIDGE_API __declspec(dllexport)
        #else
            #define PROVBRIDGE_API __declspec(dllimport)
        #endif
    #else
        #define PROVBRIDGE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(PROVBRIDGE_SHARED) && defined(PROVBRIDGE_EXPORTS)
        #define PROVBRIDGE_API __attribute__((visibility("default")))
    #else
        #define PROVBRIDGE_API
    #endif
#else
    #define PROVBRIDGE_API
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define PROVBRIDGE_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define PROVBRIDGE_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define PROVBRIDGE_DEPRECATED(msg)
#endif
