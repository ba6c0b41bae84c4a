// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - DLL export/import macros for jsoncmp

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for jsoncmp library.
///
/// Usage:
/// - When building jsoncmp as a SHARED library:
///   - CMake automatically defines JSONCMP_EXPORTS (private) and JSONCMP_SHARED (public)
///   - Functions/classes marked with JSONCMP_API will be exported
///
/// - When using jsoncmp as a SHARED library:
///   - Link against jsoncmp target (CMake propagates JSONCMP_SHARED)
///   - Functions/classes marked with JSONCMP_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSONCMP_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSONCMP_SHARED
        #ifdef JSONCMP_EXPORTS
            #define JSONCMP_API __declspec(dllexport)
        #else
            #define JSONCMP_API __declspec(dllimport)
        #endif
    #else
        #define JSONCMP_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSONCMP_SHARED) && defined(JSONCMP_EXPORTS)
        #define JSONCMP_API __attribute__((visibility("default")))
    #else
        #define JSONCMP_API
    #endif
#else
    #define JSONCMP_API
#endif
