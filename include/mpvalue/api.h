// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - DLL export/import macros for mpvalue

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the mpvalue library.
///
/// Usage:
/// - When building mpvalue as a SHARED library:
///   - CMake defines MPVALUE_EXPORTS (private) and MPVALUE_SHARED (public)
///   - Functions/classes marked with MPVALUE_API will be exported
///
/// - When using mpvalue as a SHARED library:
///   - Link against the mpvalue target (CMake propagates MPVALUE_SHARED)
///
/// - When building/using as a STATIC library:
///   - No macros defined, MPVALUE_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef MPVALUE_SHARED
        #ifdef MPVALUE_EXPORTS
            #define MPVALUE_API __declspec(dllexport)
        #else
            #define MPVALUE_API __declspec(dllimport)
        #endif
    #else
        #define MPVALUE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MPVALUE_SHARED) && defined(MPVALUE_EXPORTS)
        #define MPVALUE_API __attribute__((visibility("default")))
    #else
        #define MPVALUE_API
    #endif
#else
    #define MPVALUE_API
#endif
