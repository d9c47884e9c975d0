// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform shared library export/import macros for live_tree.
///
/// Usage:
/// - When building live_tree as a SHARED library:
///   - CMake defines LIVE_TREE_EXPORTS (private) and LIVE_TREE_SHARED (public)
///   - Classes/functions marked with LIVE_TREE_API are exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, LIVE_TREE_API expands to nothing

#pragma once

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef LIVE_TREE_SHARED
        #ifdef LIVE_TREE_EXPORTS
            #define LIVE_TREE_API __declspec(dllexport)
        #else
            #define LIVE_TREE_API __declspec(dllimport)
        #endif
    #else
        #define LIVE_TREE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LIVE_TREE_SHARED) && defined(LIVE_TREE_EXPORTS)
        #define LIVE_TREE_API __attribute__((visibility("default")))
    #else
        #define LIVE_TREE_API
    #endif
#else
    #define LIVE_TREE_API
#endif

// ============================================================
// Template Export Helpers
// ============================================================

// Usage in header:  LIVE_TREE_EXTERN_TEMPLATE struct MyTemplate<int>;
#define LIVE_TREE_EXTERN_TEMPLATE extern template
