// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility macros for the dumptree library.
///
/// CMake defines DUMPTREE_SHARED (public) and DUMPTREE_EXPORTS (private) when
/// the library is built with DUMPTREE_BUILD_SHARED=ON. Static builds leave
/// both undefined and DUMPTREE_API expands to nothing.

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DUMPTREE_SHARED
        #ifdef DUMPTREE_EXPORTS
            #define DUMPTREE_API __declspec(dllexport)
        #else
            #define DUMPTREE_API __declspec(dllimport)
        #endif
    #else
        #define DUMPTREE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DUMPTREE_SHARED) && defined(DUMPTREE_EXPORTS)
        #define DUMPTREE_API __attribute__((visibility("default")))
    #else
        #define DUMPTREE_API
    #endif
#else
    #define DUMPTREE_API
#endif
