// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file dumptree_config.h
/// @brief Compile-time configuration for dumptree and the immer containers it uses.
///
/// Every public dumptree header includes this file before any immer header,
/// so the settings below apply consistently to all translation units.
///
/// @note immer reads its configuration macros once, from the first immer header
///       a translation unit includes. Include dumptree headers before any direct
///       immer include, or the IMMER_* settings below are silently ignored.

#pragma once

// ============================================================
// Value Memory Policy
// ============================================================

/// @brief Select the memory policy used by dumptree::Value
///
/// 1 (default): atomic reference counting. Parsed trees and diff results
///              may be shared and read from several threads at once.
/// 0:           non-atomic reference counting and an unlocked free list.
///              Faster, but a tree must never be touched by two threads.
#ifndef DUMPTREE_THREAD_SAFE_VALUES
#define DUMPTREE_THREAD_SAFE_VALUES 1
#endif

#if !DUMPTREE_THREAD_SAFE_VALUES && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Report accessor misses and parser recoveries on stderr
///
/// Defaults to on in debug builds and off when NDEBUG is defined.
#ifndef DUMPTREE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DUMPTREE_VERBOSE_LOG 0
#  else
#    define DUMPTREE_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Drop per-node type tags (smaller nodes, no tag assertions)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DUMPTREE_CONFIG_VERBOSE
#if DUMPTREE_THREAD_SAFE_VALUES
#pragma message("dumptree: Value uses atomic reference counting")
#else
#pragma message("dumptree: Value uses single-threaded reference counting")
#endif

#if DUMPTREE_VERBOSE_LOG
#pragma message("dumptree: verbose stderr diagnostics ENABLED")
#endif
#endif // DUMPTREE_CONFIG_VERBOSE
