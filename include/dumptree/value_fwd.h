// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for the Value type
///
/// Headers that only pass Values around (the parser API, for one) include
/// this instead of value.h to keep the immer container headers out of their
/// include graph.

#pragma once

#include "dumptree_config.h"

#include <immer/memory_policy.hpp>

namespace dumptree {

// ============================================================
// Memory Policies
// ============================================================

/// Non-atomic refcount + no locks: fastest, single-threaded only
using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

/// Atomic refcount + spinlock free list
using thread_safe_memory_policy = immer::default_memory_policy;

#if DUMPTREE_THREAD_SAFE_VALUES
using value_memory_policy = thread_safe_memory_policy;
#else
using value_memory_policy = unsafe_memory_policy;
#endif

// ============================================================
// Value Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

using Value = BasicValue<value_memory_policy>;

} // namespace dumptree
