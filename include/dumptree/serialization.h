// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON rendering of Value trees for tools and logs.
///
/// Usage:
/// @code
///   #include <dumptree/serialization.h>
///
///   Value tree = parse_dump("Person[name=Alice, age=30]");
///   std::string pretty  = to_json(tree);        // indented
///   std::string compact = to_json(tree, true);  // {"age":30,"name":"Alice"}
/// @endcode
///
/// Output rules:
/// - Object keys are written in sorted order, so output is stable across runs
/// - Numbers use the shortest form that round-trips; NaN and infinities become null
/// - Strings are escaped per RFC 8259 (control characters as \uXXXX)
///
/// Output only; there is no JSON reader.

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace dumptree {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
DUMPTREE_API std::string to_json(const Value& val, bool compact = false);

} // namespace dumptree
