// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural comparison of two object Values.
///
/// Every key present in either object is visited once:
/// - key only in the second object  -> MissingInFirst
/// - key only in the first object   -> MissingInSecond
/// - both values are objects        -> recurse, path grows by ".key"
/// - values differ (deep equality)  -> ValueMismatch
///
/// Lists are compared as whole values; a list that differs in any element is
/// reported once, at the list's own path, never per element.
///
/// Diffs come out in key iteration order of the underlying hash map, nested
/// diffs flattened in place. Do not rely on the order across sibling keys.

#pragma once

#include "api.h"
#include "value.h"

#include <iostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dumptree {

/// Key present only in the second object
struct MissingInFirst {
    std::string path;
    Value value_in_second;

    bool operator==(const MissingInFirst&) const = default;
};

/// Key present only in the first object
struct MissingInSecond {
    std::string path;
    Value value_in_first;

    bool operator==(const MissingInSecond&) const = default;
};

/// Key present in both objects with unequal values
struct ValueMismatch {
    std::string path;
    Value value_in_first;
    Value value_in_second;

    bool operator==(const ValueMismatch&) const = default;
};

using Diff = std::variant<MissingInFirst, MissingInSecond, ValueMismatch>;

/// Dot-joined path of the diff ("address.city")
[[nodiscard]] DUMPTREE_API const std::string& diff_path(const Diff& diff);

/// One-line rendering, e.g. "email: missing in first (second has \"a@x.com\")"
[[nodiscard]] DUMPTREE_API std::string diff_to_string(const Diff& diff);

// ============================================================
// DiffCollector - Collects diffs between two objects as a flat list
// ============================================================

class DUMPTREE_API DiffCollector {
private:
    std::vector<Diff> diffs_;

    void diff_map(const ValueMap& first, const ValueMap& second, std::string& current_path);
    void diff_entry(const ValueBox& first, const ValueBox& second, std::string& current_path);

public:
    /// Compare two objects, replacing any previously collected diffs
    /// @param path_prefix Prepended (with '.') to every reported path
    void diff(const ValueMap& first, const ValueMap& second, std::string_view path_prefix = {});

    /// Same as above for object Values
    /// @throws std::invalid_argument if either value is not an object
    void diff(const Value& first, const Value& second, std::string_view path_prefix = {});

    [[nodiscard]] const std::vector<Diff>& get_diffs() const;
    void clear();
    [[nodiscard]] bool has_changes() const;

    /// One diff_to_string() line per diff, or "(no changes)"
    void print_diffs(std::ostream& os = std::cout) const;
};

[[nodiscard]] DUMPTREE_API std::vector<Diff> diff_objects(const ValueMap& first, const ValueMap& second,
                                                          std::string_view path_prefix = {});

/// @throws std::invalid_argument if either value is not an object
[[nodiscard]] DUMPTREE_API std::vector<Diff> diff_values(const Value& first, const Value& second,
                                                         std::string_view path_prefix = {});

/// Early-exit check: true as soon as any diff would be reported
[[nodiscard]] DUMPTREE_API bool has_any_difference(const ValueMap& first, const ValueMap& second);

} // namespace dumptree
