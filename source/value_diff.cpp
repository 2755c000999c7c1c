// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_diff.cpp - Structural diff between two object Values

#include <dumptree/value_diff.h>

#include <immer/algorithm.hpp>

#include <stdexcept>
#include <type_traits>

namespace dumptree {

namespace {

template <typename>
inline constexpr bool always_false_v = false;

// Appends ".key" ("key" at the root) and returns the length to restore
std::size_t push_key(std::string& path, const std::string& key)
{
    const auto saved = path.size();
    if (!path.empty()) {
        path += '.';
    }
    path += key;
    return saved;
}

} // anonymous namespace

const std::string& diff_path(const Diff& diff)
{
    return std::visit([](const auto& d) -> const std::string& { return d.path; }, diff);
}

std::string diff_to_string(const Diff& diff)
{
    return std::visit([](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, MissingInFirst>) {
            return d.path + ": missing in first (second has " + value_to_string(d.value_in_second) + ")";
        } else if constexpr (std::is_same_v<T, MissingInSecond>) {
            return d.path + ": missing in second (first has " + value_to_string(d.value_in_first) + ")";
        } else if constexpr (std::is_same_v<T, ValueMismatch>) {
            return d.path + ": value mismatch (first has " + value_to_string(d.value_in_first) +
                   ", second has " + value_to_string(d.value_in_second) + ")";
        } else {
            static_assert(always_false_v<T>, "unhandled Diff alternative");
        }
    }, diff);
}

// ============================================================
// DiffCollector Implementation
// ============================================================

void DiffCollector::diff(const ValueMap& first, const ValueMap& second, std::string_view path_prefix)
{
    diffs_.clear();

    // Same object compared to itself
    if (&first == &second) {
        return;
    }

    std::string current_path{path_prefix};
    current_path.reserve(current_path.size() + 64);
    diff_map(first, second, current_path);
}

void DiffCollector::diff(const Value& first, const Value& second, std::string_view path_prefix)
{
    const auto* first_map = first.get_if<ValueMap>();
    const auto* second_map = second.get_if<ValueMap>();

    if (!first_map || !second_map) {
        const Value& offender = first_map ? second : first;
        throw std::invalid_argument(std::string{"DiffCollector::diff: "} +
                                    (first_map ? "second" : "first") + " operand is a " +
                                    std::string{kind_name(offender.kind())} + ", expected an object");
    }

    diff(*first_map, *second_map, path_prefix);
}

const std::vector<Diff>& DiffCollector::get_diffs() const
{
    return diffs_;
}

void DiffCollector::clear()
{
    diffs_.clear();
}

bool DiffCollector::has_changes() const
{
    return !diffs_.empty();
}

void DiffCollector::print_diffs(std::ostream& os) const
{
    if (diffs_.empty()) {
        os << "  (no changes)\n";
        return;
    }
    for (const auto& d : diffs_) {
        os << "  " << diff_to_string(d) << "\n";
    }
}

void DiffCollector::diff_map(const ValueMap& first, const ValueMap& second, std::string& current_path)
{
    auto map_differ = immer::make_differ(
        // added: key only in second
        [&](const auto& kv) {
            const auto saved = push_key(current_path, kv.first);
            diffs_.emplace_back(MissingInFirst{current_path, kv.second.get()});
            current_path.resize(saved);
        },
        // removed: key only in first
        [&](const auto& kv) {
            const auto saved = push_key(current_path, kv.first);
            diffs_.emplace_back(MissingInSecond{current_path, kv.second.get()});
            current_path.resize(saved);
        },
        // changed: key retained in both
        [&](const auto& first_kv, const auto& second_kv) {
            const auto saved = push_key(current_path, first_kv.first);
            diff_entry(first_kv.second, second_kv.second, current_path);
            current_path.resize(saved);
        }
    );

    immer::diff(first, second, map_differ);
}

void DiffCollector::diff_entry(const ValueBox& first, const ValueBox& second, std::string& current_path)
{
    // Shared box: structurally shared subtree, nothing to report
    if (&first.get() == &second.get()) {
        return;
    }

    const Value& a = first.get();
    const Value& b = second.get();

    const auto* a_map = a.get_if<ValueMap>();
    const auto* b_map = b.get_if<ValueMap>();
    if (a_map && b_map) {
        diff_map(*a_map, *b_map, current_path);
        return;
    }

    // Lists and scalars compare as whole values
    if (a != b) {
        diffs_.emplace_back(ValueMismatch{current_path, a, b});
    }
}

// ============================================================
// Free functions
// ============================================================

std::vector<Diff> diff_objects(const ValueMap& first, const ValueMap& second, std::string_view path_prefix)
{
    DiffCollector collector;
    collector.diff(first, second, path_prefix);
    return collector.get_diffs();
}

std::vector<Diff> diff_values(const Value& first, const Value& second, std::string_view path_prefix)
{
    DiffCollector collector;
    collector.diff(first, second, path_prefix);
    return collector.get_diffs();
}

bool has_any_difference(const ValueMap& first, const ValueMap& second)
{
    // A diff is reported exactly when the trees are not deep-equal
    return first != second;
}

} // namespace dumptree
