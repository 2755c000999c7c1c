// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Generic value tree produced by the dump parser and consumed by the differ.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool, Number (double), String
/// - List (immer::vector of boxed values, ordered)
/// - Object (immer::map from string key to boxed value, unordered)
///
/// Containers are immer persistent structures: a Value never changes after
/// construction, and copies share structure. The memory policy is selected in
/// dumptree_config.h (see DUMPTREE_THREAD_SAFE_VALUES).

#pragma once

#include "api.h"
#include "value_fwd.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace dumptree {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DUMPTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DUMPTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DUMPTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

/// Kind tag of a Value; the enumerator order matches the variant alternatives
enum class ValueKind : std::uint8_t { Number, Bool, String, Object, List, Null };

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueList = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_list    = BasicValueList<MemoryPolicy>;

    std::variant<double,
                 bool,
                 std::string,
                 value_map,
                 value_list,
                 std::monostate>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(double v) noexcept : data(std::in_place_type<double>, v) {}
    BasicValue(bool v) noexcept : data(std::in_place_type<bool>, v) {}

    // Integers are stored as Number
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    BasicValue(T v) noexcept : data(std::in_place_type<double>, static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string&& v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_list v) : data(std::move(v)) {}

    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue list(std::initializer_list<BasicValue> init) {
        auto t = value_list{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_list() const noexcept { return is<value_list>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* l = get_if<value_list>()) {
            if (index < l->size()) return (*l)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_list as_list(value_list default_val = {}) const {
        if (auto* p = get_if<value_list>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* l = get_if<value_list>()) return l->size();
        return 0;
    }
};

using ValueBox  = BasicValueBox<value_memory_policy>;
using ValueMap  = BasicValueMap<value_memory_policy>;
using ValueList = BasicValueList<value_memory_policy>;

/// Deep equality: same kind and equal contents. Lists compare in order,
/// objects by key set and per-key value.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Lower-case kind name ("null", "bool", "number", "string", "list", "object")
[[nodiscard]] DUMPTREE_API std::string_view kind_name(ValueKind kind) noexcept;

/// Single-line rendering: null, true, 30, 2.5, "text", [a, b], {k: v}
/// Object keys are printed in sorted order.
[[nodiscard]] DUMPTREE_API std::string value_to_string(const Value& val);

/// Print Value as an indented tree, one leaf per line
DUMPTREE_API void print_value(const Value& val, std::ostream& os = std::cout, std::size_t depth = 0);

// Instantiated once in value.cpp
extern template struct BasicValue<value_memory_policy>;

} // namespace dumptree
