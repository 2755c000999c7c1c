// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value rendering and JSON output

#include <dumptree/value.h>
#include <dumptree/serialization.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>    // for std::snprintf
#include <sstream>
#include <vector>

namespace dumptree {

namespace {

using SortedEntries = std::vector<std::pair<std::string_view, const Value*>>;

SortedEntries sorted_entries(const ValueMap& map)
{
    SortedEntries entries;
    entries.reserve(map.size());
    for (const auto& [key, box] : map) {
        entries.emplace_back(key, &box.get());
    }
    std::ranges::sort(entries, {}, &SortedEntries::value_type::first);
    return entries;
}

// Shortest representation that round-trips: 30, 2.5, 1e+21
std::string format_number(double d)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        return std::to_string(d);
    }
    return std::string(buf, end);
}

bool is_container(const Value& val)
{
    return val.is_object() || val.is_list();
}

} // anonymous namespace

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Number: return "number";
        case ValueKind::Bool:   return "bool";
        case ValueKind::String: return "string";
        case ValueKind::Object: return "object";
        case ValueKind::List:   return "list";
        case ValueKind::Null:   return "null";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, child] : sorted_entries(arg)) {
                if (!first) out += ", ";
                first = false;
                out += key;
                out += ": ";
                out += value_to_string(*child);
            }
            return out + "}";
        } else if constexpr (std::is_same_v<T, ValueList>) {
            std::string out = "[";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) out += ", ";
                out += value_to_string(*arg[i]);
            }
            return out + "]";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, std::ostream& os, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    if (auto* map = val.get_if<ValueMap>()) {
        if (map->empty()) {
            os << indent << "{}\n";
            return;
        }
        for (const auto& [key, child] : sorted_entries(*map)) {
            if (is_container(*child) && child->size() > 0) {
                os << indent << key << ":\n";
                print_value(*child, os, depth + 1);
            } else {
                os << indent << key << ": " << value_to_string(*child) << "\n";
            }
        }
        return;
    }

    if (auto* list = val.get_if<ValueList>()) {
        if (list->empty()) {
            os << indent << "[]\n";
            return;
        }
        for (std::size_t i = 0; i < list->size(); ++i) {
            const Value& child = *(*list)[i];
            if (is_container(child) && child.size() > 0) {
                os << indent << "[" << i << "]:\n";
                print_value(child, os, depth + 1);
            } else {
                os << indent << "[" << i << "]: " << value_to_string(child) << "\n";
            }
        }
        return;
    }

    os << indent << value_to_string(val) << "\n";
}

// ============================================================
// JSON Serialization
// ============================================================

namespace {

std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(arg)) {
                oss << format_number(arg);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.empty()) {
                oss << "{}";
                return;
            }
            oss << "{" << newline;
            bool first = true;
            for (const auto& [key, child] : sorted_entries(arg)) {
                if (!first) oss << "," << newline;
                first = false;
                oss << child_indent << "\"" << json_escape_string(std::string{key}) << "\":"
                    << space_after_colon;
                to_json_impl(*child, oss, compact, indent_level + 1);
            }
            oss << newline << indent << "}";
        } else if constexpr (std::is_same_v<T, ValueList>) {
            if (arg.empty()) {
                oss << "[]";
                return;
            }
            oss << "[" << newline;
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) oss << "," << newline;
                oss << child_indent;
                to_json_impl(*arg[i], oss, compact, indent_level + 1);
            }
            oss << newline << indent << "]";
        }
    }, val.data);
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

// ============================================================
// Explicit Template Instantiation
//
// Matches the extern template declaration in value.h so the
// member functions are compiled once, here.
// ============================================================

template struct BasicValue<value_memory_policy>;

} // namespace dumptree
