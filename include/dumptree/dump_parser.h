// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file dump_parser.h
/// @brief Parser for bracketed object dumps in the style of Java's toString().
///
/// Accepted input looks like:
/// @code
///   Person[name=Alice, age=30, address=Address[city=NYC, zip=<null>], tags=[a, b]]
/// @endcode
///
/// and becomes an object Value:
/// @code
///   { name: "Alice", age: 30, address: { city: "NYC", zip: null }, tags: ["a", "b"] }
/// @endcode
///
/// Parsing is permissive by default: unbalanced brackets or truncated entries
/// yield a best-effort partial tree instead of an error. The only failure in
/// permissive mode is input without any '['. Set ParseOptions::strict (or call
/// parse_dump_strict) to reject unbalanced brackets as well.
///
/// The building blocks (normalize_dump, tokenize_scope, parse_dump_item, ...)
/// are public so tools can reuse one stage on its own.

#pragma once

#include "api.h"
#include "value_fwd.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dumptree {

enum class ParseErrorKind {
    NoOpeningBracket,  ///< input contains no '[' at all
    Malformed          ///< strict mode only: bracket imbalance
};

class DUMPTREE_API ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& message,
               std::size_t position = std::string::npos);

    [[nodiscard]] ParseErrorKind kind() const noexcept { return kind_; }

    /// Offset into the normalized input, or std::string::npos
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    ParseErrorKind kind_;
    std::size_t position_;
};

struct ParseOptions {
    /// Reject bracket imbalance with ParseErrorKind::Malformed
    bool strict = false;

    /// Tokens without '=' at object scope are dropped unless this is set,
    /// in which case they are collected in order into a list under this key.
    std::optional<std::string> bare_entries_key;
};

// ============================================================
// Parsing stages
// ============================================================

/// Replace "<null>" with "null" and rewrite "key=ClassName[" to "key=["
[[nodiscard]] DUMPTREE_API std::string normalize_dump(std::string_view input);

/// Split one scope at the commas that sit at bracket depth 0.
/// Tokens are whitespace-trimmed; empty tokens are not emitted.
[[nodiscard]] DUMPTREE_API std::vector<std::string> tokenize_scope(std::string_view scope);

/// Right-hand side of "key=value", or a bare list element:
/// null, true/false, number, [list], otherwise the token as a string
[[nodiscard]] DUMPTREE_API Value parse_dump_value(std::string_view token,
                                                  const ParseOptions& options = {});

/// One token of a scope: "key=[...]" and "key=value" give a single-entry
/// object, anything else is returned as a bare value
[[nodiscard]] DUMPTREE_API Value parse_dump_item(std::string_view token,
                                                 const ParseOptions& options = {});

/// Interior of one object scope, e.g. "city=NYC, zip=10001"
[[nodiscard]] DUMPTREE_API Value parse_dump_object(std::string_view scope,
                                                   const ParseOptions& options = {});

// ============================================================
// Entry points
// ============================================================

/// Parse a whole dump into an object Value
/// @throws ParseError if the input has no '[' (or, in strict mode, is unbalanced)
[[nodiscard]] DUMPTREE_API Value parse_dump(std::string_view input, const ParseOptions& options = {});

/// parse_dump with ParseOptions::strict forced on
[[nodiscard]] DUMPTREE_API Value parse_dump_strict(std::string_view input);

/// Non-throwing parse_dump
/// @param error_out If provided, receives the error message on failure
/// @return The parsed object, or std::nullopt on failure
[[nodiscard]] DUMPTREE_API std::optional<Value> try_parse_dump(std::string_view input,
                                                               std::string* error_out = nullptr,
                                                               const ParseOptions& options = {});

} // namespace dumptree
