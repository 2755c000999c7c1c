// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// dump_parser.cpp - Recursive-descent parser for toString()-style object dumps

#include <dumptree/dump_parser.h>
#include <dumptree/value.h>

#include <cctype>
#include <charconv>
#include <cmath>

namespace dumptree {

ParseError::ParseError(ParseErrorKind kind, const std::string& message, std::size_t position)
    : std::runtime_error(message), kind_(kind), position_(position)
{
}

namespace {

constexpr std::string_view kNullMarker = "<null>";

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool is_key_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Class labels may be qualified (com.acme.Address) or nested (Outer$Inner)
bool is_class_name_char(char c)
{
    return is_key_char(c) || c == '.' || c == '$';
}

/// Whole token must be a finite decimal literal; "inf", "nan" and hex stay strings
std::optional<double> parse_number(std::string_view token)
{
    if (token.empty()) {
        return std::nullopt;
    }
    if (token.front() == '+') {
        token.remove_prefix(1);
        if (token.empty() || token.front() == '+' || token.front() == '-') {
            return std::nullopt;
        }
    }

    double value = 0.0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/// True if the scope holds at least one key=value entry at its own level
bool is_record_scope(std::string_view scope)
{
    int depth = 0;
    for (char c : scope) {
        if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == '=' && depth == 0) {
            return true;
        }
    }
    return false;
}

Value parse_list_scope(std::string_view scope, const ParseOptions& options)
{
    auto items = ValueList{}.transient();
    for (const auto& token : tokenize_scope(scope)) {
        items.push_back(ValueBox{parse_dump_item(token, options)});
    }
    return Value{items.persistent()};
}

/// Brackets from the first '[' must close exactly at the last character
void check_balanced(std::string_view text, std::size_t open)
{
    const std::size_t last = text.size() - 1;
    int depth = 0;

    for (std::size_t i = open; i < text.size(); ++i) {
        if (text[i] == '[') {
            ++depth;
        } else if (text[i] == ']') {
            --depth;
            if (depth == 0 && i != last) {
                throw ParseError(ParseErrorKind::Malformed,
                                 "content after closing bracket at position " + std::to_string(i), i);
            }
        }
    }

    if (depth != 0) {
        throw ParseError(ParseErrorKind::Malformed,
                         std::to_string(depth) + " unclosed '[' at end of input", text.size());
    }
}

} // anonymous namespace

// ============================================================
// Parsing stages
// ============================================================

std::string normalize_dump(std::string_view input)
{
    std::string text;
    text.reserve(input.size());
    for (std::size_t i = 0; i < input.size();) {
        if (input.compare(i, kNullMarker.size(), kNullMarker) == 0) {
            text += "null";
            i += kNullMarker.size();
        } else {
            text += input[i++];
        }
    }

    // key=ClassName[  ->  key=[
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        result += text[i];
        if (text[i] != '=' || i == 0 || !is_key_char(text[i - 1])) {
            continue;
        }
        std::size_t j = i + 1;
        while (j < text.size() && is_class_name_char(text[j])) {
            ++j;
        }
        if (j > i + 1 && j < text.size() && text[j] == '[') {
            i = j - 1;
        }
    }
    return result;
}

std::vector<std::string> tokenize_scope(std::string_view scope)
{
    std::vector<std::string> tokens;
    std::string current;
    int depth = 0;

    auto flush = [&] {
        auto token = trim(current);
        if (!token.empty()) {
            tokens.emplace_back(token);
        }
        current.clear();
    };

    for (char c : scope) {
        if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            flush();
            continue;
        }
        current += c;
    }
    flush();

    return tokens;
}

Value parse_dump_value(std::string_view token, const ParseOptions& options)
{
    token = trim(token);

    if (token == "null") return Value{};
    if (token == "true") return Value{true};
    if (token == "false") return Value{false};

    if (auto number = parse_number(token)) {
        return Value{*number};
    }

    if (token.size() >= 2 && token.front() == '[' && token.back() == ']') {
        return parse_list_scope(token.substr(1, token.size() - 2), options);
    }

    return Value{token};
}

Value parse_dump_item(std::string_view token, const ParseOptions& options)
{
    token = trim(token);

    const auto eq = token.find('=');
    if (eq == std::string_view::npos) {
        return parse_dump_value(token, options);
    }

    const auto open = token.find('[');
    if (open != std::string_view::npos && token.back() == ']') {
        // Keyed sub-scope: the key is the text before '[' up to its own '='
        const auto head = token.substr(0, open);
        const auto key = trim(head.substr(0, head.find('=')));
        const auto interior = token.substr(open + 1, token.size() - open - 2);

        Value nested = is_record_scope(interior) ? parse_dump_object(interior, options)
                                                 : parse_list_scope(interior, options);
        return Value{ValueMap{}.set(std::string{key}, ValueBox{std::move(nested)})};
    }

    // Split at the first '=' only; later ones belong to the value
    const auto key = trim(token.substr(0, eq));
    return Value{ValueMap{}.set(std::string{key}, ValueBox{parse_dump_value(token.substr(eq + 1), options)})};
}

Value parse_dump_object(std::string_view scope, const ParseOptions& options)
{
    auto fields = ValueMap{}.transient();
    auto bare = ValueList{}.transient();

    for (const auto& token : tokenize_scope(scope)) {
        Value item = parse_dump_item(token, options);

        if (auto* entry = item.get_if<ValueMap>()) {
            for (const auto& [key, box] : *entry) {
                fields.set(key, box);
            }
        } else if (options.bare_entries_key) {
            bare.push_back(ValueBox{std::move(item)});
        } else {
            detail::log_access_error("parse_dump_object", "dropped bare token '" + token + "'");
        }
    }

    if (options.bare_entries_key && bare.size() > 0) {
        fields.set(*options.bare_entries_key, ValueBox{Value{bare.persistent()}});
    }

    return Value{fields.persistent()};
}

// ============================================================
// Entry points
// ============================================================

Value parse_dump(std::string_view input, const ParseOptions& options)
{
    const std::string text = normalize_dump(trim(input));

    const auto open = text.find('[');
    if (open == std::string::npos) {
        throw ParseError(ParseErrorKind::NoOpeningBracket, "no '[' found in input");
    }

    if (options.strict) {
        check_balanced(text, open);
    } else if (text.back() != ']') {
        detail::log_access_error("parse_dump", "input does not end with ']', dropping last character '" +
                                               text.substr(text.size() - 1) + "'");
    }

    // Everything between the first '[' and the final character
    const std::size_t last = text.size() - 1;
    const std::string_view scope = last > open
        ? std::string_view{text}.substr(open + 1, last - open - 1)
        : std::string_view{};

    return parse_dump_object(scope, options);
}

Value parse_dump_strict(std::string_view input)
{
    ParseOptions options;
    options.strict = true;
    return parse_dump(input, options);
}

std::optional<Value> try_parse_dump(std::string_view input, std::string* error_out, const ParseOptions& options)
{
    try {
        return parse_dump(input, options);
    } catch (const ParseError& e) {
        if (error_out) *error_out = e.what();
        return std::nullopt;
    }
}

} // namespace dumptree
