//! # JSON Serializer
//!
//! Converts `JsonValue` trees to compact or pretty-printed text.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Other control (0x00-0x1F) | `\uXXXX` |
//!
//! Bytes at or above 0x80 pass through unchanged, so UTF-8 text survives.

#include "json/json_value.hpp"

#include <cstdio>

namespace todo::json {

namespace {

void write_escaped(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

/// Writes `value`; `indent` of 0 selects the compact form.
void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
        return;
    }
    if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
        return;
    }
    if (value.is_int()) {
        out += std::to_string(value.as_int());
        return;
    }
    if (value.is_string()) {
        write_escaped(value.as_string(), out);
        return;
    }

    bool is_array = value.is_array();
    if (value.size() == 0) {
        out += is_array ? "[]" : "{}";
        return;
    }

    std::string inner(static_cast<size_t>((depth + 1) * indent), ' ');
    std::string outer(static_cast<size_t>(depth * indent), ' ');
    auto separator = [&](bool first) {
        if (!first) {
            out += ',';
        }
        if (indent > 0) {
            out += '\n';
            out += inner;
        }
    };

    out += is_array ? '[' : '{';
    if (is_array) {
        bool first = true;
        for (const auto& elem : value.as_array()) {
            separator(first);
            first = false;
            serialize(elem, out, indent, depth + 1);
        }
    } else {
        bool first = true;
        for (const auto& [key, val] : value.as_object()) {
            separator(first);
            first = false;
            write_escaped(key, out);
            out += indent > 0 ? ": " : ":";
            serialize(val, out, indent, depth + 1);
        }
    }
    if (indent > 0) {
        out += '\n';
        out += outer;
    }
    out += is_array ? ']' : '}';
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent > 0 ? indent : 2, 0);
    return out;
}

} // namespace todo::json
