//! # JSON Values
//!
//! A compact JSON document model used by the structured exports and the
//! `config` command. Values are move-only; arrays and objects are boxed so
//! the variant can hold recursive structures.
//!
//! Numbers are 64-bit integers: nothing the todo engine emits is fractional.
//! Object keys are kept sorted, which makes serialized output stable.
//!
//! ## Example
//!
//! ```cpp
//! auto todo = json_object();
//! todo.set("state", json_string("DONE"));
//! todo.set("description", json_array());
//! std::string text = todo.to_string_pretty();
//! ```

#ifndef TODO_JSON_JSON_VALUE_HPP
#define TODO_JSON_JSON_VALUE_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace todo::json {

struct JsonValue;

/// An ordered sequence of values.
using JsonArray = std::vector<JsonValue>;

/// A key-sorted map of values.
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON value: null, boolean, integer, string, array or object.
struct JsonValue {
    using Null = std::monostate;

    std::variant<Null, bool, int64_t, std::string, Box<JsonArray>, Box<JsonObject>> data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_int() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    //
    // Each throws `std::bad_variant_access` on a type mismatch.
    // ========================================================================

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_int() const -> int64_t {
        return std::get<int64_t>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Looks up a key of an object. Returns `nullptr` when absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Indexes an array. Throws `std::out_of_range` when out of bounds.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Number of elements of an array or object, 0 otherwise.
    [[nodiscard]] auto size() const -> size_t;

    // ========================================================================
    // Mutation
    // ========================================================================

    /// Appends to an array. Throws `std::bad_variant_access` if not an array.
    void push(JsonValue value) {
        std::get<Box<JsonArray>>(data)->push_back(std::move(value));
    }

    /// Sets a key of an object. Throws `std::bad_variant_access` if not an object.
    void set(const std::string& key, JsonValue value) {
        (*std::get<Box<JsonObject>>(data))[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact JSON text with no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Indented JSON text, one member per line.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace todo::json

#endif // TODO_JSON_JSON_VALUE_HPP
