//! # JSON Value Implementation
//!
//! Lookup, size and structural equality for `JsonValue`. Serialization
//! lives in `json_serializer.cpp`.
//!
//! Values of different types are never equal. Arrays compare element by
//! element; objects compare as sorted key/value sequences.

#include "json/json_value.hpp"

namespace todo::json {

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it != obj.end() ? &it->second : nullptr;
}

auto JsonValue::size() const -> size_t {
    if (is_array()) {
        return as_array().size();
    }
    if (is_object()) {
        return as_object().size();
    }
    return 0;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_int()) {
        return as_int() == other.as_int();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    return as_object() == other.as_object();
}

} // namespace todo::json
