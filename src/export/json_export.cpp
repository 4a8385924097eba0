#include "export/json_export.hpp"
#include "links/links.hpp"

#include <type_traits>

namespace todo::exporter {

using json::json_array;
using json::json_bool;
using json::json_null;
using json::json_object;
using json::json_string;

auto spans_to_json(const lexer::Spans& spans, const config::Config& config) -> json::JsonValue {
    auto arr = json_array();
    for (const auto& span : spans) {
        arr.push(span_to_json(span, config));
    }
    return arr;
}

auto span_to_json(const lexer::Span& span, const config::Config& config) -> json::JsonValue {
    auto obj = json_object();
    obj.set("kind", json_string(std::string(lexer::span_kind_name(span))));

    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, lexer::Normal>) {
                obj.set("text", json_string(node.text));
            } else if constexpr (std::is_same_v<T, lexer::Link>) {
                obj.set("name", json_string(node.name));
                obj.set("handler", json_string(node.handler));
                obj.set("path", json_string(node.path));
                obj.set("known", json_bool(links::is_known(node.handler, config)));
            } else if constexpr (std::is_same_v<T, lexer::TextExtra>) {
                obj.set("delimiter", json_string(std::string(1, node.delimiter)));
                obj.set("children", spans_to_json(node.children, config));
            } else {
                obj.set("children", spans_to_json(node.children, config));
            }
        },
        span.kind);

    return obj;
}

auto state_to_json(const std::optional<parser::TodoState>& state) -> json::JsonValue {
    if (!state) {
        return json_null();
    }
    auto obj = json_object();
    obj.set("kind",
            json_string(state->kind == parser::TodoState::Kind::Defined ? "defined" : "other"));
    obj.set("value", json_string(state->value));
    return obj;
}

auto heading_to_json(const parser::Heading& heading, const config::Config& config)
    -> json::JsonValue {
    auto body = json_array();
    for (const auto& entry : heading.body) {
        auto obj = json_object();
        obj.set("type", json_string(std::string(parser::entry_kind_name(entry))));

        if (entry.is<parser::Todo>()) {
            const auto& todo = entry.as<parser::Todo>();
            obj.set("state", state_to_json(todo.state));
            obj.set("description", spans_to_json(todo.description.spans, config));
        } else if (entry.is<parser::Bullet>()) {
            obj.set("text", spans_to_json(entry.as<parser::Bullet>().text.spans, config));
        } else {
            obj.set("text", spans_to_json(entry.as<parser::Text>().spans, config));
        }
        body.push(std::move(obj));
    }

    auto obj = json_object();
    obj.set("name", json_string(heading.name));
    obj.set("body", std::move(body));
    return obj;
}

auto to_json(const parser::File& file, const config::Config& config) -> json::JsonValue {
    auto headings = json_array();
    for (const auto& heading : file.headings) {
        headings.push(heading_to_json(heading, config));
    }

    auto root = json_object();
    root.set("headings", std::move(headings));
    return root;
}

} // namespace todo::exporter
