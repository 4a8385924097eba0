#include "export/widget_export.hpp"
#include "format/printer.hpp"
#include "links/links.hpp"

#include <type_traits>

namespace todo::exporter {

namespace {

auto children_to_widget(const lexer::Spans& spans, const WidgetOptions& options) -> std::string {
    std::string out;
    for (const auto& span : spans) {
        out += span_to_widget(span, options);
    }
    return out;
}

} // namespace

auto widget_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

auto widget_style(char delimiter) -> std::string_view {
    switch (delimiter) {
    case '`':
        return "color: #c3e88d;";
    case '_':
        return "text-decoration: underline;";
    case '-':
        return "text-decoration: line-through;";
    case '*':
        return "font-weight: bold;";
    case '/':
        return "font-style: italic;";
    default:
        return "";
    }
}

auto link_command(const lexer::Link& link, const WidgetOptions& options) -> std::string {
    auto command = "todo open-link-raw " + links::shell_quote(link.handler) + " " +
                   links::shell_quote(link.path);
    if (!options.config_path.empty()) {
        command += " " + links::shell_quote("--config=" + options.config_path);
    }
    return command + " &";
}

auto span_to_widget(const lexer::Span& span, const WidgetOptions& options) -> std::string {
    return std::visit(
        [&options](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, lexer::Normal>) {
                return "(label :halign \"start\" :text \"" + widget_escape(node.text) + "\")";
            } else if constexpr (std::is_same_v<T, lexer::Link>) {
                return "(button :style \"all: unset\" :onclick \"" +
                       widget_escape(link_command(node, options)) +
                       "\" :halign \"start\" (label :style \"text-decoration: underline; "
                       "text-decoration-color: #ff5370;\" :halign \"start\" :text \"" +
                       widget_escape(node.name) + "\"))";
            } else if constexpr (std::is_same_v<T, lexer::TextExtra>) {
                return "(box :space-evenly false :halign \"start\" (label :halign \"start\" "
                       ":text \"" +
                       widget_escape(std::string(1, node.delimiter)) + "\") " +
                       children_to_widget(node.children, options) + ")";
            } else {
                return "(box :style \"" + std::string(widget_style(T::delimiter)) +
                       "\" :halign \"start\" " + children_to_widget(node.children, options) + ")";
            }
        },
        span.kind);
}

auto to_widget(const parser::File& file, const config::Config& config,
               const WidgetOptions& options) -> json::JsonValue {
    format::Printer printer(config);
    auto todos = json::json_array();

    for (const auto& heading : file.headings) {
        for (const auto& entry : heading.body) {
            if (!entry.is<parser::Todo>()) {
                continue;
            }
            const auto& todo = entry.as<parser::Todo>();

            auto description = json::json_array();
            for (const auto& span : todo.description.spans) {
                description.push(json::json_string(span_to_widget(span, options)));
            }

            auto obj = json::json_object();
            obj.set("state", json::json_string(printer.state_text(todo.state)));
            obj.set("description", std::move(description));
            todos.push(std::move(obj));
        }
    }
    return todos;
}

} // namespace todo::exporter
