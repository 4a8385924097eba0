//! # Inline Printing
//!
//! Renders span trees and todo states back to markup.
//!
//! | Span                 | Output                        |
//! |----------------------|-------------------------------|
//! | `Normal(t)`          | `t`                           |
//! | styled, delimiter d  | `d` children `d`              |
//! | `Link{name, ...}`    | `|name|`                      |
//! | `TextExtra(d, ...)`  | `d` children, never closed    |
//!
//! Link handlers and paths are not printed; they only appear in the
//! structured exports.

#include "format/printer.hpp"

#include <type_traits>

namespace todo::format {

auto Printer::span(const lexer::Span& span) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, lexer::Normal>) {
                return node.text;
            } else if constexpr (std::is_same_v<T, lexer::Link>) {
                return "|" + node.name + "|";
            } else if constexpr (std::is_same_v<T, lexer::TextExtra>) {
                return std::string(1, node.delimiter) + spans(node.children);
            } else {
                std::string delimiter(1, T::delimiter);
                return delimiter + spans(node.children) + delimiter;
            }
        },
        span.kind);
}

auto Printer::spans(const lexer::Spans& spans) -> std::string {
    std::string out;
    for (const auto& s : spans) {
        out += span(s);
    }
    return out;
}

auto Printer::text(const parser::Text& text) -> std::string {
    return spans(text.spans);
}

auto Printer::state_text(const std::optional<parser::TodoState>& state) const -> std::string {
    if (state) {
        return state->value;
    }
    if (config_.todo_state_ops) {
        return config_.todo_state_ops->default_state;
    }
    return " ";
}

auto Printer::todo_state(const std::optional<parser::TodoState>& state) const -> std::string {
    bool brackets = !config_.todo_state_ops || config_.todo_state_ops->brackets;
    auto value = state_text(state);
    return brackets ? "[" + value + "]" : value;
}

auto Printer::bullet_point() const -> std::string {
    return config_.bullet_point.value_or("-");
}

} // namespace todo::format
