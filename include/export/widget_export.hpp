//! # Widget Export
//!
//! Renders every todo as a list of widget markup fragments for a desktop
//! widget bar. Each top-level span of a description becomes one fragment:
//!
//! | Span        | Fragment                                                   |
//! |-------------|------------------------------------------------------------|
//! | `Normal`    | `(label :halign "start" :text "...")`                      |
//! | styled      | `(box :style "<css>" :halign "start" <children>)`          |
//! | `Link`      | `(button ... :onclick "todo open-link-raw ..." (label ...))` |
//! | `TextExtra` | `(box ... (label :text "<delimiter>") <children>)`         |
//!
//! Activating a link button runs `todo open-link-raw '<handler>' '<path>'`,
//! which dispatches through the configured handler table. Both arguments are
//! shell-quoted, and `--config=` is forwarded when the export was rendered
//! from an explicit config file.

#ifndef TODO_EXPORT_WIDGET_EXPORT_HPP
#define TODO_EXPORT_WIDGET_EXPORT_HPP

#include "config/config.hpp"
#include "json/json_value.hpp"
#include "parser/document.hpp"

#include <string>
#include <string_view>

namespace todo::exporter {

struct WidgetOptions {
    std::string config_path; // Forwarded to open-link-raw when non-empty
};

/// `[{"state": "...", "description": ["(label ...)", ...]}, ...]` with one
/// element per todo, in document order.
[[nodiscard]] auto to_widget(const parser::File& file, const config::Config& config,
                             const WidgetOptions& options = {}) -> json::JsonValue;

/// Widget markup for one span tree.
[[nodiscard]] auto span_to_widget(const lexer::Span& span, const WidgetOptions& options = {})
    -> std::string;

/// Shell command run by a link button: `todo open-link-raw '<handler>' '<path>' &`.
[[nodiscard]] auto link_command(const lexer::Link& link, const WidgetOptions& options)
    -> std::string;

/// CSS applied to a styled span kind, e.g. `font-weight: bold;`.
[[nodiscard]] auto widget_style(char delimiter) -> std::string_view;

/// Escapes `"` and `\` for a widget string literal.
[[nodiscard]] auto widget_escape(std::string_view text) -> std::string;

} // namespace todo::exporter

#endif // TODO_EXPORT_WIDGET_EXPORT_HPP
