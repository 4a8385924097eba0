//! # Structured Export
//!
//! Converts a document tree into a JSON value with stable field names, for
//! external tools that walk the tree.
//!
//! ```json
//! {"headings": [
//!   {"name": "Work", "body": [
//!     {"type": "todo",
//!      "state": {"kind": "defined", "value": "DONE"},
//!      "description": [{"kind": "bold", "children": [{"kind": "normal", "text": "ship"}]}]},
//!     {"type": "bullet", "text": [...]},
//!     {"type": "text", "text": [...]}
//!   ]}
//! ]}
//! ```
//!
//! An unset todo state is `null`. Links carry `name`, `handler`, `path` and
//! whether the handler is `known` to the configuration; `text_extra` spans
//! carry their `delimiter`.

#ifndef TODO_EXPORT_JSON_EXPORT_HPP
#define TODO_EXPORT_JSON_EXPORT_HPP

#include "config/config.hpp"
#include "json/json_value.hpp"
#include "parser/document.hpp"

namespace todo::exporter {

[[nodiscard]] auto to_json(const parser::File& file, const config::Config& config)
    -> json::JsonValue;

[[nodiscard]] auto heading_to_json(const parser::Heading& heading, const config::Config& config)
    -> json::JsonValue;

[[nodiscard]] auto state_to_json(const std::optional<parser::TodoState>& state)
    -> json::JsonValue;

[[nodiscard]] auto span_to_json(const lexer::Span& span, const config::Config& config)
    -> json::JsonValue;

[[nodiscard]] auto spans_to_json(const lexer::Spans& spans, const config::Config& config)
    -> json::JsonValue;

} // namespace todo::exporter

#endif // TODO_EXPORT_JSON_EXPORT_HPP
