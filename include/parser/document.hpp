//! # Document Tree
//!
//! The typed tree produced by the parser and consumed by the printer and
//! exporters.
//!
//! ```text
//! File
//! └── Heading (name)
//!     ├── Todo    (state?, description)
//!     ├── Bullet  (text)
//!     └── Text    (spans)
//! ```
//!
//! Every node owns its children by value. Nodes record the location of their
//! first token for diagnostics, but equality compares structure only, so a
//! reprinted and reparsed document compares equal to the original.

#ifndef TODO_PARSER_DOCUMENT_HPP
#define TODO_PARSER_DOCUMENT_HPP

#include "common.hpp"
#include "lexer/token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace todo::parser {

/// Inline-marked text: a paragraph, a bullet body or a todo description.
struct Text {
    lexer::Spans spans;
    SourceLocation location;

    [[nodiscard]] auto operator==(const Text& other) const -> bool {
        return spans == other.spans;
    }
};

/// A todo state after alias resolution.
struct TodoState {
    enum class Kind : uint8_t {
        Defined, ///< Raw text matched an alias; `value` is the alias target
        Other,   ///< No alias matched; `value` is the raw text
    };

    Kind kind;
    std::string value;

    [[nodiscard]] static auto defined(std::string value) -> TodoState {
        return TodoState{.kind = Kind::Defined, .value = std::move(value)};
    }

    [[nodiscard]] static auto other(std::string value) -> TodoState {
        return TodoState{.kind = Kind::Other, .value = std::move(value)};
    }

    [[nodiscard]] auto operator==(const TodoState& other) const -> bool = default;
};

/// `[state] description`. An empty bracket leaves `state` unset.
struct Todo {
    std::optional<TodoState> state;
    Text description;
    SourceLocation location;

    [[nodiscard]] auto operator==(const Todo& other) const -> bool {
        return state == other.state && description == other.description;
    }
};

/// `- text`
struct Bullet {
    Text text;
    SourceLocation location;

    [[nodiscard]] auto operator==(const Bullet& other) const -> bool {
        return text == other.text;
    }
};

/// One entry in a heading body.
struct UnderHeading {
    std::variant<Todo, Bullet, Text> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    [[nodiscard]] auto location() const -> SourceLocation;

    [[nodiscard]] auto operator==(const UnderHeading& other) const -> bool = default;
};

/// `# name` followed by its body, up to a blank line or the end of input.
struct Heading {
    std::string name;
    std::vector<UnderHeading> body;
    SourceLocation location;

    [[nodiscard]] auto operator==(const Heading& other) const -> bool {
        return name == other.name && body == other.body;
    }
};

/// A whole todo document.
struct File {
    std::vector<Heading> headings;

    [[nodiscard]] auto operator==(const File& other) const -> bool = default;
};

/// Returns `"todo"`, `"bullet"` or `"text"`.
[[nodiscard]] auto entry_kind_name(const UnderHeading& entry) -> std::string_view;

} // namespace todo::parser

#endif // TODO_PARSER_DOCUMENT_HPP
