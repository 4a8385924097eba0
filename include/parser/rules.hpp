//! # Grammar Rules
//!
//! Applicability checks for every grammar rule. Each check looks at most two
//! tokens into the remaining stream and never consumes anything; the parser
//! picks a rule with these and only then commits to it.
//!
//! ```text
//! File         := Heading*
//! Heading      := HEADING NEWLINE UnderHeading* (NEWLINE | EOF)
//! UnderHeading := Todo | Bullet | Text
//! Todo         := BRACKET_OPEN INSIDE BRACKET_CLOSE TEXT (NEWLINE | EOF)
//! Bullet       := BULLET (NEWLINE | EOF)
//! Text         := TEXT (NEWLINE | EOF)
//! ```

#ifndef TODO_PARSER_RULES_HPP
#define TODO_PARSER_RULES_HPP

#include "lexer/token.hpp"

#include <span>

namespace todo::parser::rules {

using Window = std::span<const lexer::Token>;

[[nodiscard]] auto check_heading(Window tokens) -> bool;

/// `[` followed by the bracket contents.
[[nodiscard]] auto check_todo(Window tokens) -> bool;

[[nodiscard]] auto check_todo_state(Window tokens) -> bool;
[[nodiscard]] auto check_bullet(Window tokens) -> bool;
[[nodiscard]] auto check_text(Window tokens) -> bool;

/// A newline where an entry could start, which ends a heading body.
[[nodiscard]] auto check_blank_line(Window tokens) -> bool;

} // namespace todo::parser::rules

#endif // TODO_PARSER_RULES_HPP
