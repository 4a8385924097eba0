//! # Parse Errors
//!
//! A parse error is a single terminal cause plus the stack of grammar rules
//! that were active when it happened. Each rule appends its own frame while
//! the error propagates outward, so `frames` is ordered innermost first.
//!
//! ## Rendering
//!
//! ```text
//! expected ']', got newline at 2:3
//!   in Todo at 2:1
//!   in Heading at 1:1
//!   in File at 1:1
//! ```
//!
//! ## Codes
//!
//! | Cause                 | Code   |
//! |-----------------------|--------|
//! | `UnexpectedToken`     | `P001` |
//! | `EndOfInput`          | `P002` |
//! | `StructuralViolation` | `P003` |

#ifndef TODO_PARSER_PARSE_ERROR_HPP
#define TODO_PARSER_PARSE_ERROR_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace todo::parser {

/// The next token matched none of the expected descriptions.
struct UnexpectedToken {
    std::vector<std::string> expected;
    std::string got;
    SourceLocation location;
};

/// The token stream ended while a rule still needed input.
struct EndOfInput {
    std::vector<std::string> expected;
    SourceLocation location; ///< Location of the last token, if any.
};

/// Tokens that are individually valid but not allowed where they appear,
/// such as a heading inside a heading body.
struct StructuralViolation {
    std::string message;
    SourceLocation location;
};

/// One grammar rule on the error stack.
struct Frame {
    std::string rule;
    SourceLocation location;
};

struct ParseError {
    std::variant<UnexpectedToken, EndOfInput, StructuralViolation> cause;

    /// Enclosing rules, innermost first.
    std::vector<Frame> frames;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(cause);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(cause);
    }

    /// Stable diagnostic code: `P001`, `P002` or `P003`.
    [[nodiscard]] auto code() const -> std::string_view;

    /// One-line description of the cause, without location or frames.
    [[nodiscard]] auto message() const -> std::string;

    /// Where the cause occurred.
    [[nodiscard]] auto location() const -> SourceLocation;

    /// The cause followed by one `  in <Rule> at <line>:<col>` line per frame.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Appends the frame of the rule the error is leaving.
    auto push_frame(std::string rule, SourceLocation location) -> ParseError&;
};

/// Renders `{"a", "b"}` as `a or b` and longer lists as `one of a, b, c`.
[[nodiscard]] auto describe_expected(const std::vector<std::string>& expected) -> std::string;

} // namespace todo::parser

#endif // TODO_PARSER_PARSE_ERROR_HPP
