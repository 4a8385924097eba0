//! # Todo Parser
//!
//! Recursive-descent parser from line tokens to a `File` tree.
//!
//! The parser makes a single forward pass. Rules are chosen with the
//! `rules::check_*` predicates, and the first failure aborts the parse with
//! a `ParseError` carrying the full rule path. There is no recovery and no
//! partial document.
//!
//! Todo states are resolved against the configured alias table while
//! parsing: a match becomes `TodoState::Defined`, anything else stays
//! `TodoState::Other`, and empty brackets leave the state unset.
//!
//! ## Example
//!
//! ```cpp
//! auto tokens = lexer::lex("# Work\n[x] ship it\n");
//! auto result = parser::parse(config, std::move(tokens));
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#ifndef TODO_PARSER_PARSER_HPP
#define TODO_PARSER_PARSER_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "lexer/token.hpp"
#include "parser/document.hpp"
#include "parser/parse_error.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace todo::parser {

class Parser {
public:
    /// The config is borrowed and must outlive the parser.
    Parser(std::vector<lexer::Token> tokens, const config::Config& config);

    // Parse the entire token stream
    [[nodiscard]] auto parse_file() -> Result<File, ParseError>;

    // Parse single rules (for testing)
    [[nodiscard]] auto parse_heading() -> Result<Heading, ParseError>;
    [[nodiscard]] auto parse_todo() -> Result<Todo, ParseError>;

    [[nodiscard]] auto is_at_end() const -> bool {
        return pos_ >= tokens_.size();
    }

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    const config::Config& config_;

    // Token access
    [[nodiscard]] auto remaining() const -> std::span<const lexer::Token>;
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;

    /// Location of the next token, or of the last one at the end of input.
    [[nodiscard]] auto current_location() const -> SourceLocation;

    auto expect(lexer::TokenKind kind, const std::string& description)
        -> Result<lexer::Token, ParseError>;

    /// Consumes the newline closing an entry. The end of input also closes it.
    auto expect_line_end() -> Result<bool, ParseError>;

    [[nodiscard]] auto unexpected(std::vector<std::string> expected) const -> ParseError;

    // Rules
    auto parse_under_heading() -> Result<UnderHeading, ParseError>;
    auto parse_todo_state() -> Result<std::optional<TodoState>, ParseError>;
    auto parse_bullet() -> Result<Bullet, ParseError>;
    auto parse_text() -> Result<Text, ParseError>;
};

/// Resolves raw bracket contents against the alias table.
/// Returns `std::nullopt` for empty contents.
[[nodiscard]] auto resolve_state(const std::string& raw, const config::Config& config)
    -> std::optional<TodoState>;

/// Parses a complete token stream.
[[nodiscard]] auto parse(const config::Config& config, std::vector<lexer::Token> tokens)
    -> Result<File, ParseError>;

} // namespace todo::parser

#endif // TODO_PARSER_PARSER_HPP
