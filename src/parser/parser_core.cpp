//! # Parser Core
//!
//! Token navigation and error construction shared by every rule.
//!
//! | Method          | Description                                 |
//! |-----------------|---------------------------------------------|
//! | `peek()`        | Look at the current token                   |
//! | `advance()`     | Consume and return the current token        |
//! | `check()`       | Test the current token's kind               |
//! | `remaining()`   | Lookahead window for `rules::check_*`       |
//! | `expect()`      | Require a token kind or fail                |
//!
//! There is no end-of-input sentinel token, so callers test `is_at_end()`
//! before `peek()` or `advance()`.

#include "parser/parser.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace todo::parser {

Parser::Parser(std::vector<lexer::Token> tokens, const config::Config& config)
    : tokens_(std::move(tokens)), config_(config) {}

auto Parser::remaining() const -> std::span<const lexer::Token> {
    return std::span<const lexer::Token>(tokens_).subspan(std::min(pos_, tokens_.size()));
}

auto Parser::peek() const -> const lexer::Token& {
    return tokens_[pos_];
}

auto Parser::advance() -> const lexer::Token& {
    return tokens_[pos_++];
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return !is_at_end() && peek().is(kind);
}

auto Parser::current_location() const -> SourceLocation {
    if (!is_at_end()) {
        return peek().location;
    }
    if (!tokens_.empty()) {
        return tokens_.back().location;
    }
    return SourceLocation{};
}

auto Parser::unexpected(std::vector<std::string> expected) const -> ParseError {
    if (is_at_end()) {
        return ParseError{
            .cause = EndOfInput{.expected = std::move(expected), .location = current_location()},
            .frames = {}};
    }
    return ParseError{.cause = UnexpectedToken{.expected = std::move(expected),
                                               .got = lexer::describe_token(peek()),
                                               .location = peek().location},
                      .frames = {}};
}

auto Parser::expect(lexer::TokenKind kind, const std::string& description)
    -> Result<lexer::Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    return unexpected({description});
}

auto Parser::expect_line_end() -> Result<bool, ParseError> {
    if (is_at_end()) {
        return true;
    }
    if (check(lexer::TokenKind::Newline)) {
        advance();
        return true;
    }
    return unexpected({"newline"});
}

auto resolve_state(const std::string& raw, const config::Config& config)
    -> std::optional<TodoState> {
    if (raw.empty()) {
        return std::nullopt;
    }
    auto it = config.todo_state.find(raw);
    if (it != config.todo_state.end()) {
        return TodoState::defined(it->second);
    }
    return TodoState::other(raw);
}

auto parse(const config::Config& config, std::vector<lexer::Token> tokens)
    -> Result<File, ParseError> {
    Parser parser(std::move(tokens), config);
    auto result = parser.parse_file();
    if (is_ok(result)) {
        TODO_LOG_DEBUG("parser", "Parsed " << unwrap(result).headings.size() << " headings");
    } else {
        TODO_LOG_DEBUG("parser", "Parse failed: " << unwrap_err(result).message());
    }
    return result;
}

} // namespace todo::parser
