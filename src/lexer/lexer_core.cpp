//! # Lexer Core
//!
//! This file implements character access and the line-level rules:
//!
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Line dispatch**: `tokenize()` skips leading spaces and picks a rule
//!   from the first character of each line
//! - **Line rules**: headings, todos, bullets and paragraph text
//!
//! Inline markup inside bullets, todo descriptions and paragraphs is lexed
//! in `lexer_inline.cpp`.

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace todo::lexer {

Lexer::Lexer(const Source& source) : source_(source) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_at(size_t offset) const -> char {
    return source_.at(offset);
}

auto Lexer::advance() -> char {
    if (is_at_end()) {
        return '\0';
    }
    return source_.at(pos_++);
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::at_line_end() const -> bool {
    return is_at_end() || peek() == '\n';
}

void Lexer::skip_spaces() {
    while (!is_at_end() && peek() == ' ') {
        ++pos_;
    }
}

auto Lexer::consume_until(char stop) -> std::string {
    std::string text;
    while (!at_line_end() && peek() != stop) {
        text += advance();
    }
    return text;
}

auto Lexer::make_token(TokenKind kind, size_t start) const -> Token {
    return Token{.kind = kind, .location = source_.location(start), .value = std::monostate{}};
}

// ============================================================================
// Line Dispatch
// ============================================================================

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    pos_ = 0;

    while (!is_at_end()) {
        skip_spaces();
        if (is_at_end()) {
            break;
        }

        switch (peek()) {
        case '\n':
            tokens.push_back(make_token(TokenKind::Newline, pos_));
            advance();
            break;
        case '#':
            lex_heading(tokens);
            break;
        case '[':
            lex_todo(tokens);
            break;
        case '-':
            lex_bullet(tokens);
            break;
        default:
            lex_text(tokens);
            break;
        }
    }

    TODO_LOG_TRACE("lexer", "Lexed " << tokens.size() << " line tokens from "
                                     << source_.filename());
    return tokens;
}

// ============================================================================
// Line Rules
// ============================================================================

void Lexer::lex_heading(std::vector<Token>& tokens) {
    auto start = pos_;
    advance(); // '#'
    skip_spaces();

    std::string name = consume_until('\n');
    while (!name.empty() && name.back() == ' ') {
        name.pop_back();
    }

    auto heading = make_token(TokenKind::Heading, start);
    heading.value = std::move(name);
    tokens.push_back(std::move(heading));

    // A heading on the last line still closes with a newline
    if (is_at_end()) {
        tokens.push_back(make_token(TokenKind::Newline, pos_));
    }
}

void Lexer::lex_todo(std::vector<Token>& tokens) {
    tokens.push_back(make_token(TokenKind::BracketOpen, pos_));
    advance(); // '['
    skip_spaces();

    auto inside = make_token(TokenKind::Inside, pos_);
    inside.value = consume_until(']');
    tokens.push_back(std::move(inside));

    if (peek() != ']') {
        return;
    }
    tokens.push_back(make_token(TokenKind::BracketClose, pos_));
    advance();
    skip_spaces();

    // The description is always present, possibly empty
    auto body = make_token(TokenKind::Text, pos_);
    body.value = lex_inline();
    tokens.push_back(std::move(body));
}

void Lexer::lex_bullet(std::vector<Token>& tokens) {
    auto bullet = make_token(TokenKind::Bullet, pos_);
    advance(); // '-'
    skip_spaces();
    bullet.value = lex_inline();
    tokens.push_back(std::move(bullet));
}

void Lexer::lex_text(std::vector<Token>& tokens) {
    auto text = make_token(TokenKind::Text, pos_);
    text.value = lex_inline();
    tokens.push_back(std::move(text));
}

auto lex(std::string_view text) -> std::vector<Token> {
    auto source = Source::from_string(std::string(text));
    Lexer lexer(source);
    return lexer.tokenize();
}

} // namespace todo::lexer
