//! # Todo Lexer
//!
//! This module converts a todo document into a flat sequence of line tokens.
//! Text-bearing tokens carry their inline markup already lexed into spans.
//!
//! ## Line Rules
//!
//! Leading spaces are skipped, then the first character decides the line:
//!
//! | First char | Tokens                                               |
//! |------------|------------------------------------------------------|
//! | `#`        | `Heading(name)`, `Newline`                           |
//! | `[`        | `BracketOpen`, `Inside`, `BracketClose`, `Text`      |
//! | `-`        | `Bullet(spans)`                                      |
//! | `\n`       | `Newline`                                            |
//! | other      | `Text(spans)`                                        |
//!
//! ## Totality
//!
//! The lexer never fails. Unclosed inline markup degrades to `TextExtra`
//! and a todo line missing its `]` simply stops after the `Inside` token,
//! leaving the parser to report it.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("# Work\n[x] ship *it*\n");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! ```

#ifndef TODO_LEXER_LEXER_HPP
#define TODO_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <vector>

namespace todo::lexer {

/// Deepest inline nesting before delimiters are read as plain text.
constexpr int MAX_SPAN_DEPTH = 256;

/// Lexical analyzer for todo documents.
class Lexer {
public:
    /// Constructs a lexer for the given source. The source must outlive the lexer.
    explicit Lexer(const Source& source);

    /// Tokenizes the entire document.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

private:
    const Source& source_;
    size_t pos_ = 0;
    int depth_ = 0; ///< Current inline span nesting.

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_at(size_t offset) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    /// True at a newline or the end of input.
    [[nodiscard]] auto at_line_end() const -> bool;

    void skip_spaces();

    [[nodiscard]] auto make_token(TokenKind kind, size_t start) const -> Token;

    // ========================================================================
    // Line Rules
    // ========================================================================

    void lex_heading(std::vector<Token>& tokens);
    void lex_todo(std::vector<Token>& tokens);
    void lex_bullet(std::vector<Token>& tokens);
    void lex_text(std::vector<Token>& tokens);

    // ========================================================================
    // Inline Markup
    // ========================================================================

    /// Lexes spans up to (not including) the end of the line.
    [[nodiscard]] auto lex_inline() -> Spans;

    /// Lexes one span at the current position.
    [[nodiscard]] auto lex_span() -> Span;

    [[nodiscard]] auto lex_normal() -> Span;
    [[nodiscard]] auto lex_styled(char delimiter) -> Span;
    [[nodiscard]] auto lex_link() -> Span;

    /// Lookahead check for a complete `|name[handler:path]|` at the cursor.
    [[nodiscard]] auto scan_link() const -> bool;

    /// Consumes characters up to `stop` (exclusive) and returns them.
    auto consume_until(char stop) -> std::string;
};

/// Returns true for the five paired style delimiters.
[[nodiscard]] auto is_style_delimiter(char c) -> bool;

/// Returns true for any character that ends a plain text run.
[[nodiscard]] auto is_inline_special(char c) -> bool;

/// Lexes a document held in memory.
[[nodiscard]] auto lex(std::string_view text) -> std::vector<Token>;

} // namespace todo::lexer

#endif // TODO_LEXER_LEXER_HPP
