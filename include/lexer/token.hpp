//! # Token Definitions
//!
//! This module defines the two layers of tokens produced by the todo lexer.
//!
//! ## Line Tokens
//!
//! Structure is decided per line: a heading (`# name`), a todo
//! (`[state] description`), a bullet (`- text`), paragraph text, or a bare
//! newline. Todos are split into bracket-open, inside and bracket-close
//! tokens followed by a body-text token.
//!
//! ## Inline Spans
//!
//! Text-bearing tokens carry a sequence of `Span`s, a recursive markup tree:
//!
//! | Markup            | Span          |
//! |-------------------|---------------|
//! | `` `code` ``      | `Verbatim`    |
//! | `_under_`         | `Underline`   |
//! | `-gone-`          | `Crossed`     |
//! | `*loud*`          | `Bold`        |
//! | `/soft/`          | `Italic`      |
//! | `|name[h:path]|`  | `Link`        |
//! | `*never closed`   | `TextExtra`   |
//!
//! `TextExtra` is the unterminated fallback: a delimiter whose closer never
//! appeared before the end of the line, followed by whatever did lex inside.

#ifndef TODO_LEXER_TOKEN_HPP
#define TODO_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace todo::lexer {

// ============================================================================
// Inline Spans
// ============================================================================

struct Span;

/// An ordered sequence of sibling spans.
using Spans = std::vector<Span>;

/// Plain run of text with no markup.
struct Normal {
    std::string text;

    [[nodiscard]] auto operator==(const Normal& other) const -> bool = default;
};

/// Children wrapped between a pair of `Delim` characters.
template <char Delim> struct Styled {
    /// The opening and closing delimiter character.
    static constexpr char delimiter = Delim;

    Spans children;
};

using Verbatim = Styled<'`'>;
using Underline = Styled<'_'>;
using Crossed = Styled<'-'>;
using Bold = Styled<'*'>;
using Italic = Styled<'/'>;

/// Named link: `|name[handler:path]|`.
struct Link {
    std::string name;
    std::string handler;
    std::string path;

    [[nodiscard]] auto operator==(const Link& other) const -> bool = default;
};

/// A delimiter that was never closed, followed by what lexed after it.
struct TextExtra {
    char delimiter;
    Spans children;
};

/// One node of the inline markup tree.
struct Span {
    std::variant<Normal, Verbatim, Underline, Crossed, Bold, Italic, Link, TextExtra> kind;

    /// Checks if this span holds the given alternative.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets the alternative. Throws `std::bad_variant_access` on mismatch.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

[[nodiscard]] auto operator==(const Span& lhs, const Span& rhs) -> bool;

template <char Delim>
[[nodiscard]] auto operator==(const Styled<Delim>& lhs, const Styled<Delim>& rhs) -> bool {
    return lhs.children == rhs.children;
}

[[nodiscard]] inline auto operator==(const TextExtra& lhs, const TextExtra& rhs) -> bool {
    return lhs.delimiter == rhs.delimiter && lhs.children == rhs.children;
}

/// Returns the stable kind tag of a span (`"normal"`, `"bold"`, ...).
[[nodiscard]] auto span_kind_name(const Span& span) -> std::string_view;

/// Debug rendering of a span tree, e.g. `Bold[Normal("x")]`.
[[nodiscard]] auto span_to_string(const Span& span) -> std::string;

/// Debug rendering of a span sequence, comma separated.
[[nodiscard]] auto spans_to_string(const Spans& spans) -> std::string;

// ============================================================================
// Line Tokens
// ============================================================================

/// All line-level token kinds.
enum class TokenKind : uint8_t {
    Heading,      ///< `# name`; payload is the trimmed name
    BracketOpen,  ///< `[` at line start
    Inside,       ///< Raw text between the brackets
    BracketClose, ///< `]`
    Bullet,       ///< `- text`; payload is the inline-lexed text
    Text,         ///< Paragraph or todo description; payload is inline-lexed
    Newline,      ///< `\n`
};

/// Returns a human-readable name for a token kind.
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// A line-level token.
///
/// - `std::monostate` for bracket and newline tokens
/// - `std::string` for `Heading` and `Inside`
/// - `Spans` for `Bullet` and `Text`
struct Token {
    TokenKind kind;

    /// Position of the token's first character.
    SourceLocation location;

    std::variant<std::monostate, std::string, Spans> value;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    /// Gets the string payload of a `Heading` or `Inside` token. Throws
    /// `std::bad_variant_access` for other kinds.
    [[nodiscard]] auto text() const -> const std::string&;

    /// Gets the span payload of a `Bullet` or `Text` token. Throws
    /// `std::bad_variant_access` for other kinds.
    [[nodiscard]] auto spans() const -> const Spans&;
};

/// Debug rendering of a token: `line:col Kind payload`.
[[nodiscard]] auto token_to_string(const Token& token) -> std::string;

/// Short description used in diagnostics, e.g. `heading "Work"`.
[[nodiscard]] auto describe_token(const Token& token) -> std::string;

} // namespace todo::lexer

#endif // TODO_LEXER_TOKEN_HPP
