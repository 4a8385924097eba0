//! # Inline Markup
//!
//! This file lexes the inline markup of a single line into a span tree.
//!
//! ## Styled Spans
//!
//! For an opening delimiter `d`, one child span is always lexed, then more
//! children follow until `d` reappears. Reaching the end of the line first
//! produces `TextExtra(d, children)` instead of the styled span:
//!
//! ```text
//! *a /b/ c*    Bold[Normal("a "), Italic[Normal("b")], Normal(" c")]
//! `abc         TextExtra('`')[Normal("abc")]
//! ```
//!
//! ## Links
//!
//! `|name[handler:path]|` is only a link when every piece is present before
//! the next `|` and before the end of the line. Otherwise the `|` behaves
//! like an unclosed delimiter.

#include "lexer/lexer.hpp"

namespace todo::lexer {

auto is_style_delimiter(char c) -> bool {
    switch (c) {
    case '`':
    case '_':
    case '-':
    case '*':
    case '/':
        return true;
    default:
        return false;
    }
}

auto is_inline_special(char c) -> bool {
    return is_style_delimiter(c) || c == '|';
}

auto Lexer::lex_inline() -> Spans {
    Spans spans;
    while (!at_line_end()) {
        spans.push_back(lex_span());
    }
    return spans;
}

auto Lexer::lex_span() -> Span {
    char c = peek();
    if (depth_ >= MAX_SPAN_DEPTH || !is_inline_special(c)) {
        return lex_normal();
    }
    if (c == '|') {
        return lex_link();
    }
    return lex_styled(c);
}

auto Lexer::lex_normal() -> Span {
    // The first character is taken as-is so a delimiter past the depth
    // limit still makes progress.
    std::string text(1, advance());
    while (!at_line_end() && !is_inline_special(peek())) {
        text += advance();
    }
    return Span{Normal{std::move(text)}};
}

auto Lexer::lex_styled(char delimiter) -> Span {
    advance();
    ++depth_;

    Spans children;
    if (!at_line_end()) {
        children.push_back(lex_span());
    }
    while (!at_line_end() && peek() != delimiter) {
        children.push_back(lex_span());
    }

    --depth_;
    if (at_line_end()) {
        return Span{TextExtra{delimiter, std::move(children)}};
    }
    advance(); // closer

    switch (delimiter) {
    case '`':
        return Span{Verbatim{std::move(children)}};
    case '_':
        return Span{Underline{std::move(children)}};
    case '-':
        return Span{Crossed{std::move(children)}};
    case '*':
        return Span{Bold{std::move(children)}};
    default:
        return Span{Italic{std::move(children)}};
    }
}

auto Lexer::scan_link() const -> bool {
    auto i = pos_ + 1;

    // Advances `i` to `want`, failing on a newline, a '|' or the end of input
    auto seek = [this, &i](char want) -> bool {
        for (; i < source_.length(); ++i) {
            char c = peek_at(i);
            if (c == want) {
                return true;
            }
            if (c == '\n' || c == '|') {
                return false;
            }
        }
        return false;
    };

    if (!seek('[')) {
        return false;
    }
    ++i;
    if (!seek(':')) {
        return false;
    }
    ++i;
    if (!seek(']')) {
        return false;
    }
    return peek_at(i + 1) == '|';
}

auto Lexer::lex_link() -> Span {
    if (!scan_link()) {
        advance(); // '|'
        ++depth_;
        auto children = lex_inline();
        --depth_;
        return Span{TextExtra{'|', std::move(children)}};
    }

    advance(); // '|'
    Link link;
    link.name = consume_until('[');
    advance();
    link.handler = consume_until(':');
    advance();
    link.path = consume_until(']');
    advance();
    advance(); // '|'
    return Span{std::move(link)};
}

} // namespace todo::lexer
