#include "parser/rules.hpp"

namespace todo::parser::rules {

using lexer::TokenKind;

namespace {

auto starts_with(Window tokens, TokenKind kind) -> bool {
    return !tokens.empty() && tokens[0].is(kind);
}

} // namespace

auto check_heading(Window tokens) -> bool {
    return starts_with(tokens, TokenKind::Heading);
}

auto check_todo(Window tokens) -> bool {
    return tokens.size() >= 2 && tokens[0].is(TokenKind::BracketOpen) &&
           tokens[1].is(TokenKind::Inside);
}

auto check_todo_state(Window tokens) -> bool {
    return starts_with(tokens, TokenKind::Inside);
}

auto check_bullet(Window tokens) -> bool {
    return starts_with(tokens, TokenKind::Bullet);
}

auto check_text(Window tokens) -> bool {
    return starts_with(tokens, TokenKind::Text);
}

auto check_blank_line(Window tokens) -> bool {
    return starts_with(tokens, TokenKind::Newline);
}

} // namespace todo::parser::rules
