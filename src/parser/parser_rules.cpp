//! # Parser Rules
//!
//! One method per grammar rule. A rule that fails pushes its own frame onto
//! the error before returning it, which builds the rule path innermost
//! first:
//!
//! ```text
//! parse_file ─► parse_heading ─► parse_under_heading ─┬► parse_todo ─► parse_todo_state
//!                                                     ├► parse_bullet
//!                                                     └► parse_text
//! ```
//!
//! Inside a heading body the checks run in the order Todo, Bullet, Text,
//! Heading. A heading there is a structural violation, and a token matching
//! none of them is an unexpected token.

#include "parser/parser.hpp"
#include "parser/rules.hpp"

namespace todo::parser {

using lexer::TokenKind;

auto Parser::parse_file() -> Result<File, ParseError> {
    auto start = current_location();
    File file;

    while (!is_at_end()) {
        // Blank lines between headings carry no content
        if (rules::check_blank_line(remaining())) {
            advance();
            continue;
        }
        if (!rules::check_heading(remaining())) {
            auto error = unexpected({"heading"});
            error.push_frame("File", start);
            return error;
        }

        auto heading = parse_heading();
        if (is_err(heading)) {
            unwrap_err(heading).push_frame("File", start);
            return unwrap_err(heading);
        }
        file.headings.push_back(std::move(unwrap(heading)));
    }

    return file;
}

auto Parser::parse_heading() -> Result<Heading, ParseError> {
    auto start = current_location();

    auto name = expect(TokenKind::Heading, "heading");
    if (is_err(name)) {
        unwrap_err(name).push_frame("Heading", start);
        return unwrap_err(name);
    }
    auto newline = expect(TokenKind::Newline, "newline");
    if (is_err(newline)) {
        unwrap_err(newline).push_frame("Heading", start);
        return unwrap_err(newline);
    }

    Heading heading{.name = unwrap(name).text(), .body = {}, .location = start};

    while (!is_at_end() && !rules::check_blank_line(remaining())) {
        if (rules::check_heading(remaining())) {
            auto message =
                "heading \"" + peek().text() + "\" cannot nest inside \"" + heading.name + "\"";
            ParseError error{
                .cause = StructuralViolation{.message = std::move(message), .location = peek().location},
                .frames = {}};
            error.push_frame("Heading", start);
            return error;
        }

        auto entry = parse_under_heading();
        if (is_err(entry)) {
            unwrap_err(entry).push_frame("Heading", start);
            return unwrap_err(entry);
        }
        heading.body.push_back(std::move(unwrap(entry)));
    }

    // The blank line (or end of input) closing the body
    if (!is_at_end()) {
        advance();
    }
    return heading;
}

auto Parser::parse_under_heading() -> Result<UnderHeading, ParseError> {
    if (rules::check_todo(remaining())) {
        auto todo = parse_todo();
        if (is_err(todo)) {
            return unwrap_err(todo);
        }
        return UnderHeading{std::move(unwrap(todo))};
    }

    if (rules::check_bullet(remaining())) {
        auto bullet = parse_bullet();
        if (is_err(bullet)) {
            return unwrap_err(bullet);
        }
        return UnderHeading{std::move(unwrap(bullet))};
    }

    if (rules::check_text(remaining())) {
        auto text = parse_text();
        if (is_err(text)) {
            return unwrap_err(text);
        }
        auto end = expect_line_end();
        if (is_err(end)) {
            unwrap_err(end).push_frame("Text", unwrap(text).location);
            return unwrap_err(end);
        }
        return UnderHeading{std::move(unwrap(text))};
    }

    return unexpected({"'['", "bullet", "text"});
}

auto Parser::parse_todo() -> Result<Todo, ParseError> {
    auto start = current_location();
    auto fail = [&start](ParseError& error) -> ParseError {
        error.push_frame("Todo", start);
        return error;
    };

    auto open = expect(TokenKind::BracketOpen, "'['");
    if (is_err(open)) {
        return fail(unwrap_err(open));
    }

    auto state = parse_todo_state();
    if (is_err(state)) {
        return fail(unwrap_err(state));
    }

    auto close = expect(TokenKind::BracketClose, "']'");
    if (is_err(close)) {
        return fail(unwrap_err(close));
    }

    auto description = parse_text();
    if (is_err(description)) {
        return fail(unwrap_err(description));
    }

    auto end = expect_line_end();
    if (is_err(end)) {
        return fail(unwrap_err(end));
    }

    return Todo{.state = std::move(unwrap(state)),
                .description = std::move(unwrap(description)),
                .location = start};
}

auto Parser::parse_todo_state() -> Result<std::optional<TodoState>, ParseError> {
    auto start = current_location();
    auto inside = expect(TokenKind::Inside, "todo state");
    if (is_err(inside)) {
        unwrap_err(inside).push_frame("TodoState", start);
        return unwrap_err(inside);
    }
    return resolve_state(unwrap(inside).text(), config_);
}

auto Parser::parse_bullet() -> Result<Bullet, ParseError> {
    auto start = current_location();
    auto bullet = expect(TokenKind::Bullet, "bullet");
    if (is_err(bullet)) {
        unwrap_err(bullet).push_frame("Bullet", start);
        return unwrap_err(bullet);
    }

    auto end = expect_line_end();
    if (is_err(end)) {
        unwrap_err(end).push_frame("Bullet", start);
        return unwrap_err(end);
    }

    return Bullet{.text = Text{.spans = unwrap(bullet).spans(), .location = start},
                  .location = start};
}

auto Parser::parse_text() -> Result<Text, ParseError> {
    auto start = current_location();
    auto text = expect(TokenKind::Text, "text");
    if (is_err(text)) {
        unwrap_err(text).push_frame("Text", start);
        return unwrap_err(text);
    }
    return Text{.spans = unwrap(text).spans(), .location = start};
}

} // namespace todo::parser
