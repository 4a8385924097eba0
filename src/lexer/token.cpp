#include "lexer/token.hpp"

#include <sstream>
#include <type_traits>

namespace todo::lexer {

namespace {

// Quotes a payload for debug output, escaping quotes and backslashes
auto quoted(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

// ============================================================================
// Spans
// ============================================================================

auto operator==(const Span& lhs, const Span& rhs) -> bool {
    return lhs.kind == rhs.kind;
}

auto span_kind_name(const Span& span) -> std::string_view {
    switch (span.kind.index()) {
    case 0:
        return "normal";
    case 1:
        return "verbatim";
    case 2:
        return "underline";
    case 3:
        return "crossed";
    case 4:
        return "bold";
    case 5:
        return "italic";
    case 6:
        return "link";
    case 7:
        return "text_extra";
    }
    return "unknown";
}

auto span_to_string(const Span& span) -> std::string {
    return std::visit(
        [&span](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Normal>) {
                return "Normal(" + quoted(node.text) + ")";
            } else if constexpr (std::is_same_v<T, Link>) {
                return "Link(" + quoted(node.name) + ", " + quoted(node.handler) + ", " +
                       quoted(node.path) + ")";
            } else if constexpr (std::is_same_v<T, TextExtra>) {
                return "TextExtra('" + std::string(1, node.delimiter) + "')[" +
                       spans_to_string(node.children) + "]";
            } else {
                std::string name(span_kind_name(span));
                name[0] = static_cast<char>(name[0] - 'a' + 'A');
                return name + "[" + spans_to_string(node.children) + "]";
            }
        },
        span.kind);
}

auto spans_to_string(const Spans& spans) -> std::string {
    std::string out;
    for (size_t i = 0; i < spans.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += span_to_string(spans[i]);
    }
    return out;
}

// ============================================================================
// Tokens
// ============================================================================

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Heading:
        return "Heading";
    case TokenKind::BracketOpen:
        return "BracketOpen";
    case TokenKind::Inside:
        return "Inside";
    case TokenKind::BracketClose:
        return "BracketClose";
    case TokenKind::Bullet:
        return "Bullet";
    case TokenKind::Text:
        return "Text";
    case TokenKind::Newline:
        return "Newline";
    }
    return "Unknown";
}

auto Token::text() const -> const std::string& {
    return std::get<std::string>(value);
}

auto Token::spans() const -> const Spans& {
    return std::get<Spans>(value);
}

auto token_to_string(const Token& token) -> std::string {
    std::ostringstream out;
    out << token.location.line << ":" << token.location.column << " "
        << token_kind_to_string(token.kind);

    if (std::holds_alternative<std::string>(token.value)) {
        out << " " << quoted(token.text());
    } else if (std::holds_alternative<Spans>(token.value)) {
        out << " [" << spans_to_string(token.spans()) << "]";
    }
    return out.str();
}

auto describe_token(const Token& token) -> std::string {
    switch (token.kind) {
    case TokenKind::Heading:
        return "heading " + quoted(token.text());
    case TokenKind::BracketOpen:
        return "'['";
    case TokenKind::Inside:
        return "todo state " + quoted(token.text());
    case TokenKind::BracketClose:
        return "']'";
    case TokenKind::Bullet:
        return "bullet";
    case TokenKind::Text:
        return "text";
    case TokenKind::Newline:
        return "newline";
    }
    return "token";
}

} // namespace todo::lexer
