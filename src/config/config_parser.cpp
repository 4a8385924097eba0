//! # Config Parser
//!
//! Hand-written parser for the TOML subset accepted in `config.toml`.
//!
//! ## Sections
//!
//! | Section            | Keys                         | Values   |
//! |--------------------|------------------------------|----------|
//! | (root)             | `bullet_point`               | string   |
//! | `[todo_state]`     | any (bare or quoted)         | string   |
//! | `[todo_state_ops]` | `default`, `brackets`        | string, bool |
//! | `[handlers]`       | any (bare or quoted)         | string   |
//!
//! Unknown sections and keys are skipped with a warning so older config
//! files keep loading.

#include "config/config.hpp"
#include "log/log.hpp"

#include <cctype>

namespace todo::config {

ConfigParser::ConfigParser(std::string content) : content_(std::move(content)) {}

// ============================================================================
// Character Helpers
// ============================================================================

auto ConfigParser::advance() -> char {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

void ConfigParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void ConfigParser::skip_spaces() {
    while (peek() == ' ' || peek() == '\t') {
        advance();
    }
}

void ConfigParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void ConfigParser::skip_blank() {
    while (true) {
        skip_whitespace();
        if (peek() != '#')
            break;
        skip_comment();
    }
}

void ConfigParser::finish_line() {
    skip_spaces();
    skip_comment();
    if (!is_eof() && peek() != '\n') {
        set_error("Expected end of line after value");
    }
}

void ConfigParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = "Line " + std::to_string(line_) + ": " + message;
    }
}

// ============================================================================
// Values
// ============================================================================

auto ConfigParser::parse_identifier() -> std::string {
    std::string result;
    while (!is_eof() &&
           (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')) {
        result += advance();
    }
    return result;
}

auto ConfigParser::parse_key() -> std::string {
    if (peek() == '"') {
        return parse_string();
    }
    return parse_identifier();
}

auto ConfigParser::parse_string() -> std::string {
    advance(); // opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() != '\\') {
            result += advance();
            continue;
        }
        advance();
        char escaped = advance();
        switch (escaped) {
        case 'n':
            result += '\n';
            break;
        case 't':
            result += '\t';
            break;
        case 'r':
            result += '\r';
            break;
        default:
            result += escaped;
            break;
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return "";
    }
    advance();
    return result;
}

auto ConfigParser::parse_boolean() -> std::optional<bool> {
    std::string value = parse_identifier();
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    return std::nullopt;
}

void ConfigParser::skip_value() {
    if (peek() == '"') {
        (void)parse_string();
        return;
    }
    if (peek() == '[') {
        // String arrays and nested arrays, possibly spanning lines
        int depth = 0;
        do {
            char c = peek();
            if (c == '"') {
                (void)parse_string();
                continue;
            }
            if (c == '[')
                depth++;
            else if (c == ']')
                depth--;
            else if (c == '\n')
                line_++;
            advance();
        } while (!is_eof() && depth > 0 && error_message_.empty());

        if (depth > 0) {
            set_error("Unterminated array");
        }
        return;
    }
    if (parse_identifier().empty()) {
        set_error("Expected value");
    }
}

// ============================================================================
// Document
// ============================================================================

auto ConfigParser::parse_section_header() -> std::string {
    advance(); // '['
    skip_spaces();
    std::string name = parse_identifier();
    skip_spaces();

    if (name.empty()) {
        set_error("Expected section name");
        return "";
    }
    if (peek() != ']') {
        set_error("Expected ']' after section name");
        return "";
    }
    advance();
    finish_line();

    if (name != "todo_state" && name != "todo_state_ops" && name != "handlers") {
        TODO_LOG_WARN("config", "Ignoring unknown section [" << name << "]");
    }
    return name;
}

void ConfigParser::parse_entry(const std::string& section, Config& config, bool& has_default) {
    std::string key = parse_key();
    if (!error_message_.empty())
        return;
    if (key.empty()) {
        set_error("Expected key");
        return;
    }

    skip_spaces();
    if (peek() != '=') {
        set_error("Expected '=' after key");
        return;
    }
    advance();
    skip_spaces();

    auto expect_string = [&]() -> std::optional<std::string> {
        if (peek() != '"') {
            set_error("Expected string value for '" + key + "'");
            return std::nullopt;
        }
        auto value = parse_string();
        if (!error_message_.empty())
            return std::nullopt;
        return value;
    };

    if (section.empty() && key == "bullet_point") {
        config.bullet_point = expect_string();
    } else if (section == "todo_state") {
        if (auto value = expect_string())
            config.todo_state[key] = *value;
    } else if (section == "handlers") {
        if (auto value = expect_string())
            config.handlers[key] = *value;
    } else if (section == "todo_state_ops" && key == "default") {
        if (auto value = expect_string()) {
            config.todo_state_ops->default_state = *value;
            has_default = true;
        }
    } else if (section == "todo_state_ops" && key == "brackets") {
        if (auto value = parse_boolean())
            config.todo_state_ops->brackets = *value;
        else
            set_error("Expected true or false for 'brackets'");
    } else {
        skip_value();
        TODO_LOG_WARN("config", "Ignoring unknown key '"
                                    << key << "'" << (section.empty() ? "" : " in [" + section + "]"));
    }

    if (error_message_.empty()) {
        finish_line();
    }
}

auto ConfigParser::parse() -> std::optional<Config> {
    Config config;
    std::string section;
    bool has_default = false;

    while (true) {
        skip_blank();
        if (is_eof())
            break;

        if (peek() == '[') {
            section = parse_section_header();
            if (section == "todo_state_ops" && !config.todo_state_ops) {
                config.todo_state_ops = TodoStateOps{};
            }
        } else {
            parse_entry(section, config, has_default);
        }

        if (!error_message_.empty())
            return std::nullopt;
    }

    if (config.todo_state_ops && !has_default) {
        set_error("[todo_state_ops] requires a 'default' key");
        return std::nullopt;
    }

    return config;
}

} // namespace todo::config
