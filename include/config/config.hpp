//! # Configuration
//!
//! User preferences that shape parsing and printing, loaded from
//! `config.toml`:
//!
//! ```toml
//! bullet_point = "*"
//!
//! [todo_state]              # raw bracket text -> display text
//! x = "DONE"
//! "?" = "MAYBE"
//!
//! [todo_state_ops]
//! default = "TODO"          # shown for an empty state
//! brackets = true           # print states as [state]
//!
//! [handlers]                # link handler -> shell command
//! open = "xdg-open {path}"
//! ```
//!
//! A `Config` is immutable once loaded and is passed by const reference
//! into the parser, printer and exporters.

#ifndef TODO_CONFIG_CONFIG_HPP
#define TODO_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "json/json_value.hpp"

#include <map>
#include <optional>
#include <string>

namespace todo::config {

/// Presentation policy for todo states.
struct TodoStateOps {
    /// State text printed when a todo has an empty state.
    std::string default_state;

    /// Print states as `[state]` rather than `state `.
    bool brackets = true;
};

/// Loaded user configuration. A default-constructed Config is valid.
struct Config {
    /// Alias table: raw bracket content to display text.
    std::map<std::string, std::string> todo_state;

    std::optional<TodoStateOps> todo_state_ops;

    /// Bullet marker; `-` when unset.
    std::optional<std::string> bullet_point;

    /// Known link handlers and their command templates.
    std::map<std::string, std::string> handlers;

    /// Loads a config file. A missing file yields the default configuration.
    [[nodiscard]] static auto load(const std::string& path) -> Result<Config, std::string>;

    /// `$XDG_CONFIG_HOME/todo/config.toml`, falling back to `~/.config`.
    [[nodiscard]] static auto default_path() -> std::string;
};

/// Parser for the TOML subset used by `config.toml`.
///
/// Supports bare and quoted keys, `[section]` headers, strings with
/// escapes, booleans, integers, string arrays and `#` comments.
class ConfigParser {
public:
    explicit ConfigParser(std::string content);

    /// Parses the whole document. Returns `std::nullopt` on error.
    [[nodiscard]] auto parse() -> std::optional<Config>;

    /// "Line N: message" for the first error, or empty.
    [[nodiscard]] auto get_error() const -> const std::string& {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_spaces();
    void skip_comment();
    void skip_blank();
    void finish_line();

    [[nodiscard]] auto is_eof() const -> bool {
        return pos_ >= content_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return is_eof() ? '\0' : content_[pos_];
    }

    auto advance() -> char;

    auto parse_identifier() -> std::string;
    auto parse_key() -> std::string;
    auto parse_string() -> std::string;
    auto parse_boolean() -> std::optional<bool>;
    void skip_value();

    auto parse_section_header() -> std::string;
    void parse_entry(const std::string& section, Config& config, bool& has_default);

    void set_error(const std::string& message);
};

/// Renders the effective configuration for display.
[[nodiscard]] auto to_json(const Config& config) -> json::JsonValue;

} // namespace todo::config

#endif // TODO_CONFIG_CONFIG_HPP
