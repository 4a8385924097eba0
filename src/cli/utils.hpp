//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function              | Description                              |
//! |-----------------------|------------------------------------------|
//! | `terminal_width()`    | Columns of the terminal on stdout        |
//! | `load_config()`       | Load config.toml, reporting C001 on error|
//! | `load_source()`       | Read a todo file, reporting E001 on error|
//! | `load_document()`     | Read, lex and parse a todo file          |
//! | `print_usage()`       | Print CLI help text                      |
//! | `print_version()`     | Print program version                    |

#pragma once

#include "config/config.hpp"
#include "lexer/source.hpp"
#include "parser/document.hpp"

#include <optional>
#include <string>

namespace todo::cli {

// Options shared by every command
struct CliOptions {
    std::string config_path;  // Empty means Config::default_path()
    std::optional<int> width; // Overrides the detected terminal width
};

// Terminal width from the tty, then $COLUMNS, then 80
int terminal_width();

// Config and document loading with diagnostics
std::optional<config::Config> load_config(const CliOptions& options);
std::optional<lexer::Source> load_source(const std::string& path);
std::optional<parser::File> load_document(const std::string& path, const config::Config& config);

// Help text
void print_usage();
void print_version();

} // namespace todo::cli
