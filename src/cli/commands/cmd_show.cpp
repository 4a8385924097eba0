//! # Document Commands
//!
//! This file implements `todo show`, `todo raw`, `todo eww-show`,
//! `todo tokens` and `todo check`.
//!
//! ## Usage
//!
//! ```bash
//! todo show today.todo             # Pretty print at terminal width
//! todo show today.todo --width=60  # Pretty print at a fixed width
//! todo raw today.todo              # Document tree as JSON
//! todo tokens today.todo           # Line tokens, one per line
//! ```
//!
//! Every command exits with 1 after reporting a diagnostic, and 0 otherwise.

#include "cmd_show.hpp"

#include "cli/diagnostic.hpp"
#include "export/json_export.hpp"
#include "export/widget_export.hpp"
#include "format/printer.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <iostream>

namespace todo::cli {

int run_show(const std::string& path, const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    auto file = load_document(path, *config);
    if (!file) {
        return 1;
    }

    format::PrintOptions print_options;
    print_options.width = options.width.value_or(terminal_width());
    TODO_LOG_DEBUG("printer", "Printing " << path << " at width " << print_options.width);

    format::Printer printer(*config, print_options);
    std::cout << printer.print(*file);
    return 0;
}

int run_raw(const std::string& path, const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    auto file = load_document(path, *config);
    if (!file) {
        return 1;
    }

    std::cout << exporter::to_json(*file, *config).to_string_pretty() << "\n";
    return 0;
}

int run_eww_show(const std::string& path, const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    auto file = load_document(path, *config);
    if (!file) {
        return 1;
    }

    std::cout << exporter::to_widget(*file, *config, {.config_path = options.config_path})
                     .to_string_pretty() << "\n";
    return 0;
}

int run_tokens(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    lexer::Lexer lex(*source);
    for (const auto& token : lex.tokenize()) {
        std::cout << lexer::token_to_string(token) << "\n";
    }
    return 0;
}

int run_check(const std::string& path, const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    auto file = load_document(path, *config);
    if (!file) {
        return 1;
    }

    size_t entries = 0;
    for (const auto& heading : file->headings) {
        entries += heading.body.size();
    }
    std::cout << "ok: " << file->headings.size() << " headings, " << entries << " entries\n";
    return 0;
}

} // namespace todo::cli
