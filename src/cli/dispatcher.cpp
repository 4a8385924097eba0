//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the todo CLI.
//! It parses command-line arguments and routes to the appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! todo_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ show           → run_show()
//!   ├─ raw            → run_raw()
//!   ├─ eww-show       → run_eww_show()
//!   ├─ tokens         → run_tokens()
//!   ├─ check          → run_check()
//!   ├─ list-links     → run_list_links()
//!   ├─ open-link      → run_open_link()
//!   ├─ open-link-raw  → run_open_link_raw()
//!   └─ config         → run_config()
//! ```
//!
//! ## Global Flags
//!
//! These flags are available for all commands and may appear anywhere:
//! - `--config=<path>`: Config file instead of the XDG default
//! - `--width=<n>`: Output width for `show`
//! - `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`, `-q`, `-v`:
//!   see `log::parse_log_options()`

#include "cli/driver.hpp"
#include "commands/cmd_config.hpp"
#include "commands/cmd_links.hpp"
#include "commands/cmd_show.hpp"
#include "common.hpp"
#include "diagnostic.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <vector>

namespace todo::cli {

namespace {

// Splits argv into global options and positional arguments
bool parse_args(int argc, char* argv[], CliOptions& options, std::vector<std::string>& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg.starts_with("--config=")) {
            options.config_path = arg.substr(9);
            continue;
        }

        if (arg.starts_with("--width=")) {
            auto value = arg.substr(8);
            int width = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), width);
            if (ec != std::errc() || end != value.data() + value.size() || width <= 0) {
                get_diagnostic_emitter().error(ErrorCodes::USAGE,
                                               "--width expects a positive number, got '" +
                                                   value + "'");
                return false;
            }
            options.width = width;
            continue;
        }

        args.push_back(std::move(arg));
    }
    return true;
}

int usage_error(const std::string& usage) {
    get_diagnostic_emitter().error(ErrorCodes::USAGE, "missing arguments", {"usage: " + usage});
    return 1;
}

} // namespace

} // namespace todo::cli

using namespace todo;
using namespace todo::cli;

/// Main entry point for the todo CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                  |
/// |------|------------------------------------------|
/// | 0    | Success                                  |
/// | 1    | Error (usage, file, config, parse, link) |
int todo_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    CliOptions options;
    std::vector<std::string> args;
    if (!parse_args(argc, argv, options, args)) {
        return 1;
    }

    if (args.empty()) {
        print_usage();
        return 0;
    }

    const std::string& command = args[0];
    TODO_LOG_DEBUG("cli", "Command: " << command);

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "show") {
        if (args.size() < 2) {
            return usage_error("todo show <file> [--width=<n>]");
        }
        return run_show(args[1], options);
    }

    if (command == "raw") {
        if (args.size() < 2) {
            return usage_error("todo raw <file>");
        }
        return run_raw(args[1], options);
    }

    if (command == "eww-show") {
        if (args.size() < 2) {
            return usage_error("todo eww-show <file>");
        }
        return run_eww_show(args[1], options);
    }

    if (command == "tokens") {
        if (args.size() < 2) {
            return usage_error("todo tokens <file>");
        }
        return run_tokens(args[1]);
    }

    if (command == "check") {
        if (args.size() < 2) {
            return usage_error("todo check <file>");
        }
        return run_check(args[1], options);
    }

    if (command == "list-links") {
        if (args.size() < 2) {
            return usage_error("todo list-links <file>");
        }
        return run_list_links(args[1], options);
    }

    if (command == "open-link") {
        if (args.size() < 3) {
            return usage_error("todo open-link <file> <id>");
        }
        return run_open_link(args[1], args[2], options);
    }

    if (command == "open-link-raw") {
        if (args.size() < 3) {
            return usage_error("todo open-link-raw <handler> <path>");
        }
        return run_open_link_raw(args[1], args[2], options);
    }

    if (command == "config") {
        return run_config(options);
    }

    get_diagnostic_emitter().error(ErrorCodes::USAGE, "unknown command '" + command + "'",
                                   {"run 'todo --help' for the list of commands"});
    return 1;
}
