#include "utils.hpp"

#include "cli/diagnostic.hpp"
#include "common.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <cstdlib>
#include <iostream>

#include <sys/ioctl.h>
#include <unistd.h>

namespace todo::cli {

int terminal_width() {
    winsize size{};
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
        return size.ws_col;
    }

    if (const char* columns = std::getenv("COLUMNS")) {
        int value = std::atoi(columns);
        if (value > 0) {
            return value;
        }
    }
    return 80;
}

std::optional<config::Config> load_config(const CliOptions& options) {
    std::string path =
        options.config_path.empty() ? config::Config::default_path() : options.config_path;

    auto result = config::Config::load(path);
    if (is_err(result)) {
        TODO_LOG_ERROR("cli", "Config load failed: " << unwrap_err(result));
        get_diagnostic_emitter().error(ErrorCodes::CONFIG_ERROR, unwrap_err(result));
        return std::nullopt;
    }
    return std::move(unwrap(result));
}

std::optional<lexer::Source> load_source(const std::string& path) {
    auto result = lexer::Source::from_file(path);
    if (is_err(result)) {
        TODO_LOG_ERROR("cli", unwrap_err(result));
        get_diagnostic_emitter().error(ErrorCodes::FILE_NOT_FOUND, unwrap_err(result));
        return std::nullopt;
    }

    auto& source = unwrap(result);
    get_diagnostic_emitter().set_source_content(path, std::string(source.content()));
    return std::move(source);
}

std::optional<parser::File> load_document(const std::string& path, const config::Config& config) {
    auto source = load_source(path);
    if (!source) {
        return std::nullopt;
    }

    lexer::Lexer lex(*source);
    auto result = parser::parse(config, lex.tokenize());
    if (is_err(result)) {
        TODO_LOG_ERROR("cli", "Parse of " << path << " failed");
        get_diagnostic_emitter().parse_error(path, unwrap_err(result));
        return std::nullopt;
    }
    return std::move(unwrap(result));
}

void print_usage() {
    std::cout << "todo " << VERSION << "\n\n";
    std::cout << "Usage: todo <command> [args] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  show <file>                      Print the document\n";
    std::cout << "  raw <file>                       Print the document tree as JSON\n";
    std::cout << "  eww-show <file>                  Print todos as widget markup JSON\n";
    std::cout << "  tokens <file>                    Print the line tokens (debug)\n";
    std::cout << "  check <file>                     Parse only and report errors\n";
    std::cout << "  list-links <file>                List the links in the document\n";
    std::cout << "  open-link <file> <id>            Open a link by its list id\n";
    std::cout << "  open-link-raw <handler> <path>   Open a path with a handler\n";
    std::cout << "  config                           Print the effective configuration\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h           Show this help\n";
    std::cout << "  --version, -V        Show version\n";
    std::cout << "  --config=<path>      Config file (default: " << config::Config::default_path()
              << ")\n";
    std::cout << "  --width=<n>          Output width for show\n";
    std::cout << "  --log-level=<level>  trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>  Per-module levels, e.g. parser=debug,*=warn\n";
    std::cout << "  --log-file=<path>    Also write logs to a file\n";
    std::cout << "  --log-format=json    Structured log lines\n";
    std::cout << "  -q, -v, -vv, -vvv    Quieter or more verbose logging\n";
}

void print_version() {
    std::cout << "todo " << VERSION << "\n";
}

} // namespace todo::cli
