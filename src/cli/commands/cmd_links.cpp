//! # Link Commands
//!
//! This file implements `todo list-links`, `todo open-link` and
//! `todo open-link-raw`.
//!
//! ```bash
//! todo list-links today.todo     # 0 Docs - open:https://example.com
//! todo open-link today.todo 0    # xdg-open 'https://example.com'
//! todo open-link-raw open ~/notes.md
//! ```
//!
//! Link ids are positions in the `list-links` output.

#include "cmd_links.hpp"

#include "cli/diagnostic.hpp"
#include "log/log.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>

#include <sys/wait.h>

namespace todo::cli {

auto ShellDispatcher::open(const std::string& handler, const std::string& command)
    -> Result<bool, links::HandlerDispatchError> {
    TODO_LOG_INFO("links", "Running: " << command);
    std::cout.flush();

    int status = std::system(command.c_str());
    if (status == -1) {
        return links::HandlerDispatchError{.handler = handler,
                                           .message = "could not start a shell for '" + command +
                                                      "'"};
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return links::HandlerDispatchError{
            .handler = handler,
            .message = "handler '" + handler + "' exited with status " + std::to_string(code)};
    }
    return true;
}

static int report_dispatch(const Result<bool, links::HandlerDispatchError>& result) {
    if (is_ok(result)) {
        return 0;
    }
    const auto& error = unwrap_err(result);
    TODO_LOG_ERROR("links", "Dispatch failed: " << error.message);
    get_diagnostic_emitter().error(ErrorCodes::HANDLER_FAILED, error.message);
    return 1;
}

int run_list_links(const std::string& path, const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    auto file = load_document(path, *config);
    if (!file) {
        return 1;
    }

    auto refs = links::collect(*file);
    for (size_t i = 0; i < refs.size(); ++i) {
        std::cout << i << " " << refs[i].name << " - " << refs[i].handler << ":" << refs[i].path
                  << "\n";
    }
    return 0;
}

int run_open_link(const std::string& path, const std::string& id, const CliOptions& options) {
    size_t index = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), index);
    if (ec != std::errc() || end != id.data() + id.size()) {
        get_diagnostic_emitter().error(ErrorCodes::USAGE, "link id must be a number, got '" + id + "'");
        return 1;
    }

    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    auto file = load_document(path, *config);
    if (!file) {
        return 1;
    }

    auto refs = links::collect(*file);
    if (index >= refs.size()) {
        std::string message = "link id " + id + " is out of range";
        std::vector<std::string> notes;
        notes.push_back(refs.empty() ? "the document has no links"
                                     : "the highest id is " + std::to_string(refs.size() - 1));
        get_diagnostic_emitter().error(ErrorCodes::LINK_OUT_OF_RANGE, message, notes);
        return 1;
    }

    const auto& ref = refs[index];
    ShellDispatcher dispatcher;
    return report_dispatch(links::dispatch(dispatcher, *config, ref.handler, ref.path));
}

int run_open_link_raw(const std::string& handler, const std::string& link_path,
                      const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }

    ShellDispatcher dispatcher;
    return report_dispatch(links::dispatch(dispatcher, *config, handler, link_path));
}

} // namespace todo::cli
