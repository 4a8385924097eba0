//! # Links
//!
//! Collection of `|name[handler:path]|` links from a document and dispatch
//! of a link to its configured handler.
//!
//! The core never runs anything itself. `dispatch()` validates the handler
//! against the `[handlers]` table, expands the command template and hands
//! the result to a `LinkDispatcher` supplied by the caller. The command line
//! tool passes one that runs the command through the shell; tests pass a
//! recording fake.
//!
//! ## Example
//!
//! ```cpp
//! auto refs = links::collect(file);
//! auto result = links::dispatch(dispatcher, config, refs[0].handler, refs[0].path);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).message << "\n";
//! }
//! ```

#ifndef TODO_LINKS_LINKS_HPP
#define TODO_LINKS_LINKS_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "parser/document.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace todo::links {

/// A link found in a document.
struct LinkRef {
    std::string name;
    std::string handler;
    std::string path;
    SourceLocation location; ///< Start of the line holding the link.
};

/// Activating a link failed. Fatal to that one action only.
struct HandlerDispatchError {
    std::string handler;
    std::string message;
};

/// Runs an expanded handler command.
class LinkDispatcher {
public:
    virtual ~LinkDispatcher() = default;

    /// Runs `command` on behalf of `handler`.
    virtual auto open(const std::string& handler, const std::string& command)
        -> Result<bool, HandlerDispatchError> = 0;
};

/// All links in document order, including links nested in styled spans.
[[nodiscard]] auto collect(const parser::File& file) -> std::vector<LinkRef>;

/// Appends the links of one span sequence to `out`.
void collect_spans(const lexer::Spans& spans, SourceLocation location, std::vector<LinkRef>& out);

/// True when `handler` has an entry in the `[handlers]` table.
[[nodiscard]] auto is_known(std::string_view handler, const config::Config& config) -> bool;

/// Substitutes every `{path}` in `command_template` with the single-quoted
/// path. A template without `{path}` gets the quoted path appended.
[[nodiscard]] auto expand_command(std::string_view command_template, std::string_view path)
    -> std::string;

/// Quotes `text` for a POSIX shell.
[[nodiscard]] auto shell_quote(std::string_view text) -> std::string;

/// Validates the handler and runs its expanded command through `dispatcher`.
/// An unknown handler fails without reaching the dispatcher.
[[nodiscard]] auto dispatch(LinkDispatcher& dispatcher, const config::Config& config,
                            const std::string& handler, const std::string& path)
    -> Result<bool, HandlerDispatchError>;

} // namespace todo::links

#endif // TODO_LINKS_LINKS_HPP
