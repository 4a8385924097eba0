//! # Link Commands Interface
//!
//! | Function              | Command              | Effect                         |
//! |-----------------------|----------------------|--------------------------------|
//! | `run_list_links()`    | `todo list-links`    | Numbered list of links         |
//! | `run_open_link()`     | `todo open-link`     | Dispatch link by list id       |
//! | `run_open_link_raw()` | `todo open-link-raw` | Dispatch handler and path      |

#pragma once

#include "cli/utils.hpp"
#include "links/links.hpp"

#include <string>

namespace todo::cli {

// Runs handler commands through /bin/sh
class ShellDispatcher : public links::LinkDispatcher {
public:
    auto open(const std::string& handler, const std::string& command)
        -> Result<bool, links::HandlerDispatchError> override;
};

int run_list_links(const std::string& path, const CliOptions& options);
int run_open_link(const std::string& path, const std::string& id, const CliOptions& options);
int run_open_link_raw(const std::string& handler, const std::string& link_path,
                      const CliOptions& options);

} // namespace todo::cli
