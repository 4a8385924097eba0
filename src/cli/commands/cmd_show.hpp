//! # Document Commands Interface
//!
//! Commands that read one todo file and render it.
//!
//! | Function          | Command          | Output                          |
//! |-------------------|------------------|---------------------------------|
//! | `run_show()`      | `todo show`      | Printed markup                  |
//! | `run_raw()`       | `todo raw`       | Structured tree as JSON         |
//! | `run_eww_show()`  | `todo eww-show`  | Widget markup JSON              |
//! | `run_tokens()`    | `todo tokens`    | Line token stream               |
//! | `run_check()`     | `todo check`     | Parse result only               |

#pragma once

#include "cli/utils.hpp"

#include <string>

namespace todo::cli {

int run_show(const std::string& path, const CliOptions& options);
int run_raw(const std::string& path, const CliOptions& options);
int run_eww_show(const std::string& path, const CliOptions& options);
int run_tokens(const std::string& path);
int run_check(const std::string& path, const CliOptions& options);

} // namespace todo::cli
