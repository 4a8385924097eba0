//! # Config Command Interface
//!
//! `todo config` prints the effective configuration as JSON, after defaults
//! are applied, along with the path it was loaded from.

#pragma once

#include "cli/utils.hpp"

namespace todo::cli {

int run_config(const CliOptions& options);

} // namespace todo::cli
