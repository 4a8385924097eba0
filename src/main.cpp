//! # Todo Entry Point
//!
//! This file is the main entry point for the `todo` binary. It simply
//! delegates to the CLI driver which handles all command parsing and
//! execution.
//!
//! ## Usage
//!
//! ```bash
//! todo show today.todo        # Print a todo file
//! todo raw today.todo         # Document tree as JSON
//! todo list-links today.todo  # Numbered links
//! todo open-link today.todo 0 # Open the first link
//! ```
//!
//! ## See Also
//!
//! - `cli/driver.hpp` - CLI driver interface
//! - `cli/dispatcher.cpp` - Command dispatching logic

#include "cli/driver.hpp"

/// Delegates all work to `todo_main()`, which handles argument parsing,
/// command dispatch and error reporting.
int main(int argc, char* argv[]) {
    return todo_main(argc, argv);
}
