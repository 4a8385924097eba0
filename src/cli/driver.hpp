//! # Command Line Driver Interface
//!
//! This header defines the main entry point for the todo tool.
//!
//! ## Entry Point
//!
//! `todo_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

// Main driver entry point
// Dispatches to appropriate command handlers
int todo_main(int argc, char* argv[]);
