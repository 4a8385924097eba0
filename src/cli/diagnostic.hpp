//! # Diagnostic System Interface
//!
//! This header defines how the command line tool reports errors to the user.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category    | Example                              |
//! |--------|-------------|--------------------------------------|
//! | P      | Parser      | P001 - Unexpected token              |
//! | E      | File        | E001 - Todo file not found           |
//! | C      | Config      | C001 - Invalid config file           |
//! | H      | Handler     | H001 - Link handler failed           |
//! | L      | Link        | L001 - Link id out of range          |
//! | U      | Usage       | U001 - Missing or invalid argument   |
//!
//! ## Output
//!
//! ```text
//! error[P001]: expected ']', got newline
//!   --> today.todo:2:3
//!      |
//!    2 | [x
//!      |   ^
//!      |
//!   = note: in Todo at 2:1
//!   = note: in Heading at 1:1
//! ```

#pragma once

#include "common.hpp"
#include "parser/parse_error.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace todo::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCodes {
// Parse errors carry their own P001-P003 code, see parser::ParseError::code()
constexpr const char* FILE_NOT_FOUND = "E001";
constexpr const char* CONFIG_ERROR = "C001";
constexpr const char* HANDLER_FAILED = "H001";
constexpr const char* LINK_OUT_OF_RANGE = "L001";
constexpr const char* USAGE = "U001";
} // namespace ErrorCodes

// ============================================================================
// Diagnostic Message
// ============================================================================

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string code;    // Error code (e.g., "P001")
    std::string message; // Main error message
    std::string path;    // File the location refers to; empty for none
    std::optional<SourceLocation> location;
    std::vector<std::string> notes;
    std::vector<std::string> help;
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    // Configuration
    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_source_content(const std::string& path, const std::string& content);

    void emit(const Diagnostic& diag);

    // Error without a source location
    void error(const std::string& code, const std::string& message,
               const std::vector<std::string>& notes = {});

    // A parse error with one note per rule frame
    void parse_error(const std::string& path, const parser::ParseError& error);

    size_t error_count() const {
        return error_count_;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    std::unordered_map<std::string, std::string> source_files_; // path -> content
    size_t error_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const std::string& path, SourceLocation location);
    void emit_notes(const std::vector<std::string>& notes);
    void emit_help(const std::vector<std::string>& help);

    std::string get_source_line(const std::string& path, uint32_t line) const;
    std::string severity_string(DiagnosticSeverity sev) const;
    const char* severity_color(DiagnosticSeverity sev) const;
};

// Get the global diagnostic emitter (stderr)
DiagnosticEmitter& get_diagnostic_emitter();

// Check if stderr is a color-capable terminal
bool terminal_supports_colors();

} // namespace todo::cli
