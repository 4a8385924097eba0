#include "diagnostic.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

#include <unistd.h>

namespace todo::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    if (std::getenv("NO_COLOR"))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = &out == &std::cerr && terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0)
        return "";

    const std::string& content = it->second;
    size_t line_start = 0;
    for (uint32_t current = 1; current < line; ++current) {
        line_start = content.find('\n', line_start);
        if (line_start == std::string::npos)
            return "";
        ++line_start;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    std::string result = content.substr(line_start, line_end - line_start);
    if (!result.empty() && result.back() == '\r')
        result.pop_back();
    return result;
}

std::string DiagnosticEmitter::severity_string(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Note:
        return "note";
    }
    return "unknown";
}

const char* DiagnosticEmitter::severity_color(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return Colors::BrightRed;
    case DiagnosticSeverity::Warning:
        return Colors::BrightYellow;
    case DiagnosticSeverity::Note:
        return Colors::BrightCyan;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[P001]: message
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_string(diag.severity);

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const std::string& path, SourceLocation location) {
    // Location line: --> file:line:column
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << path << ":"
         << location.line << ":" << location.column << "\n";

    std::string source_line = get_source_line(path, location.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = std::max(static_cast<int>(std::to_string(location.line).length()), 4);
    auto gutter = [&](bool with_space) {
        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << (with_space ? " | " : " |")
             << color(Colors::Reset);
    };

    gutter(false);
    out_ << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << location.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    gutter(true);
    uint32_t start_col = location.column > 0 ? location.column - 1 : 0;
    out_ << std::string(std::min<size_t>(start_col, source_line.size()), ' ')
         << color(Colors::BrightRed) << "^" << color(Colors::Reset) << "\n";

    gutter(false);
    out_ << "\n";
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
}

void DiagnosticEmitter::emit_help(const std::vector<std::string>& help) {
    for (const auto& h : help) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": " << h
             << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    }

    emit_header(diag);
    if (diag.location) {
        emit_source_snippet(diag.path, *diag.location);
    } else if (!diag.path.empty()) {
        out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << diag.path
             << "\n";
    }
    emit_notes(diag.notes);
    emit_help(diag.help);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const std::vector<std::string>& notes) {
    emit(Diagnostic{.severity = DiagnosticSeverity::Error,
                    .code = code,
                    .message = message,
                    .path = {},
                    .location = std::nullopt,
                    .notes = notes,
                    .help = {}});
}

void DiagnosticEmitter::parse_error(const std::string& path, const parser::ParseError& error) {
    std::vector<std::string> notes;
    for (const auto& frame : error.frames) {
        notes.push_back("in " + frame.rule + " at " + std::to_string(frame.location.line) + ":" +
                        std::to_string(frame.location.column));
    }

    Diagnostic diag{.severity = DiagnosticSeverity::Error,
                    .code = std::string(error.code()),
                    .message = error.message(),
                    .path = path,
                    .location = error.location(),
                    .notes = std::move(notes),
                    .help = {}};

    if (error.is<parser::StructuralViolation>()) {
        diag.help.push_back("separate headings with a blank line");
    }
    emit(diag);
}

} // namespace todo::cli
