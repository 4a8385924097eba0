//! # Document Printer
//!
//! Serializes a `File` tree back to todo markup. Printing never fails, and
//! its output parses back to the same tree except where paragraphs were
//! reflowed to the terminal width.
//!
//! ## Layout
//!
//! ```text
//! # Work
//!     [DONE] ship the *release*
//!     - check the /changelog/
//!     Paragraph text is wrapped at the width minus the indent and
//!     indented as a block.
//!
//! # Home
//! ```
//!
//! ## State Policy
//!
//! | `todo_state_ops`  | Set state       | Empty state     |
//! |-------------------|-----------------|-----------------|
//! | absent            | `[value]`       | `[ ]`           |
//! | brackets = true   | `[value]`       | `[default]`     |
//! | brackets = false  | `value`         | `default`       |

#ifndef TODO_FORMAT_PRINTER_HPP
#define TODO_FORMAT_PRINTER_HPP

#include "config/config.hpp"
#include "parser/document.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace todo::format {

// Printer options
struct PrintOptions {
    int width = 80;       // Terminal width; paragraphs wrap at width - indent
    int indent_width = 4; // Spaces before each heading body entry
};

class Printer {
public:
    /// The config is borrowed and must outlive the printer.
    explicit Printer(const config::Config& config, PrintOptions options = {});

    // Print a complete document
    [[nodiscard]] auto print(const parser::File& file) -> std::string;

    /// Display text of a state without brackets, applying the default.
    [[nodiscard]] auto state_text(const std::optional<parser::TodoState>& state) const
        -> std::string;

    /// State as printed before a todo description, brackets included.
    [[nodiscard]] auto todo_state(const std::optional<parser::TodoState>& state) const
        -> std::string;

    /// Bullet marker, `-` unless configured.
    [[nodiscard]] auto bullet_point() const -> std::string;

    [[nodiscard]] static auto text(const parser::Text& text) -> std::string;
    [[nodiscard]] static auto spans(const lexer::Spans& spans) -> std::string;
    [[nodiscard]] static auto span(const lexer::Span& span) -> std::string;

private:
    const config::Config& config_;
    PrintOptions options_;
    std::ostringstream output_;

    void emit_line(const std::string& text);
    void emit_newline();
    [[nodiscard]] auto indent_str() const -> std::string;

    void print_heading(const parser::Heading& heading);
    void print_entry(const parser::UnderHeading& entry);
    void print_paragraph(const parser::Text& text);
};

/// Greedy word wrap. Words are split on spaces and never broken, so a word
/// longer than `width` gets a line of its own. A word starting with `#`, `[`
/// or `-` never starts a continuation line; it stays on the previous line
/// even past `width`, so the wrapped lines still read back as text.
[[nodiscard]] auto wrap(std::string_view text, size_t width) -> std::vector<std::string>;

} // namespace todo::format

#endif // TODO_FORMAT_PRINTER_HPP
