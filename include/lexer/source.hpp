//! # Source Document Management
//!
//! This module provides the in-memory representation of a todo document.
//! It owns the document text and maps byte offsets to line/column positions
//! for tokens and diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("today.todo");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! Source source = std::move(unwrap(result));
//!
//! SourceLocation loc = source.location(4); // line 1, column 5
//! std::string_view line = source.line(1);
//! ```

#ifndef TODO_LEXER_SOURCE_HPP
#define TODO_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace todo::lexer {

/// A todo document with line-offset indexing.
///
/// The source owns its content, with CRLF line endings folded to LF on
/// construction. String views returned by `content()` and `line()` are valid
/// as long as the Source object exists.
class Source {
public:
    /// Constructs a source from a name and content. Builds the line index.
    Source(std::string filename, std::string content);

    /// Returns the entire document as a string view.
    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// Returns the filename or identifier for this source.
    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    /// Returns the length of the document in bytes.
    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset, or '\0' when out of bounds.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the content of a line (1-indexed), without its newline.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Returns the total number of lines.
    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a document from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace todo::lexer

#endif // TODO_LEXER_SOURCE_HPP
