//! # Diagnostic Tests
//!
//! Rendering of CLI diagnostics: header, source snippet with caret, rule
//! path notes and help lines. Colors are off for stream output.

#include "cli/diagnostic.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace todo;
using namespace todo::cli;

class DiagnosticTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    DiagnosticEmitter emitter_{out_};

    auto parse_error_of(const std::string& text) -> parser::ParseError {
        config::Config config;
        auto result = parser::parse(config, lexer::lex(text));
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return parser::ParseError{.cause = parser::StructuralViolation{}, .frames = {}};
        }
        return unwrap_err(result);
    }
};

TEST_F(DiagnosticTest, ErrorWithoutLocation) {
    emitter_.error(ErrorCodes::FILE_NOT_FOUND, "No such todo file: a.todo");
    EXPECT_EQ(out_.str(), "error[E001]: No such todo file: a.todo\n");
    EXPECT_EQ(emitter_.error_count(), 1u);
}

TEST_F(DiagnosticTest, ErrorWithNotes) {
    emitter_.error(ErrorCodes::USAGE, "missing arguments", {"usage: todo show <file>"});
    EXPECT_EQ(out_.str(), "error[U001]: missing arguments\n"
                          "  = note: usage: todo show <file>\n");
}

TEST_F(DiagnosticTest, ParseErrorWithSnippet) {
    std::string text = "# A\n[x\n";
    emitter_.set_source_content("today.todo", text);
    emitter_.parse_error("today.todo", parse_error_of(text));

    EXPECT_EQ(out_.str(), "error[P001]: expected ']', got newline\n"
                          "  --> today.todo:2:3\n"
                          "     |\n"
                          "   2 | [x\n"
                          "     |   ^\n"
                          "     |\n"
                          "  = note: in Todo at 2:1\n"
                          "  = note: in Heading at 1:1\n"
                          "  = note: in File at 1:1\n");
}

TEST_F(DiagnosticTest, StructuralViolationSuggestsBlankLine) {
    std::string text = "# A\n# B\n";
    emitter_.set_source_content("today.todo", text);
    emitter_.parse_error("today.todo", parse_error_of(text));

    auto output = out_.str();
    EXPECT_EQ(output.rfind("error[P003]: heading \"B\" cannot nest inside \"A\"\n", 0), 0u);
    EXPECT_NE(output.find("  = help: separate headings with a blank line\n"), std::string::npos);
}

TEST_F(DiagnosticTest, UnregisteredSourceSkipsSnippet) {
    emitter_.emit(Diagnostic{.severity = DiagnosticSeverity::Error,
                             .code = "P002",
                             .message = "no tokens left, expected ']'",
                             .path = "other.todo",
                             .location = SourceLocation{.line = 2, .column = 2, .offset = 5},
                             .notes = {},
                             .help = {}});
    EXPECT_EQ(out_.str(), "error[P002]: no tokens left, expected ']'\n"
                          "  --> other.todo:2:2\n");
}

TEST_F(DiagnosticTest, Warning) {
    emitter_.emit(Diagnostic{.severity = DiagnosticSeverity::Warning,
                             .code = "",
                             .message = "ignoring unknown section",
                             .path = "config.toml",
                             .location = std::nullopt,
                             .notes = {},
                             .help = {}});
    EXPECT_EQ(out_.str(), "warning: ignoring unknown section\n  --> config.toml\n");
    EXPECT_EQ(emitter_.error_count(), 0u);
}
