//! # Parser Tests
//!
//! Document trees, todo state resolution, the grammar predicates and the
//! exact shape of parse errors (cause, code and rule path).

#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "parser/rules.hpp"

#include <gtest/gtest.h>

using namespace todo;
using namespace todo::parser;

class ParserTest : public ::testing::Test {
protected:
    config::Config config_;

    auto parse(const std::string& text) -> Result<File, ParseError> {
        return parser::parse(config_, lexer::lex(text));
    }

    auto parse_ok(const std::string& text) -> File {
        auto result = parse(text);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return File{};
        }
        return std::move(unwrap(result));
    }

    auto parse_err(const std::string& text) -> ParseError {
        auto result = parse(text);
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return ParseError{.cause = StructuralViolation{}, .frames = {}};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Documents
// ============================================================================

TEST_F(ParserTest, EmptyDocument) {
    EXPECT_TRUE(parse_ok("").headings.empty());
    EXPECT_TRUE(parse_ok("\n\n").headings.empty());
}

TEST_F(ParserTest, HeadingWithBody) {
    auto file = parse_ok("# Work\n[x] ship\n- note\nSome text\n");
    ASSERT_EQ(file.headings.size(), 1u);

    const auto& heading = file.headings[0];
    EXPECT_EQ(heading.name, "Work");
    ASSERT_EQ(heading.body.size(), 3u);
    EXPECT_TRUE(heading.body[0].is<Todo>());
    EXPECT_TRUE(heading.body[1].is<Bullet>());
    EXPECT_TRUE(heading.body[2].is<Text>());

    const auto& todo = heading.body[0].as<Todo>();
    EXPECT_EQ(todo.state, TodoState::other("x"));
    EXPECT_EQ(lexer::spans_to_string(todo.description.spans), "Normal(\"ship\")");
    EXPECT_EQ(todo.location.line, 2u);
}

TEST_F(ParserTest, HeadingsSeparatedByBlankLines) {
    auto file = parse_ok("# A\n- a\n\n\n\n# B\n- b\n");
    ASSERT_EQ(file.headings.size(), 2u);
    EXPECT_EQ(file.headings[0].name, "A");
    EXPECT_EQ(file.headings[1].name, "B");
    EXPECT_EQ(file.headings[1].body.size(), 1u);
}

TEST_F(ParserTest, HeadingWithEmptyBody) {
    auto file = parse_ok("# A");
    ASSERT_EQ(file.headings.size(), 1u);
    EXPECT_TRUE(file.headings[0].body.empty());
}

TEST_F(ParserTest, LastEntryWithoutNewline) {
    auto file = parse_ok("# A\nfoo");
    ASSERT_EQ(file.headings.size(), 1u);
    ASSERT_EQ(file.headings[0].body.size(), 1u);
    EXPECT_TRUE(file.headings[0].body[0].is<Text>());
}

TEST_F(ParserTest, EntryKindNames) {
    auto file = parse_ok("# A\n[ ] a\n- b\nc\n");
    ASSERT_EQ(file.headings[0].body.size(), 3u);
    EXPECT_EQ(entry_kind_name(file.headings[0].body[0]), "todo");
    EXPECT_EQ(entry_kind_name(file.headings[0].body[1]), "bullet");
    EXPECT_EQ(entry_kind_name(file.headings[0].body[2]), "text");
}

TEST_F(ParserTest, EqualityIgnoresLocations) {
    EXPECT_EQ(parse_ok("# A\n- b\n"), parse_ok("\n\n   # A\n      - b\n"));
    EXPECT_NE(parse_ok("# A\n- b\n"), parse_ok("# A\n- c\n"));
}

// ============================================================================
// Todo States
// ============================================================================

TEST_F(ParserTest, EmptyStateIsUnset) {
    auto file = parse_ok("# A\n[ ] call\n[] call\n");
    ASSERT_EQ(file.headings[0].body.size(), 2u);
    EXPECT_FALSE(file.headings[0].body[0].as<Todo>().state.has_value());
    EXPECT_FALSE(file.headings[0].body[1].as<Todo>().state.has_value());
}

TEST_F(ParserTest, AliasedStateIsDefined) {
    config_.todo_state["x"] = "DONE";
    auto file = parse_ok("# A\n[x] a\n[?] b\n");
    ASSERT_EQ(file.headings[0].body.size(), 2u);
    EXPECT_EQ(file.headings[0].body[0].as<Todo>().state, TodoState::defined("DONE"));
    EXPECT_EQ(file.headings[0].body[1].as<Todo>().state, TodoState::other("?"));
}

TEST_F(ParserTest, ResolveState) {
    config_.todo_state["wip"] = "IN PROGRESS";
    EXPECT_FALSE(resolve_state("", config_).has_value());
    EXPECT_EQ(resolve_state("wip", config_), TodoState::defined("IN PROGRESS"));
    EXPECT_EQ(resolve_state("WIP", config_), TodoState::other("WIP"));
}

// ============================================================================
// Single Rules
// ============================================================================

TEST_F(ParserTest, ParseTodoRule) {
    Parser parser(lexer::lex("[x] *now*\n"), config_);
    auto result = parser.parse_todo();
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).state, TodoState::other("x"));
    EXPECT_EQ(lexer::spans_to_string(unwrap(result).description.spans),
              "Bold[Normal(\"now\")]");
    EXPECT_TRUE(parser.is_at_end());
}

TEST_F(ParserTest, ParseHeadingRuleStopsAtBlankLine) {
    Parser parser(lexer::lex("# A\n- a\n\n# B\n"), config_);
    auto result = parser.parse_heading();
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).name, "A");
    EXPECT_FALSE(parser.is_at_end());
}

TEST_F(ParserTest, CheckPredicates) {
    auto tokens = lexer::lex("# A\n[x] a\n- b\nc\n\n");
    rules::Window window(tokens);

    EXPECT_TRUE(rules::check_heading(window));
    EXPECT_FALSE(rules::check_todo(window));
    EXPECT_TRUE(rules::check_blank_line(window.subspan(1)));
    EXPECT_TRUE(rules::check_todo(window.subspan(2)));
    EXPECT_TRUE(rules::check_todo_state(window.subspan(3)));
    EXPECT_TRUE(rules::check_text(window.subspan(5)));
    EXPECT_TRUE(rules::check_bullet(window.subspan(7)));
    EXPECT_FALSE(rules::check_heading(rules::Window{}));
    EXPECT_FALSE(rules::check_todo(window.subspan(2, 1)));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ParserTest, TextBeforeFirstHeading) {
    auto error = parse_err("stray text\n# A\n");
    ASSERT_TRUE(error.is<UnexpectedToken>());
    EXPECT_EQ(error.code(), "P001");
    EXPECT_EQ(error.message(), "expected heading, got text");
    ASSERT_EQ(error.frames.size(), 1u);
    EXPECT_EQ(error.frames[0].rule, "File");
}

TEST_F(ParserTest, RulePathIsInnermostFirst) {
    auto error = parse_err("# A\n[x\n");
    ASSERT_TRUE(error.is<UnexpectedToken>());
    EXPECT_EQ(error.to_string(), "expected ']', got newline at 2:3\n"
                                 "  in Todo at 2:1\n"
                                 "  in Heading at 1:1\n"
                                 "  in File at 1:1");
}

TEST_F(ParserTest, EndOfInputInsideTodo) {
    auto error = parse_err("# A\n[x");
    ASSERT_TRUE(error.is<EndOfInput>());
    EXPECT_EQ(error.code(), "P002");
    EXPECT_EQ(error.message(), "no tokens left, expected ']'");
    EXPECT_EQ(error.location().line, 2u);
}

TEST_F(ParserTest, NestedHeadingIsStructuralViolation) {
    auto error = parse_err("# A\n- a\n# B\n");
    ASSERT_TRUE(error.is<StructuralViolation>());
    EXPECT_EQ(error.code(), "P003");
    EXPECT_EQ(error.message(), "heading \"B\" cannot nest inside \"A\"");
    EXPECT_EQ(error.location().line, 3u);
    ASSERT_EQ(error.frames.size(), 2u);
    EXPECT_EQ(error.frames[0].rule, "Heading");
    EXPECT_EQ(error.frames[1].rule, "File");
}

TEST_F(ParserTest, NoPartialDocumentOnError) {
    auto result = parse("# A\n- fine\n\n# B\n[oops\n");
    EXPECT_TRUE(is_err(result));
}

TEST_F(ParserTest, DescribeExpected) {
    EXPECT_EQ(describe_expected({}), "more input");
    EXPECT_EQ(describe_expected({"heading"}), "heading");
    EXPECT_EQ(describe_expected({"heading", "newline"}), "heading or newline");
    EXPECT_EQ(describe_expected({"'['", "bullet", "text"}), "one of '[', bullet, text");
}
