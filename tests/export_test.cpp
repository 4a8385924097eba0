//! # Export Tests
//!
//! The JSON document tree behind `todo raw` and the widget markup behind
//! `todo eww-show`.

#include "export/json_export.hpp"
#include "export/widget_export.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>

using namespace todo;
using namespace todo::exporter;

class ExportTest : public ::testing::Test {
protected:
    config::Config config_;

    auto parse(const std::string& text) -> parser::File {
        auto result = parser::parse(config_, lexer::lex(text));
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return parser::File{};
        }
        return std::move(unwrap(result));
    }

    auto first_span(const std::string& line) -> lexer::Span {
        auto tokens = lexer::lex(line);
        EXPECT_FALSE(tokens.empty());
        EXPECT_FALSE(tokens[0].spans().empty());
        return tokens[0].spans()[0];
    }
};

// ============================================================================
// JSON Export
// ============================================================================

TEST_F(ExportTest, DocumentShape) {
    auto json = to_json(parse("# Work\n[x] ship\n- note\ntext\n"), config_);

    const auto* headings = json.get("headings");
    ASSERT_NE(headings, nullptr);
    ASSERT_EQ(headings->size(), 1u);

    const auto& heading = (*headings)[0];
    ASSERT_NE(heading.get("name"), nullptr);
    EXPECT_EQ(heading.get("name")->as_string(), "Work");

    const auto* body = heading.get("body");
    ASSERT_NE(body, nullptr);
    ASSERT_EQ(body->size(), 3u);
    EXPECT_EQ((*body)[0].get("type")->as_string(), "todo");
    EXPECT_EQ((*body)[1].get("type")->as_string(), "bullet");
    EXPECT_EQ((*body)[2].get("type")->as_string(), "text");
    EXPECT_NE((*body)[1].get("text"), nullptr);
}

TEST_F(ExportTest, TodoEntry) {
    auto json = to_json(parse("# A\n[x] ship\n"), config_);
    EXPECT_EQ(json.to_string(),
              "{\"headings\":[{\"body\":[{\"description\":[{\"kind\":\"normal\",\"text\":\"ship\"}],"
              "\"state\":{\"kind\":\"other\",\"value\":\"x\"},\"type\":\"todo\"}],\"name\":\"A\"}]}");
}

TEST_F(ExportTest, StateToJson) {
    EXPECT_TRUE(state_to_json(std::nullopt).is_null());
    EXPECT_EQ(state_to_json(parser::TodoState::defined("DONE")).to_string(),
              "{\"kind\":\"defined\",\"value\":\"DONE\"}");
}

TEST_F(ExportTest, StyledSpan) {
    EXPECT_EQ(span_to_json(first_span("*a /b/*"), config_).to_string(),
              "{\"children\":[{\"kind\":\"normal\",\"text\":\"a \"},"
              "{\"children\":[{\"kind\":\"normal\",\"text\":\"b\"}],\"kind\":\"italic\"}],"
              "\"kind\":\"bold\"}");
}

TEST_F(ExportTest, TextExtraSpan) {
    EXPECT_EQ(span_to_json(first_span("`open"), config_).to_string(),
              "{\"children\":[{\"kind\":\"normal\",\"text\":\"open\"}],\"delimiter\":\"`\","
              "\"kind\":\"text_extra\"}");
}

TEST_F(ExportTest, LinkSpanReportsKnownHandler) {
    auto span = first_span("|docs[open:/tmp/x]|");
    EXPECT_EQ(span_to_json(span, config_).to_string(),
              "{\"handler\":\"open\",\"kind\":\"link\",\"known\":false,\"name\":\"docs\","
              "\"path\":\"/tmp/x\"}");

    config_.handlers["open"] = "xdg-open {path}";
    EXPECT_TRUE(span_to_json(span, config_).get("known")->as_bool());
}

// ============================================================================
// Widget Export
// ============================================================================

TEST_F(ExportTest, WidgetNormal) {
    EXPECT_EQ(span_to_widget(first_span("hello")), "(label :halign \"start\" :text \"hello\")");
}

TEST_F(ExportTest, WidgetStyled) {
    EXPECT_EQ(span_to_widget(first_span("*hi*")),
              "(box :style \"font-weight: bold;\" :halign \"start\" "
              "(label :halign \"start\" :text \"hi\"))");
}

TEST_F(ExportTest, WidgetTextExtra) {
    EXPECT_EQ(span_to_widget(first_span("`x")),
              "(box :space-evenly false :halign \"start\" (label :halign \"start\" :text \"`\") "
              "(label :halign \"start\" :text \"x\"))");
}

TEST_F(ExportTest, WidgetLink) {
    EXPECT_EQ(span_to_widget(first_span("|docs[open:/tmp/x]|")),
              "(button :style \"all: unset\" :onclick \"todo open-link-raw 'open' '/tmp/x' &\" "
              ":halign \"start\" (label :style \"text-decoration: underline; "
              "text-decoration-color: #ff5370;\" :halign \"start\" :text \"docs\"))");
}

TEST_F(ExportTest, WidgetLinkQuotesShellArguments) {
    auto span = first_span("|n[open:$(touch /tmp/x) `id`]|");
    const auto& link = std::get<lexer::Link>(span.kind);

    EXPECT_EQ(link_command(link, {}), "todo open-link-raw 'open' '$(touch /tmp/x) `id`' &");
    EXPECT_NE(span_to_widget(span).find(":onclick \"todo open-link-raw 'open' "
                                        "'$(touch /tmp/x) `id`' &\""),
              std::string::npos);
}

TEST_F(ExportTest, WidgetLinkQuotesSingleQuotesInPath) {
    auto span = first_span("|n[open:it's]|");
    EXPECT_EQ(link_command(std::get<lexer::Link>(span.kind), {}),
              "todo open-link-raw 'open' 'it'\\''s' &");
}

TEST_F(ExportTest, WidgetLinkForwardsConfigPath) {
    auto span = first_span("|n[open:/tmp/x]|");
    WidgetOptions options{.config_path = "/home/me/todo \"cfg\".toml"};

    EXPECT_EQ(link_command(std::get<lexer::Link>(span.kind), options),
              "todo open-link-raw 'open' '/tmp/x' '--config=/home/me/todo \"cfg\".toml' &");
    EXPECT_NE(span_to_widget(span, options)
                  .find(":onclick \"todo open-link-raw 'open' '/tmp/x' "
                        "'--config=/home/me/todo \\\"cfg\\\".toml' &\""),
              std::string::npos);
}

TEST_F(ExportTest, WidgetEscapesQuotes) {
    EXPECT_EQ(widget_escape("say \"hi\" \\o/"), "say \\\"hi\\\" \\\\o/");
    EXPECT_EQ(span_to_widget(first_span("a \"b\"")),
              "(label :halign \"start\" :text \"a \\\"b\\\"\")");
}

TEST_F(ExportTest, WidgetStyles) {
    EXPECT_EQ(widget_style('`'), "color: #c3e88d;");
    EXPECT_EQ(widget_style('_'), "text-decoration: underline;");
    EXPECT_EQ(widget_style('-'), "text-decoration: line-through;");
    EXPECT_EQ(widget_style('/'), "font-style: italic;");
}

TEST_F(ExportTest, WidgetListsTodosOnly) {
    config_.todo_state_ops = config::TodoStateOps{.default_state = "TODO", .brackets = true};
    auto widget = to_widget(parse("# A\n[ ] a *b*\n- skip\n\n# B\n[x] c\n"), config_);

    ASSERT_TRUE(widget.is_array());
    ASSERT_EQ(widget.size(), 2u);
    EXPECT_EQ(widget[0].get("state")->as_string(), "TODO");
    EXPECT_EQ(widget[0].get("description")->size(), 2u);
    EXPECT_EQ(widget[1].get("state")->as_string(), "x");
}
