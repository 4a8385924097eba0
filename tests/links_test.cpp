//! # Link Tests
//!
//! Link collection order, handler command expansion and dispatch through a
//! recording dispatcher, so no shell command ever runs.

#include "lexer/lexer.hpp"
#include "links/links.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>

using namespace todo;
using namespace todo::links;

namespace {

class RecordingDispatcher : public LinkDispatcher {
public:
    struct Call {
        std::string handler;
        std::string command;
    };

    std::vector<Call> calls;
    bool fail = false;

    auto open(const std::string& handler, const std::string& command)
        -> Result<bool, HandlerDispatchError> override {
        calls.push_back({handler, command});
        if (fail) {
            return HandlerDispatchError{.handler = handler, .message = "exit status 1"};
        }
        return true;
    }
};

} // namespace

class LinksTest : public ::testing::Test {
protected:
    config::Config config_;
    RecordingDispatcher dispatcher_;

    auto parse(const std::string& text) -> parser::File {
        auto result = parser::parse(config_, lexer::lex(text));
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return parser::File{};
        }
        return std::move(unwrap(result));
    }
};

// ============================================================================
// Collection
// ============================================================================

TEST_F(LinksTest, CollectsInDocumentOrder) {
    auto refs = collect(parse("# A\n[ ] read |spec[web:https://x.org]|\n- |notes[open:~/n.md]|\n"
                              "see |a[h:1]| and |b[h:2]|\n\n# B\n- *|deep[h:3]|*\n"));

    ASSERT_EQ(refs.size(), 5u);
    EXPECT_EQ(refs[0].name, "spec");
    EXPECT_EQ(refs[0].handler, "web");
    EXPECT_EQ(refs[0].path, "https://x.org");
    EXPECT_EQ(refs[1].name, "notes");
    EXPECT_EQ(refs[2].name, "a");
    EXPECT_EQ(refs[3].name, "b");
    EXPECT_EQ(refs[4].name, "deep");
    EXPECT_EQ(refs[4].location.line, 7u);
}

TEST_F(LinksTest, NoLinks) {
    EXPECT_TRUE(collect(parse("# A\n- plain | pipe\n")).empty());
}

// ============================================================================
// Commands
// ============================================================================

TEST(LinkCommandTest, ShellQuote) {
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(LinkCommandTest, ExpandPlaceholder) {
    EXPECT_EQ(expand_command("xdg-open {path}", "/tmp/a b"), "xdg-open '/tmp/a b'");
    EXPECT_EQ(expand_command("cp {path} {path}.bak", "f"), "cp 'f' 'f'.bak");
}

TEST(LinkCommandTest, AppendWithoutPlaceholder) {
    EXPECT_EQ(expand_command("firefox", "https://x.org"), "firefox 'https://x.org'");
}

TEST(LinkCommandTest, PathCannotInjectCommands) {
    EXPECT_EQ(expand_command("open {path}", "x'; rm -rf ~; '"), "open 'x'\\''; rm -rf ~; '\\'''");
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(LinksTest, DispatchKnownHandler) {
    config_.handlers["web"] = "firefox {path}";
    auto result = dispatch(dispatcher_, config_, "web", "https://x.org");

    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(dispatcher_.calls.size(), 1u);
    EXPECT_EQ(dispatcher_.calls[0].handler, "web");
    EXPECT_EQ(dispatcher_.calls[0].command, "firefox 'https://x.org'");
}

TEST_F(LinksTest, UnknownHandlerNeverReachesDispatcher) {
    auto result = dispatch(dispatcher_, config_, "nope", "x");

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).handler, "nope");
    EXPECT_EQ(unwrap_err(result).message, "unknown link handler 'nope'");
    EXPECT_TRUE(dispatcher_.calls.empty());
}

TEST_F(LinksTest, DispatcherFailurePropagates) {
    config_.handlers["open"] = "xdg-open";
    dispatcher_.fail = true;
    auto result = dispatch(dispatcher_, config_, "open", "x");

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "exit status 1");
}

TEST_F(LinksTest, IsKnown) {
    config_.handlers["open"] = "xdg-open {path}";
    EXPECT_TRUE(is_known("open", config_));
    EXPECT_FALSE(is_known("web", config_));
}
