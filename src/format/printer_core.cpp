//! # Printer Core
//!
//! Output buffering and the document-level layout.
//!
//! | Method             | Description                                |
//! |--------------------|--------------------------------------------|
//! | `print()`          | Print a complete file to a string          |
//! | `print_heading()`  | `# name` followed by the indented body     |
//! | `print_entry()`    | One todo, bullet or paragraph              |
//! | `emit_line()`      | Write an indented line with a newline      |

#include "format/printer.hpp"

#include <algorithm>

namespace todo::format {

Printer::Printer(const config::Config& config, PrintOptions options)
    : config_(config), options_(options) {}

void Printer::emit_line(const std::string& text) {
    output_ << indent_str() << text << "\n";
}

void Printer::emit_newline() {
    output_ << "\n";
}

auto Printer::indent_str() const -> std::string {
    return std::string(static_cast<size_t>(std::max(options_.indent_width, 0)), ' ');
}

auto Printer::print(const parser::File& file) -> std::string {
    output_.str("");

    for (size_t i = 0; i < file.headings.size(); ++i) {
        print_heading(file.headings[i]);
        if (i + 1 < file.headings.size()) {
            emit_newline();
        }
    }

    return output_.str();
}

void Printer::print_heading(const parser::Heading& heading) {
    output_ << (heading.name.empty() ? "#" : "# " + heading.name) << "\n";
    for (const auto& entry : heading.body) {
        print_entry(entry);
    }
}

void Printer::print_entry(const parser::UnderHeading& entry) {
    if (entry.is<parser::Todo>()) {
        const auto& todo = entry.as<parser::Todo>();
        std::string line = todo_state(todo.state);
        std::string description = text(todo.description);
        if (!description.empty()) {
            line += " " + description;
        }
        emit_line(line);
        return;
    }

    if (entry.is<parser::Bullet>()) {
        std::string line = bullet_point();
        std::string body = text(entry.as<parser::Bullet>().text);
        if (!body.empty()) {
            line += " " + body;
        }
        emit_line(line);
        return;
    }

    print_paragraph(entry.as<parser::Text>());
}

void Printer::print_paragraph(const parser::Text& paragraph) {
    auto width = std::max(options_.width - options_.indent_width, 1);
    for (const auto& line : wrap(text(paragraph), static_cast<size_t>(width))) {
        emit_line(line);
    }
}

namespace {

// A line beginning with one of these lexes as a heading, todo or bullet
auto starts_line_token(std::string_view word) -> bool {
    return word.front() == '#' || word.front() == '[' || word.front() == '-';
}

} // namespace

auto wrap(std::string_view text, size_t width) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::string current;

    size_t pos = 0;
    while (pos < text.size()) {
        auto end = text.find(' ', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto word = text.substr(pos, end - pos);
        pos = end + 1;
        if (word.empty()) {
            continue;
        }

        if (!current.empty() && current.size() + 1 + word.size() > width &&
            !starts_line_token(word)) {
            lines.push_back(std::move(current));
            current.clear();
        }
        if (!current.empty()) {
            current += ' ';
        }
        current += word;
    }

    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

} // namespace todo::format
