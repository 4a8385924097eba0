#include "links/links.hpp"
#include "log/log.hpp"

#include <type_traits>

namespace todo::links {

void collect_spans(const lexer::Spans& spans, SourceLocation location, std::vector<LinkRef>& out) {
    for (const auto& span : spans) {
        std::visit(
            [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, lexer::Link>) {
                    out.push_back(LinkRef{.name = node.name,
                                          .handler = node.handler,
                                          .path = node.path,
                                          .location = location});
                } else if constexpr (!std::is_same_v<T, lexer::Normal>) {
                    collect_spans(node.children, location, out);
                }
            },
            span.kind);
    }
}

auto collect(const parser::File& file) -> std::vector<LinkRef> {
    std::vector<LinkRef> refs;
    for (const auto& heading : file.headings) {
        for (const auto& entry : heading.body) {
            if (entry.is<parser::Todo>()) {
                const auto& todo = entry.as<parser::Todo>();
                collect_spans(todo.description.spans, todo.location, refs);
            } else if (entry.is<parser::Bullet>()) {
                const auto& bullet = entry.as<parser::Bullet>();
                collect_spans(bullet.text.spans, bullet.location, refs);
            } else {
                const auto& text = entry.as<parser::Text>();
                collect_spans(text.spans, text.location, refs);
            }
        }
    }
    return refs;
}

auto is_known(std::string_view handler, const config::Config& config) -> bool {
    return config.handlers.find(std::string(handler)) != config.handlers.end();
}

auto shell_quote(std::string_view text) -> std::string {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

auto expand_command(std::string_view command_template, std::string_view path) -> std::string {
    constexpr std::string_view placeholder = "{path}";
    auto quoted = shell_quote(path);

    std::string out;
    bool substituted = false;
    size_t pos = 0;
    while (true) {
        auto found = command_template.find(placeholder, pos);
        if (found == std::string_view::npos) {
            out += command_template.substr(pos);
            break;
        }
        out += command_template.substr(pos, found - pos);
        out += quoted;
        substituted = true;
        pos = found + placeholder.size();
    }

    if (!substituted) {
        out += " " + quoted;
    }
    return out;
}

auto dispatch(LinkDispatcher& dispatcher, const config::Config& config, const std::string& handler,
              const std::string& path) -> Result<bool, HandlerDispatchError> {
    auto it = config.handlers.find(handler);
    if (it == config.handlers.end()) {
        return HandlerDispatchError{.handler = handler,
                                    .message = "unknown link handler '" + handler + "'"};
    }

    auto command = expand_command(it->second, path);
    TODO_LOG_DEBUG("links", "Dispatching " << handler << ": " << command);
    return dispatcher.open(handler, command);
}

} // namespace todo::links
