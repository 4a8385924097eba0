#include "parser/document.hpp"

namespace todo::parser {

auto UnderHeading::location() const -> SourceLocation {
    return std::visit([](const auto& entry) { return entry.location; }, kind);
}

auto entry_kind_name(const UnderHeading& entry) -> std::string_view {
    if (entry.is<Todo>())
        return "todo";
    if (entry.is<Bullet>())
        return "bullet";
    return "text";
}

} // namespace todo::parser
