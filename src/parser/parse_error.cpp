#include "parser/parse_error.hpp"

#include <sstream>

namespace todo::parser {

auto describe_expected(const std::vector<std::string>& expected) -> std::string {
    if (expected.empty()) {
        return "more input";
    }
    if (expected.size() == 1) {
        return expected[0];
    }
    if (expected.size() == 2) {
        return expected[0] + " or " + expected[1];
    }

    std::string out = "one of ";
    for (size_t i = 0; i < expected.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += expected[i];
    }
    return out;
}

auto ParseError::code() const -> std::string_view {
    if (is<UnexpectedToken>())
        return "P001";
    if (is<EndOfInput>())
        return "P002";
    return "P003";
}

auto ParseError::message() const -> std::string {
    if (is<UnexpectedToken>()) {
        const auto& cause = as<UnexpectedToken>();
        return "expected " + describe_expected(cause.expected) + ", got " + cause.got;
    }
    if (is<EndOfInput>()) {
        return "no tokens left, expected " + describe_expected(as<EndOfInput>().expected);
    }
    return as<StructuralViolation>().message;
}

auto ParseError::location() const -> SourceLocation {
    return std::visit([](const auto& c) { return c.location; }, cause);
}

auto ParseError::to_string() const -> std::string {
    std::ostringstream out;
    auto loc = location();
    out << message() << " at " << loc.line << ":" << loc.column;
    for (const auto& frame : frames) {
        out << "\n  in " << frame.rule << " at " << frame.location.line << ":"
            << frame.location.column;
    }
    return out.str();
}

auto ParseError::push_frame(std::string rule, SourceLocation location) -> ParseError& {
    frames.push_back(Frame{.rule = std::move(rule), .location = location});
    return *this;
}

} // namespace todo::parser
