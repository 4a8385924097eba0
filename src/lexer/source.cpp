#include "lexer/source.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace todo::lexer {

namespace {

// Documents saved with CRLF endings would otherwise leak '\r' into body text.
auto normalize_line_endings(std::string content) -> std::string {
    if (content.find('\r') == std::string::npos) {
        return content;
    }

    std::string result;
    result.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
            continue;
        }
        result += content[i];
    }
    return result;
}

} // namespace

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(normalize_line_endings(std::move(content))) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.assign(1, 0);
    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto Source::at(size_t offset) const -> char {
    return offset < content_.size() ? content_[offset] : '\0';
}

auto Source::location(size_t offset) const -> SourceLocation {
    offset = std::min(offset, content_.size());

    // Last line start that is <= offset
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    --it;

    auto line_index = static_cast<uint32_t>(it - line_offsets_.begin());
    return SourceLocation{.line = line_index + 1,
                          .column = static_cast<uint32_t>(offset - *it) + 1,
                          .offset = static_cast<uint32_t>(offset)};
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return {};
    }

    auto start = line_offsets_[line_num - 1];
    auto end = line_num < line_offsets_.size() ? line_offsets_[line_num] - 1 : content_.size();
    return std::string_view(content_).substr(start, end - start);
}

auto Source::line_count() const -> uint32_t {
    return static_cast<uint32_t>(line_offsets_.size());
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return "No such todo file: " + path;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return "Failed to read file: " + path;
    }

    return Source(path, buffer.str());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace todo::lexer
