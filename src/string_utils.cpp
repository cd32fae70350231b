#include "commentmap/string_utils.hpp"

namespace commentmap {

auto StringUtils::trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto StringUtils::split_lines(std::string_view source) -> std::vector<SourceLine> {
    std::vector<SourceLine> lines;
    size_t offset = 0;
    size_t number = 1;

    while (offset < source.size()) {
        auto newline = source.find('\n', offset);
        auto end = newline == std::string_view::npos ? source.size() : newline;

        auto text = source.substr(offset, end - offset);
        if (!text.empty() && text.back() == '\r') {
            text.remove_suffix(1);
        }
        lines.push_back(SourceLine{.text = text, .number = number, .offset = offset});

        if (newline == std::string_view::npos) {
            break;
        }
        offset = newline + 1;
        ++number;
    }

    return lines;
}

auto StringUtils::split(std::string_view text, char separator) -> std::vector<std::string> {
    std::vector<std::string> fields;
    size_t start = 0;

    while (true) {
        auto pos = text.find(separator, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(text.substr(start));
            break;
        }
        fields.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }

    return fields;
}

} // namespace commentmap
