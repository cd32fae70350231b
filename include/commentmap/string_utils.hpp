#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace commentmap {

// One physical line of a source text
struct SourceLine {
    std::string_view text;  // Without the line terminator
    size_t number{};        // 1-based
    size_t offset{};        // Byte offset of the first character
};

class StringUtils {
public:
    // Remove leading and trailing whitespace
    static auto trim(std::string_view text) -> std::string;

    // Split on '\n'; a trailing '\r' is dropped and a final empty line after the
    // last terminator is not reported
    static auto split_lines(std::string_view source) -> std::vector<SourceLine>;

    // Split on a single-character separator, keeping empty fields
    static auto split(std::string_view text, char separator) -> std::vector<std::string>;
};

} // namespace commentmap
