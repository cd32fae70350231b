#pragma once

#include <stdexcept>
#include <string>

namespace commentmap {

// Malformed source handed to a parser
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, size_t line, size_t column);

    auto line() const -> size_t { return line_; }
    auto column() const -> size_t { return column_; }

private:
    size_t line_;
    size_t column_;
};

} // namespace commentmap
