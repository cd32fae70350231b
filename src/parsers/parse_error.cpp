#include "commentmap/parsers/parse_error.hpp"

namespace commentmap {

ParseError::ParseError(const std::string& message, size_t line, size_t column)
    : std::runtime_error(std::to_string(line) + ":" + std::to_string(column) + ": " + message),
      line_(line), column_(column) {}

} // namespace commentmap
