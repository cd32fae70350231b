#pragma once

#include <optional>
#include <string>

namespace commentmap {

// Forward declarations
struct SourceFile;

// Abstract interfaces for dependency injection

// Grammar parser: raw text -> syntax tree. Throws ParseError on malformed input.
class ISourceParser {
public:
    virtual ~ISourceParser() = default;
    virtual auto parse(const std::string& source) -> SourceFile = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file(const std::string& path, const std::string& contents) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

} // namespace commentmap
