#pragma once

#include "commentmap/interfaces.hpp"
#include <optional>
#include <string>

namespace commentmap {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file(const std::string& path, const std::string& contents) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
};

} // namespace commentmap
