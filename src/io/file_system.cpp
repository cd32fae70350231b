#include "commentmap/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace commentmap {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }

    return contents.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& contents) -> bool {
    std::string temp_path = path + ".tmp";

    try {
        // Write to temporary file first for atomic operation
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return false;
            }

            file << contents;
            if (file.fail()) {
                file.close();
                std::filesystem::remove(temp_path);
                return false;
            }
        }

        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code error;
    return std::filesystem::exists(path, error);
}

} // namespace commentmap
