#pragma once

#include "commentmap/core/annotate.hpp"
#include "commentmap/interfaces.hpp"
#include <memory>
#include <optional>
#include <string>

namespace commentmap {

struct Config {
    std::string source_file;
    AssociationPolicy policy = AssociationPolicy::CONSERVATIVE;
    std::string save_file;  // Write a snapshot here instead of printing the report
    bool quiet = false;
};

class CommentMapApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<ISourceParser> parser_;

public:
    CommentMapApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<ISourceParser> parser);

    auto run(const Config& config) -> int;

private:
    auto load_source(const Config& config) -> std::optional<std::string>;
    auto write_output(const SourceFile& file, const Config& config) -> bool;
    auto show_summary(const ApplyStats& stats) -> void;
};

} // namespace commentmap
