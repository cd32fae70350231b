#include "commentmap/application/commentmap_app.hpp"
#include "commentmap/core/report.hpp"
#include "commentmap/io/document_snapshot.hpp"
#include "commentmap/parsers/parse_error.hpp"
#include <iostream>

namespace commentmap {

CommentMapApp::CommentMapApp(std::unique_ptr<IFileSystem> filesystem,
                             std::unique_ptr<ISourceParser> parser)
    : filesystem_(std::move(filesystem)), parser_(std::move(parser)) {}

auto CommentMapApp::run(const Config& config) -> int {
    auto source = load_source(config);
    if (!source) {
        std::cerr << "Error: Cannot read " << config.source_file << "\n";
        return 1;
    }

    try {
        auto file = parser_->parse(*source);
        auto stats = annotate_with_comments(file, *source, AnnotateOptions{.policy = config.policy});

        if (!write_output(file, config)) {
            std::cerr << "Error: Could not save snapshot to " << config.save_file << "\n";
            return 1;
        }

        if (!config.quiet) {
            show_summary(stats);
        }
    } catch (const ParseError& e) {
        std::cerr << "Error: " << config.source_file << ":" << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

auto CommentMapApp::load_source(const Config& config) -> std::optional<std::string> {
    if (config.source_file.empty() || !filesystem_->file_exists(config.source_file)) {
        return std::nullopt;
    }
    return filesystem_->read_file(config.source_file);
}

auto CommentMapApp::write_output(const SourceFile& file, const Config& config) -> bool {
    if (config.save_file.empty()) {
        for (const auto& line : render_report(file)) {
            std::cout << line << "\n";
        }
        return true;
    }

    if (!filesystem_->write_file(config.save_file, serialize_document(file))) {
        return false;
    }
    if (!config.quiet) {
        std::cout << "Saved snapshot to " << config.save_file << "\n";
    }
    return true;
}

auto CommentMapApp::show_summary(const ApplyStats& stats) -> void {
    std::cout << "Attached " << stats.attached << " comments (" << stats.unassociated
              << " unassociated, " << stats.dropped << " dropped).\n";
}

} // namespace commentmap
