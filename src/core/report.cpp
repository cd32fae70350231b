#include "commentmap/core/report.hpp"
#include "commentmap/core/node_span_collector.hpp"

namespace commentmap {

namespace {

constexpr const char* comment_indent = "    ";

auto append_comments(std::vector<std::string>& output, const Comments& comments) -> void {
    for (const auto& comment : comments) {
        output.push_back(comment_indent + describe_comment(comment));
    }
}

} // namespace

auto describe_comment(const Comment& comment) -> std::string {
    return render_comment(comment) + " @" + std::to_string(comment.span.start_line) + ":"
           + std::to_string(comment.span.start_column);
}

auto render_report(const SourceFile& file) -> std::vector<std::string> {
    std::vector<std::string> output;
    output.reserve(file.items.size() * 2);

    for (size_t i = 0; i < file.items.size(); ++i) {
        const auto& item = file.items[i];
        auto item_id = item_identifier(i);

        auto header = item_id + " " + item_kind_name(item_kind(item));
        if (!item_name(item).empty()) {
            header += " " + item_name(item);
        }
        output.push_back(header);

        if (const auto* comments = item_comments(item)) {
            append_comments(output, *comments);
        }

        const auto* block = item_block(item);
        if (block != nullptr && !block->comments.empty()) {
            output.push_back(block_identifier(item_id));
            append_comments(output, block->comments);
        }
    }

    if (!file.comments.empty()) {
        output.push_back("root");
        append_comments(output, file.comments);
    }

    return output;
}

} // namespace commentmap
