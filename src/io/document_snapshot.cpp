#include "commentmap/io/document_snapshot.hpp"
#include "commentmap/core/annotation_applier.hpp"
#include "commentmap/core/node_span_collector.hpp"
#include "commentmap/string_utils.hpp"
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

namespace commentmap {

namespace {

constexpr char field_separator = '|';
constexpr const char* no_span = "-";
constexpr const char* root_owner = "root";

auto span_to_string(const SpanInfo& span) -> std::string {
    std::ostringstream out;
    out << span.start_line << ':' << span.start_column << ':' << span.end_line << ':'
        << span.end_column << ':' << span.start_offset << ':' << span.end_offset;
    return out.str();
}

auto optional_span_to_string(const std::optional<SpanInfo>& span) -> std::string {
    return span ? span_to_string(*span) : no_span;
}

auto parse_number(const std::string& text) -> std::optional<size_t> {
    size_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

auto string_to_span(const std::string& text) -> std::optional<SpanInfo> {
    auto fields = StringUtils::split(text, ':');
    if (fields.size() != 6) {
        return std::nullopt;
    }

    std::vector<size_t> values;
    for (const auto& field : fields) {
        auto value = parse_number(field);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }

    SpanInfo span{.start_line = values[0],
                  .start_column = values[1],
                  .end_line = values[2],
                  .end_column = values[3],
                  .start_offset = values[4],
                  .end_offset = values[5]};
    if (!is_well_formed(span)) {
        return std::nullopt;
    }
    return span;
}

// Fields from first onwards joined back together; names and comment texts may contain '|'
auto join_fields(const std::vector<std::string>& fields, size_t first, size_t last)
    -> std::string {
    std::string joined;
    for (size_t i = first; i < last; ++i) {
        if (i > first) {
            joined += field_separator;
        }
        joined += fields[i];
    }
    return joined;
}

auto write_comments(std::ostream& out, const std::string& owner, const Comments& comments)
    -> void {
    for (const auto& comment : comments) {
        out << "comment" << field_separator << owner << field_separator
            << comment_kind_name(comment.kind) << field_separator
            << span_to_string(comment.span) << field_separator << comment.text << "\n";
    }
}

// Reads the records of one snapshot; items must arrive in index order
class SnapshotReader {
public:
    auto read_line(const std::string& line) -> void {
        auto fields = StringUtils::split(line, field_separator);
        if (fields.empty()) {
            return;
        }

        bool accepted = false;
        if (fields[0] == "item") {
            accepted = read_item(fields);
        } else if (fields[0] == "block") {
            accepted = read_block(fields);
        } else if (fields[0] == "comment") {
            accepted = read_comment(fields);
        }

        if (accepted) {
            ++records_;
        }
    }

    auto records() const -> size_t { return records_; }

    auto finish() -> SourceFile {
        // Owners were validated on read
        auto stats = apply_associations(file_, std::move(associations_));
        if (stats.dropped > 0) {
            std::cerr << "Warning: Snapshot dropped " << stats.dropped << " comments\n";
        }
        return std::move(file_);
    }

private:
    auto read_item(const std::vector<std::string>& fields) -> bool {
        if (fields.size() < 5) {
            return false;
        }

        auto index = parse_number(fields[1]);
        auto kind = parse_item_kind(fields[2]);
        if (!index || *index != file_.items.size() || !kind) {
            return false;
        }

        std::optional<SpanInfo> span;
        if (fields.back() != no_span) {
            span = string_to_span(fields.back());
            if (!span) {
                return false;
            }
        }

        file_.items.push_back(make_item(*kind, join_fields(fields, 3, fields.size() - 1), span));
        return true;
    }

    auto read_block(const std::vector<std::string>& fields) -> bool {
        if (fields.size() != 3) {
            return false;
        }

        auto index = parse_number(fields[1]);
        if (!index || *index >= file_.items.size()) {
            return false;
        }

        auto* block = item_block(file_.items[*index]);
        if (block == nullptr) {
            return false;
        }

        if (fields[2] == no_span) {
            block->span = std::nullopt;
            return true;
        }

        auto span = string_to_span(fields[2]);
        if (!span) {
            return false;
        }
        block->span = span;
        return true;
    }

    auto read_comment(const std::vector<std::string>& fields) -> bool {
        if (fields.size() < 5) {
            return false;
        }

        auto kind = parse_comment_kind(fields[2]);
        auto span = string_to_span(fields[3]);
        if (!kind || !span) {
            return false;
        }

        Comment comment{
            .text = join_fields(fields, 4, fields.size()), .span = *span, .kind = *kind};

        const auto& owner = fields[1];
        if (owner == root_owner) {
            associations_.unassociated.push_back(std::move(comment));
            return true;
        }
        if (!owner_exists(owner)) {
            return false;
        }
        associations_.by_node[owner].push_back(std::move(comment));
        return true;
    }

    auto owner_exists(const std::string& owner) const -> bool {
        for (size_t i = 0; i < file_.items.size(); ++i) {
            auto item_id = item_identifier(i);
            if (owner == item_id) {
                return item_comments(file_.items[i]) != nullptr;
            }
            if (owner == block_identifier(item_id)) {
                return item_block(file_.items[i]) != nullptr;
            }
        }
        return false;
    }

    SourceFile file_;
    Associations associations_;
    size_t records_{};
};

} // namespace

auto serialize_document(const SourceFile& file) -> std::string {
    std::ostringstream out;

    for (size_t i = 0; i < file.items.size(); ++i) {
        const auto& item = file.items[i];
        out << "item" << field_separator << i << field_separator
            << item_kind_name(item_kind(item)) << field_separator << item_name(item)
            << field_separator << optional_span_to_string(item_span(item)) << "\n";

        if (const auto* block = item_block(item)) {
            out << "block" << field_separator << i << field_separator
                << optional_span_to_string(block->span) << "\n";
        }
    }

    for (size_t i = 0; i < file.items.size(); ++i) {
        const auto& item = file.items[i];
        auto item_id = item_identifier(i);

        if (const auto* comments = item_comments(item)) {
            write_comments(out, item_id, *comments);
        }
        if (const auto* block = item_block(item)) {
            write_comments(out, block_identifier(item_id), block->comments);
        }
    }

    write_comments(out, root_owner, file.comments);
    return out.str();
}

auto deserialize_document(const std::string& text) -> std::optional<SourceFile> {
    SnapshotReader reader;
    bool saw_content = false;

    for (const auto& line : StringUtils::split_lines(text)) {
        if (StringUtils::trim(line.text).empty()) {
            continue;
        }
        saw_content = true;
        reader.read_line(std::string(line.text));
    }

    if (saw_content && reader.records() == 0) {
        return std::nullopt;
    }

    return reader.finish();
}

auto save_document(const SourceFile& file, const std::string& file_path) -> bool {
    std::ofstream out(file_path);
    if (!out.is_open()) {
        return false;
    }

    out << serialize_document(file);
    return out.good();
}

auto load_document(const std::string& file_path) -> std::optional<SourceFile> {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    return deserialize_document(contents.str());
}

} // namespace commentmap
