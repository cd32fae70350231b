#include "commentmap/application/commentmap_app.hpp"
#include "commentmap/io/file_system.hpp"
#include "commentmap/parsers/outline_parser.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: commentmap [options] <source-file>\n";
    std::cout << "  -p, --policy <name>  Association policy: conservative (default) or nearest\n";
    std::cout << "  -o, --save <file>    Write an annotated snapshot instead of the report\n";
    std::cout << "  -q, --quiet          Suppress the summary line\n";
    std::cout << "  -h, --help           Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  commentmap src/lib.rs                      # Report attached comments\n";
    std::cout << "  commentmap -p nearest src/lib.rs           # Attach to the nearest node\n";
    std::cout << "  commentmap -o lib.snapshot src/lib.rs      # Save the annotated tree\n";
}

[[noreturn]] auto fail_usage(const std::string& message) -> void {
    std::cerr << "Error: " << message << "\n";
    print_usage();
    std::exit(1);
}

auto parse_args(int argc, char* argv[]) -> commentmap::Config {
    commentmap::Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--policy") {
            if (i + 1 >= argc) {
                fail_usage(arg + " needs a policy name");
            }
            auto policy = commentmap::parse_policy(argv[++i]);
            if (!policy) {
                fail_usage(std::string("unknown policy '") + argv[i] + "'");
            }
            config.policy = *policy;
        } else if (arg == "-o" || arg == "--save") {
            if (i + 1 >= argc) {
                fail_usage(arg + " needs a file name");
            }
            config.save_file = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else if (!arg.empty() && arg.front() == '-') {
            fail_usage("unknown option '" + arg + "'");
        } else if (config.source_file.empty()) {
            config.source_file = arg;
        } else {
            fail_usage("only one source file may be given");
        }
    }

    if (config.source_file.empty()) {
        fail_usage("no source file given");
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);

    commentmap::CommentMapApp app(std::make_unique<commentmap::FileSystem>(),
                                  std::make_unique<commentmap::OutlineParser>());
    return app.run(config);
}
