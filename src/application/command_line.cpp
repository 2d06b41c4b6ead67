#include "commentfmt/application/command_line.hpp"
#include <sstream>

namespace commentfmt {

namespace {

auto apply_short_flags(const std::string& arg, ParsedArgs& parsed) -> bool {
    // "-vi" is the same as "-v -i"
    for (size_t i = 1; i < arg.size(); ++i) {
        switch (arg[i]) {
        case 'v':
            parsed.config.verbose = true;
            break;
        case 'i':
            parsed.config.in_place = true;
            break;
        case 'h':
            parsed.show_help = true;
            break;
        default:
            parsed.error = "Unknown option '-" + std::string(1, arg[i]) + "'";
            return false;
        }
    }
    return true;
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> ParsedArgs {
    ParsedArgs parsed;
    bool options_done = false;

    for (const auto& arg : args) {
        if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
            parsed.config.files.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--verbose") {
            parsed.config.verbose = true;
        } else if (arg == "--inplace") {
            parsed.config.in_place = true;
        } else if (arg == "--help") {
            parsed.show_help = true;
        } else if (arg.rfind("--", 0) == 0) {
            parsed.error = "Unknown option '" + arg + "'";
            return parsed;
        } else if (!apply_short_flags(arg, parsed)) {
            return parsed;
        }
    }

    if (!parsed.show_help && parsed.config.files.empty()) {
        parsed.error = "At least one file is required";
    }

    return parsed;
}

auto usage_text() -> std::string {
    std::ostringstream oss;
    oss << "Usage: commentfmt <file>... [options]\n";
    oss << "Convert // comments to /* */ block comments.\n";
    oss << "\n";
    oss << "  -v, --verbose    Report progress and skipped duplicates on stderr\n";
    oss << "  -i, --inplace    Rewrite each file instead of printing to stdout\n";
    oss << "  -h, --help       Show this help\n";
    oss << "\nExamples:\n";
    oss << "  commentfmt main.cpp > main.out.cpp     # Print converted text\n";
    oss << "  commentfmt -i src/*.cpp                # Rewrite files in place\n";
    return oss.str();
}

} // namespace commentfmt
