#pragma once

#include <string>
#include <vector>

namespace commentfmt {

struct Config {
    std::vector<std::string> files;     // Paths exactly as given on the command line
    bool verbose = false;               // Progress and duplicate warnings on stderr
    bool in_place = false;              // Overwrite files instead of printing to stdout
};

struct ParsedArgs {
    Config config;
    bool show_help = false;
    std::string error;                  // Non-empty when the command line is invalid
};

// Exit status for an invalid command line
inline constexpr int usage_exit_code = 2;

// Parse arguments (excluding the program name). Options may be mixed with
// file paths; "--" ends option parsing.
auto parse_args(const std::vector<std::string>& args) -> ParsedArgs;

auto usage_text() -> std::string;

} // namespace commentfmt
