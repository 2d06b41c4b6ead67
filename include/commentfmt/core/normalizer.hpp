#pragma once

#include <string>
#include <vector>

namespace commentfmt {

// State carried from one line to the next during a scan
struct ScanState {
    bool block_mode = false;    // A "/*" has been emitted and not yet closed
    size_t indent_width{};      // Frozen while block_mode is set
};

// Pure functions for line comment conversion

// Convert "//" comments to block comments. Runs of consecutive comment lines
// become one "/* ... */" block, isolated comments become inline "/* x */".
// Lines without a comment are passed through untouched.
auto normalize_lines(const std::vector<std::string>& lines) -> std::vector<std::string>;

// Join lines, terminating each with '\n'
auto render_lines(const std::vector<std::string>& lines) -> std::string;

auto normalize_text(const std::vector<std::string>& lines) -> std::string;

} // namespace commentfmt
