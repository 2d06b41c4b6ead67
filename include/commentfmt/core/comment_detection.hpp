#pragma once

#include <string>

namespace commentfmt {

// Result of looking for a "//" marker on a single line
struct CommentDetection {
    bool has_comment = false;
    std::string comment_text;   // After the marker, leading whitespace removed
    std::string code_before;    // Before the marker, trailing whitespace removed
    size_t indent_width{};      // Whitespace removed from the end of code_before

    auto operator==(const CommentDetection& other) const -> bool = default;
};

// Detect the first "//" on a line. indent_width counts the whitespace between
// the code and the marker, not the leading indentation of the line.
auto detect_comment(const std::string& line) -> CommentDetection;

} // namespace commentfmt
