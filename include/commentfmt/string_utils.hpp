#pragma once

#include <string>
#include <vector>

namespace commentfmt {

class StringUtils {
public:
    // Characters treated as whitespace by the trim helpers
    static constexpr const char* whitespace = " \t\n\r\f\v";

    // Remove leading whitespace
    static auto left_trim(const std::string& text) -> std::string;

    // Remove trailing whitespace
    static auto right_trim(const std::string& text) -> std::string;

    // Split text into lines, dropping "\n", "\r\n" and lone "\r" terminators.
    // A trailing terminator does not produce an extra empty line.
    static auto split_lines(const std::string& text) -> std::vector<std::string>;
};

} // namespace commentfmt
