#include "commentfmt/string_utils.hpp"

namespace commentfmt {

auto StringUtils::left_trim(const std::string& text) -> std::string {
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first);
}

auto StringUtils::right_trim(const std::string& text) -> std::string {
    size_t last = text.find_last_not_of(whitespace);
    if (last == std::string::npos) {
        return "";
    }
    return text.substr(0, last + 1);
}

auto StringUtils::split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::string current;
    bool pending = false; // current holds an unterminated line

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(std::move(current));
            current.clear();
            pending = false;
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
            pending = true;
        }
    }

    if (pending) {
        lines.push_back(std::move(current));
    }

    return lines;
}

} // namespace commentfmt
