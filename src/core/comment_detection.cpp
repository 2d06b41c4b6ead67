#include "commentfmt/core/comment_detection.hpp"
#include "commentfmt/string_utils.hpp"

namespace commentfmt {

auto detect_comment(const std::string& line) -> CommentDetection {
    auto marker = line.find("//");
    if (marker == std::string::npos) {
        return CommentDetection{};
    }

    std::string prefix = line.substr(0, marker);
    std::string code = StringUtils::right_trim(prefix);

    return CommentDetection{.has_comment = true,
                            .comment_text = StringUtils::left_trim(line.substr(marker + 2)),
                            .code_before = code,
                            .indent_width = prefix.size() - code.size()};
}

} // namespace commentfmt
