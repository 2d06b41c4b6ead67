#include "commentfmt/core/normalizer.hpp"
#include "commentfmt/core/comment_detection.hpp"

namespace commentfmt {

auto normalize_lines(const std::vector<std::string>& lines) -> std::vector<std::string> {
    std::vector<CommentDetection> detections;
    detections.reserve(lines.size());
    for (const auto& line : lines) {
        detections.push_back(detect_comment(line));
    }

    std::vector<std::string> output;
    output.reserve(lines.size() + 2);

    ScanState state;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& current = detections[i];

        if (!state.block_mode) {
            state.indent_width = current.indent_width;
        }

        if (!current.has_comment) {
            output.push_back(lines[i]);
            continue;
        }

        bool comment_next = i + 1 < lines.size() && detections[i + 1].has_comment;
        std::string indent(state.indent_width, ' ');

        if (!state.block_mode && comment_next) {
            output.push_back(indent + "/*");
            state.block_mode = true;
        }

        if (state.block_mode) {
            output.push_back(indent + " * " + current.comment_text);
            if (!comment_next) {
                output.push_back(indent + " */");
                state.block_mode = false;
            }
        } else if (!current.code_before.empty()) {
            output.push_back(indent + current.code_before + " /* " + current.comment_text + " */");
        } else {
            output.push_back(indent + "/* " + current.comment_text + " */");
        }
    }

    return output;
}

auto render_lines(const std::vector<std::string>& lines) -> std::string {
    std::string text;
    for (const auto& line : lines) {
        text += line;
        text += '\n';
    }
    return text;
}

auto normalize_text(const std::vector<std::string>& lines) -> std::string {
    return render_lines(normalize_lines(lines));
}

} // namespace commentfmt
