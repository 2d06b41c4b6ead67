#include "commentfmt/application/commentfmt_app.hpp"
#include "commentfmt/core/normalizer.hpp"
#include <iostream>

namespace commentfmt {

auto run_command_line(const std::vector<std::string>& args,
                      std::unique_ptr<IFileSystem> filesystem) -> int {
    auto parsed = parse_args(args);

    if (!parsed.error.empty()) {
        std::cerr << "Error: " << parsed.error << "\n\n" << usage_text();
        return usage_exit_code;
    }

    if (parsed.show_help) {
        std::cout << usage_text();
        return 0;
    }

    CommentFmtApp app(std::move(filesystem));
    return app.run(parsed.config);
}

CommentFmtApp::CommentFmtApp(std::unique_ptr<IFileSystem> filesystem)
    : filesystem_(std::move(filesystem)) {}

auto CommentFmtApp::run(const Config& config) -> int {
    // Literal path strings; "a.cpp" and "./a.cpp" count as different files
    std::unordered_set<std::string> processed;
    bool had_errors = false;

    for (const auto& path : config.files) {
        auto outcome = format_file(path, config, processed);
        if (outcome == FileOutcome::NOT_FOUND || outcome == FileOutcome::WRITE_FAILED) {
            had_errors = true;
        }
    }

    if (had_errors) {
        std::cerr << "Note: errors occurred while formatting\n";
        return 1;
    }
    return 0;
}

auto CommentFmtApp::format_file(const std::string& path, const Config& config,
                                std::unordered_set<std::string>& processed) -> FileOutcome {
    if (!processed.insert(path).second) {
        if (config.verbose) {
            std::cerr << "Warning: File '" << path << "' has already been formatted, skipping\n";
        }
        return FileOutcome::SKIPPED_DUPLICATE;
    }

    if (config.verbose) {
        std::cerr << "Formatting '" << path << "'\n";
    }

    if (!filesystem_->file_exists(path)) {
        std::cerr << "Error: File '" << path << "' was not found\n";
        return FileOutcome::NOT_FOUND;
    }

    auto lines = filesystem_->read_lines(path);
    if (!lines) {
        std::cerr << "Error: File '" << path << "' was not found\n";
        return FileOutcome::NOT_FOUND;
    }

    // Output always carries one newline beyond the rendered buffer
    auto text = normalize_text(*lines) + '\n';

    if (!config.in_place) {
        std::cout << text << std::flush;
        if (std::cout.fail()) {
            std::cerr << "Error: Failed to write '" << path << "'\n";
            return FileOutcome::WRITE_FAILED;
        }
        return FileOutcome::FORMATTED;
    }

    if (!filesystem_->write_text(path, text)) {
        std::cerr << "Error: Failed to write '" << path << "'\n";
        return FileOutcome::WRITE_FAILED;
    }

    if (config.verbose) {
        std::cerr << "Wrote '" << path << "'\n";
    }
    return FileOutcome::FORMATTED;
}

} // namespace commentfmt
