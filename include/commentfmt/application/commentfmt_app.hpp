#pragma once

#include "commentfmt/application/command_line.hpp"
#include "commentfmt/interfaces.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace commentfmt {

enum class FileOutcome {
    FORMATTED,
    SKIPPED_DUPLICATE,  // Same path string already handled in this run
    NOT_FOUND,
    WRITE_FAILED
};

class CommentFmtApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;

public:
    explicit CommentFmtApp(std::unique_ptr<IFileSystem> filesystem);

    // Format every file in config.files. Returns the process exit code.
    auto run(const Config& config) -> int;

private:
    auto format_file(const std::string& path, const Config& config,
                     std::unordered_set<std::string>& processed) -> FileOutcome;
};

// Parse args (without the program name) and run. Returns the process exit
// code: usage_exit_code for a bad command line, 0 for --help.
auto run_command_line(const std::vector<std::string>& args,
                      std::unique_ptr<IFileSystem> filesystem) -> int;

} // namespace commentfmt
