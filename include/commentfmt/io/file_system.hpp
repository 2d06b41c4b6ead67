#pragma once

#include "commentfmt/interfaces.hpp"
#include <optional>
#include <string>

namespace commentfmt {

class FileSystem : public IFileSystem {
public:
    auto file_exists(const std::string& path) -> bool override;
    auto read_lines(const std::string& path) -> std::optional<std::vector<std::string>> override;

    // Replaces the file a symlink points to, not the link itself. The
    // replacement keeps the original permissions.
    auto write_text(const std::string& path, const std::string& text) -> bool override;

private:
    static auto resolve_target(const std::string& path) -> std::optional<std::string>;

    // Creates a fresh, empty file beside target; never reuses an existing name
    static auto create_temp_beside(const std::string& target) -> std::optional<std::string>;
};

} // namespace commentfmt
