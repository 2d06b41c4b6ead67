#pragma once

#include <optional>
#include <string>
#include <vector>

namespace commentfmt {

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto read_lines(const std::string& path) -> std::optional<std::vector<std::string>> = 0;
    virtual auto write_text(const std::string& path, const std::string& text) -> bool = 0;
};

} // namespace commentfmt
