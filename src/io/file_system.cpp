#include "commentfmt/io/file_system.hpp"
#include "commentfmt/string_utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdlib.h>
#include <unistd.h>

namespace commentfmt {

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::read_lines(const std::string& path) -> std::optional<std::vector<std::string>> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }

    return StringUtils::split_lines(oss.str());
}

auto FileSystem::write_text(const std::string& path, const std::string& text) -> bool {
    auto target = resolve_target(path);
    if (!target) {
        return false;
    }

    // Write to temporary file first for atomic operation
    auto temp_path = create_temp_beside(*target);
    if (!temp_path) {
        return false;
    }

    auto discard_temp = [&temp_path]() {
        std::error_code ignored;
        std::filesystem::remove(*temp_path, ignored);
    };

    {
        std::ofstream file(*temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            discard_temp();
            return false;
        }

        file << text;
        file.flush();

        if (file.fail()) {
            file.close();
            discard_temp();
            return false;
        }
    } // File automatically closed here

    std::error_code ec;
    auto original_status = std::filesystem::status(*target, ec);
    if (!ec) {
        std::filesystem::permissions(*temp_path, original_status.permissions(),
                                     std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        discard_temp();
        return false;
    }

    std::filesystem::rename(*temp_path, *target, ec);
    if (ec) {
        discard_temp();
        return false;
    }

    return true;
}

auto FileSystem::resolve_target(const std::string& path) -> std::optional<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_symlink(path, ec)) {
        return path;
    }

    auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return resolved.string();
}

auto FileSystem::create_temp_beside(const std::string& target) -> std::optional<std::string> {
    // mkstemp creates the file exclusively, so a user's file is never touched
    std::string pattern = target + ".commentfmt-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
        return std::nullopt;
    }
    ::close(fd);

    return std::string(buffer.data());
}

} // namespace commentfmt
