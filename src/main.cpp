#include "commentfmt/application/commentfmt_app.hpp"
#include "commentfmt/io/file_system.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        return commentfmt::run_command_line(args, std::make_unique<commentfmt::FileSystem>());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
