#include "commentfmt/application/commentfmt_app.hpp"
#include "commentfmt/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <iterator>
#include <sstream>

namespace commentfmt {

namespace fs = std::filesystem;

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / ("commentfmt_it_" + std::string(info->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto create_file(const std::string& name, const std::string& content) -> std::string
    {
        auto path = (dir_ / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static auto read_file(const std::string& path) -> std::string
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    auto run_app(const Config& config) -> int
    {
        CommentFmtApp app(std::make_unique<FileSystem>());

        std::streambuf* orig_out = std::cout.rdbuf(stdout_.rdbuf());
        std::streambuf* orig_err = std::cerr.rdbuf(stderr_.rdbuf());

        int result = app.run(config);

        std::cout.rdbuf(orig_out);
        std::cerr.rdbuf(orig_err);
        return result;
    }

    fs::path dir_;
    std::ostringstream stdout_;
    std::ostringstream stderr_;

    const std::string source_ = "#include <cstdio>\n"
                                "\n"
                                "// Entry point\n"
                                "// prints a greeting\n"
                                "int main() {\n"
                                "    puts(\"hi\"); // say hi\n"
                                "    return 0;\n"
                                "}\n";

    const std::string converted_ = "#include <cstdio>\n"
                                   "\n"
                                   "/*\n"
                                   " * Entry point\n"
                                   " * prints a greeting\n"
                                   " */\n"
                                   "int main() {\n"
                                   "     puts(\"hi\"); /* say hi */\n"
                                   "    return 0;\n"
                                   "}\n"
                                   "\n";
};

TEST_F(IntegrationTest, StdoutModeLeavesFileUntouched)
{
    auto path = create_file("main.cpp", source_);

    int result = run_app(Config{.files = {path}, .verbose = false, .in_place = false});

    EXPECT_EQ(result, 0);
    EXPECT_EQ(stdout_.str(), converted_);
    EXPECT_EQ(read_file(path), source_);
}

TEST_F(IntegrationTest, InPlaceModeRewritesFile)
{
    auto path = create_file("main.cpp", source_);

    int result = run_app(Config{.files = {path}, .verbose = false, .in_place = true});

    EXPECT_EQ(result, 0);
    EXPECT_EQ(stdout_.str(), "");
    EXPECT_EQ(read_file(path), converted_);
    auto entries = std::distance(fs::directory_iterator(dir_), fs::directory_iterator{});
    EXPECT_EQ(entries, 1);
}

TEST_F(IntegrationTest, WindowsLineEndingsAreNormalized)
{
    auto path = create_file("crlf.cpp", "// a\r\n// b\r\nint x;\r\n");

    int result = run_app(Config{.files = {path}, .verbose = false, .in_place = true});

    EXPECT_EQ(result, 0);
    EXPECT_EQ(read_file(path), "/*\n * a\n * b\n */\nint x;\n\n");
}

TEST_F(IntegrationTest, DuplicateArgumentProducesOutputOnce)
{
    auto path = create_file("dup.cpp", "// only once\n");

    int result = run_app(Config{.files = {path, path}, .verbose = true, .in_place = false});

    EXPECT_EQ(result, 0);
    EXPECT_EQ(stdout_.str(), "/* only once */\n\n");
    EXPECT_THAT(stderr_.str(), ::testing::HasSubstr("has already been formatted"));
}

TEST_F(IntegrationTest, MissingFileDoesNotStopOtherFiles)
{
    auto missing = (dir_ / "missing.cpp").string();
    auto good = create_file("good.cpp", "int y; // why\n");

    int result = run_app(Config{.files = {missing, good}, .verbose = false, .in_place = false});

    EXPECT_EQ(result, 1);
    EXPECT_EQ(stdout_.str(), " int y; /* why */\n\n");
    EXPECT_THAT(stderr_.str(),
                ::testing::HasSubstr("Error: File '" + missing + "' was not found"));
    EXPECT_THAT(stderr_.str(), ::testing::HasSubstr("Note: errors occurred while formatting"));
}

TEST_F(IntegrationTest, DirectoryIsNotAFile)
{
    int result = run_app(Config{.files = {dir_.string()}, .verbose = false, .in_place = true});

    EXPECT_EQ(result, 1);
    EXPECT_TRUE(fs::is_directory(dir_));
}

} // namespace commentfmt
