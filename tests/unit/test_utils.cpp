#include <gtest/gtest.h>
#include "chunkflow/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace chunkflow::core::utils;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  tick_ms  "), "tick_ms");
    EXPECT_EQ(StringUtils::trim("\t6291456\r\n"), "6291456");
    EXPECT_EQ(StringUtils::trim("a b"), "a b");
    EXPECT_EQ(StringUtils::trim(" \t "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Application/X-MSDownload"), "application/x-msdownload");
    EXPECT_EQ(StringUtils::to_lower("SETUP.EXE"), "setup.exe");
    EXPECT_EQ(StringUtils::to_lower("already lower 123"), "already lower 123");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "chunkflow_utils_test";
        std::filesystem::create_directories(test_dir);
        test_file = test_dir / "payload.bin";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
    std::filesystem::path test_file;
};

TEST_F(FileUtilsTest, ExistsAndIsFile) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    EXPECT_FALSE(FileUtils::is_file(test_file));

    std::ofstream(test_file) << "chunk";

    EXPECT_TRUE(FileUtils::exists(test_file));
    EXPECT_TRUE(FileUtils::is_file(test_file));
    EXPECT_TRUE(FileUtils::exists(test_dir));
    EXPECT_FALSE(FileUtils::is_file(test_dir));
}

TEST_F(FileUtilsTest, FileSize) {
    EXPECT_FALSE(FileUtils::file_size(test_file).has_value());
    EXPECT_FALSE(FileUtils::file_size(test_dir).has_value());

    std::ofstream(test_file, std::ios::binary) << std::string(4096, 'x');
    EXPECT_EQ(FileUtils::file_size(test_file), 4096u);
}

TEST_F(FileUtilsTest, ExtensionKeepsCase) {
    EXPECT_EQ(FileUtils::get_file_extension("setup.EXE"), ".EXE");
    EXPECT_EQ(FileUtils::get_file_extension("backup.tar.gz"), ".gz");
    EXPECT_EQ(FileUtils::get_file_extension("Makefile"), "");
}

TEST_F(FileUtilsTest, ExpandHome) {
    auto home = FileUtils::get_home_dir();

    EXPECT_EQ(FileUtils::expand_home("~/.chunkflow.conf"), home / ".chunkflow.conf");
    EXPECT_EQ(FileUtils::expand_home("~"), home);
    EXPECT_EQ(FileUtils::expand_home("/etc/chunkflow.conf"), std::filesystem::path("/etc/chunkflow.conf"));
    EXPECT_EQ(FileUtils::expand_home("~user/file"), std::filesystem::path("~user/file"));
}
