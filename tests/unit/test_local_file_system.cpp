#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/hive_errors.hpp"
#include "test_support.hpp"
#include "workspace/local_file_system.hpp"

namespace {

using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::testing::TempWorkspace;
using hive::workspace::LocalFileSystem;

TEST(LocalFileSystemTest, WritesReadsAndRemovesInsideRoot) {
    TempWorkspace workspace("local_fs");
    LocalFileSystem files(workspace.root());

    ASSERT_FALSE(is_error(files.write_file("src/nested/a.txt", "hello")));
    EXPECT_EQ(workspace.read("src/nested/a.txt"), "hello");
    EXPECT_TRUE(get_value(files.exists("src/nested/a.txt")));

    auto read = files.read_file("src/nested/a.txt");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read), "hello");

    ASSERT_FALSE(is_error(files.remove_file("src/nested/a.txt")));
    EXPECT_FALSE(get_value(files.exists("src/nested/a.txt")));
}

TEST(LocalFileSystemTest, MissingFileIsNotFound) {
    TempWorkspace workspace("local_fs");
    LocalFileSystem files(workspace.root());
    auto read = files.read_file("nope.txt");
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).kind, ErrorKind::NotFound);
}

TEST(LocalFileSystemTest, RefusesPathsOutsideRoot) {
    TempWorkspace workspace("local_fs");
    LocalFileSystem files(workspace.root());

    auto escape = files.write_file("../escape.txt", "x");
    ASSERT_TRUE(is_error(escape));
    EXPECT_EQ(get_error(escape).kind, ErrorKind::Policy);

    auto absolute = files.read_file("/etc/hostname");
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).kind, ErrorKind::Policy);
    EXPECT_FALSE(std::filesystem::exists(workspace.root().parent_path() / "escape.txt"));
}

TEST(LocalFileSystemTest, RefusesBinaryFiles) {
    TempWorkspace workspace("local_fs");
    workspace.write("blob.bin", std::string("ab\0cd", 5));
    LocalFileSystem files(workspace.root());
    auto read = files.read_file("blob.bin");
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "binary_file");
}

}  // namespace
