#include <gtest/gtest.h>

#include "exec_kernel/file_utils.h"

#include <sys/stat.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using exec_kernel::FileUtils;
using exec_kernel::TempDir;

namespace {

bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST(TempDir, CreatesAndRemovesDirectory) {
    std::string path;
    {
        TempDir dir("exec_kernel-test-");
        path = dir.path();
        ASSERT_TRUE(exists(path));
        FileUtils::write_file(dir.file("a.txt"), "hello");
        ASSERT_EQ(mkdir(dir.file("nested").c_str(), 0700), 0);
        FileUtils::write_file(dir.file("nested/b.txt"), "world");
    }
    EXPECT_FALSE(exists(path));
}

TEST(TempDir, MoveTransfersOwnership) {
    TempDir first("exec_kernel-test-");
    std::string path = first.path();
    TempDir second(std::move(first));
    EXPECT_TRUE(first.path().empty());
    EXPECT_EQ(second.path(), path);
    EXPECT_TRUE(exists(path));
}

TEST(TempDir, DistinctDirectories) {
    TempDir a;
    TempDir b;
    EXPECT_NE(a.path(), b.path());
}

TEST(FileUtils, WriteAndCopy) {
    TempDir dir("exec_kernel-test-");
    std::string payload(100000, 'p');
    FileUtils::write_file(dir.file("src.bin"), payload);
    FileUtils::copy_file(dir.file("src.bin"), dir.file("dst.bin"));
    EXPECT_EQ(slurp(dir.file("dst.bin")), payload);

    FileUtils::write_file(dir.file("src.bin"), "short");
    FileUtils::copy_file(dir.file("src.bin"), dir.file("dst.bin"));
    EXPECT_EQ(slurp(dir.file("dst.bin")), "short");
}

TEST(FileUtils, ErrorsThrow) {
    TempDir dir("exec_kernel-test-");
    EXPECT_THROW(FileUtils::copy_file(dir.file("missing"), dir.file("out")), std::runtime_error);
    EXPECT_THROW(FileUtils::write_file(dir.file("no/such/dir/file"), "x"), std::runtime_error);
}

TEST(FileUtils, SearchMatchesGlob) {
    TempDir dir("exec_kernel-test-");
    FileUtils::write_file(dir.file("plot_0.png"), "");
    FileUtils::write_file(dir.file("plot_1.png"), "");
    FileUtils::write_file(dir.file("notes.txt"), "");
    auto results = FileUtils::search(dir.path(), "plot_*.png", 0);
    EXPECT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        EXPECT_FALSE(r.is_dir);
        EXPECT_NE(r.path.find("plot_"), std::string::npos);
    }
}

TEST(FileUtils, RemoveTree) {
    TempDir holder("exec_kernel-test-");
    std::string root = holder.file("tree");
    ASSERT_EQ(mkdir(root.c_str(), 0700), 0);
    ASSERT_EQ(mkdir((root + "/sub").c_str(), 0700), 0);
    FileUtils::write_file(root + "/sub/f", "data");
    EXPECT_TRUE(FileUtils::remove_tree(root));
    EXPECT_FALSE(exists(root));
    EXPECT_TRUE(FileUtils::remove_tree(root));
}
