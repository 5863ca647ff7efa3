#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "io/fs_utils.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace cloudlink;
using namespace cloudlink::test_support;

TEST(FsUtils, WriteFileAtomicReplacesContent)
{
    const fs::path root = makeTempRoot("cloudlink_fs");
    const fs::path file = root / "a" / "b" / "state.json";

    ASSERT_TRUE(io::writeFileAtomic(file, "one"));
    ASSERT_TRUE(io::writeFileAtomic(file, "two"));
    EXPECT_EQ(readFile(file), "two");
    fs::path temp = file;
    temp += ".tmp";
    EXPECT_FALSE(fs::exists(temp));

    cleanupTemp(root);
}

TEST(FsUtils, WriteFileAtomicLeavesNoTempWhenReplaceFails)
{
    const fs::path root = makeTempRoot("cloudlink_fs");
    const fs::path occupied = root / "state.json";
    writeFile(occupied / "inside.txt", "x");

    EXPECT_FALSE(io::writeFileAtomic(occupied, std::string(1 << 16, 'a')));
    fs::path temp = occupied;
    temp += ".tmp";
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_EQ(readFile(occupied / "inside.txt"), "x");

    const fs::path large = root / "large.json";
    const std::string payload(1 << 20, 'b');
    ASSERT_TRUE(io::writeFileAtomic(large, payload));
    EXPECT_EQ(readFile(large), payload);

    cleanupTemp(root);
}

TEST(FsUtils, EnsureDirRejectsFile)
{
    const fs::path root = makeTempRoot("cloudlink_fs");
    writeFile(root / "file", "x");

    EXPECT_TRUE(io::ensureDir(root / "x" / "y"));
    EXPECT_TRUE(io::ensureDir(root / "x" / "y"));
    EXPECT_FALSE(io::ensureDir(root / "file"));

    cleanupTemp(root);
}

TEST(FsUtils, ListTreeIsSortedAndMarksDirectories)
{
    const fs::path root = makeTempRoot("cloudlink_fs");
    writeFile(root / "b.txt", "b");
    writeFile(root / "a" / "c.txt", "c");

    EXPECT_EQ(io::listTree(root), (std::vector<std::string>{"a/", "a/c.txt", "b.txt"}));
    EXPECT_TRUE(io::listTree(root / "missing").empty());

    cleanupTemp(root);
}
