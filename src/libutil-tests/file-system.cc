#include <gtest/gtest.h>

#include "fedfs/util/file-system.hh"

namespace fedfs {

TEST(createTempDir, isFreshDirectory)
{
    AutoDelete a{createTempDir()};
    AutoDelete b{createTempDir()};

    ASSERT_NE(a.path(), b.path());
    ASSERT_TRUE(std::filesystem::is_directory(a.path()));
}

TEST(AutoDelete, deletesRecursively)
{
    std::filesystem::path dir;
    {
        AutoDelete tmp{createTempDir()};
        dir = tmp.path();
        writeFileAtomic(dir / "file", "contents");
    }
    ASSERT_FALSE(pathExists(dir));
}

TEST(AutoDelete, cancel)
{
    auto dir = createTempDir();
    {
        AutoDelete tmp{dir};
        tmp.cancel();
    }
    ASSERT_TRUE(pathExists(dir));
    AutoDelete cleanup{dir};
}

TEST(writeFileAtomic, writeAndReplace)
{
    AutoDelete tmp{createTempDir()};
    auto file = tmp.path() / "mounts.json";

    ASSERT_FALSE(pathExists(file));
    writeFileAtomic(file, "one");
    ASSERT_EQ(readFile(file), "one");
    writeFileAtomic(file, "two");
    ASSERT_EQ(readFile(file), "two");

    /* No temporary files are left behind. */
    ASSERT_EQ(std::distance(std::filesystem::directory_iterator(tmp.path()), std::filesystem::directory_iterator()), 1);
}

TEST(writeFileAtomic, missingDirectory)
{
    AutoDelete tmp{createTempDir()};
    ASSERT_THROW(writeFileAtomic(tmp.path() / "no" / "such" / "file", "x"), SysError);
}

TEST(readFile, missing)
{
    AutoDelete tmp{createTempDir()};
    ASSERT_THROW(readFile(tmp.path() / "missing"), SysError);
}

TEST(deletePathIfExists, idempotent)
{
    AutoDelete tmp{createTempDir()};
    auto file = tmp.path() / "f";
    writeFileAtomic(file, "");
    deletePathIfExists(file);
    ASSERT_FALSE(pathExists(file));
    deletePathIfExists(file);
}

TEST(pathExists, throughMissingDirectory)
{
    ASSERT_FALSE(pathExists("/definitely/not/a/real/path"));
    ASSERT_TRUE(pathExists("/"));
}

} // namespace fedfs
