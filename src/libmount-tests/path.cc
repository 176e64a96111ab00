#include <gtest/gtest.h>

#include "fedfs/mount/path.hh"

namespace fedfs {

TEST(DirPath, parse)
{
    ASSERT_EQ(DirPath::parse("/").to_string(), "/");
    ASSERT_TRUE(DirPath::parse("/").isRoot());
    ASSERT_EQ(DirPath::parse("/data/").to_string(), "/data/");
    ASSERT_EQ(DirPath::parse("/data//archive/").to_string(), "/data/archive/");
    ASSERT_EQ(DirPath::parse("/data/archive/").canon(), CanonPath("/data/archive"));

    ASSERT_THROW(DirPath::parse("/data"), BadPath);
    ASSERT_THROW(DirPath::parse("data/"), BadPath);
    ASSERT_THROW(DirPath::parse(""), BadPath);
}

TEST(FilePath, parse)
{
    auto p = FilePath::parse("/data/zips.json");
    ASSERT_EQ(p.to_string(), "/data/zips.json");
    ASSERT_EQ(p.name(), "zips.json");
    ASSERT_EQ(p.dir(), DirPath::parse("/data/"));

    ASSERT_EQ(FilePath::parse("/x").dir(), DirPath::root());

    ASSERT_THROW(FilePath::parse("/data/"), BadPath);
    ASSERT_THROW(FilePath::parse("zips.json"), BadPath);
    ASSERT_THROW(FilePath(CanonPath::root), BadPath);
}

TEST(AnyPath, trailingSlashDecidesTheKind)
{
    ASSERT_TRUE(std::holds_alternative<DirPath>(parseAnyPath("/data/")));
    ASSERT_TRUE(std::holds_alternative<DirPath>(parseAnyPath("/")));
    ASSERT_TRUE(std::holds_alternative<FilePath>(parseAnyPath("/data")));

    ASSERT_EQ(showPath(parseAnyPath("/data/")), "/data/");
    ASSERT_EQ(showPath(parseAnyPath("/data")), "/data");

    /* Both name the same location. */
    ASSERT_EQ(canonOf(parseAnyPath("/data/")), canonOf(parseAnyPath("/data")));
}

TEST(DirPath, navigation)
{
    auto d = DirPath::parse("/a/b/");
    ASSERT_EQ(d.name(), "b");
    ASSERT_EQ(d.parent(), DirPath::parse("/a/"));
    ASSERT_EQ(DirPath::root().parent(), std::nullopt);
    ASSERT_EQ(d.dir("c"), DirPath::parse("/a/b/c/"));
    ASSERT_EQ(d.file("c.json"), FilePath::parse("/a/b/c.json"));

    ASSERT_TRUE(d.isWithin(DirPath::parse("/a/")));
    ASSERT_TRUE(d.isWithin(d));
    ASSERT_FALSE(DirPath::parse("/ab/").isWithin(DirPath::parse("/a/")));

    ASSERT_TRUE(FilePath::parse("/a/b/c").isWithin(d));
    ASSERT_FALSE(FilePath::parse("/a/bc").isWithin(d));
}

TEST(Relativize, roundTrip)
{
    auto mount = DirPath::parse("/data/");

    ASSERT_EQ(relativize(FilePath::parse("/data/zips.json"), mount), FilePath::parse("/zips.json"));
    ASSERT_EQ(relativize(DirPath::parse("/data/"), mount), DirPath::root());
    ASSERT_EQ(relativize(DirPath::parse("/data/a/b/"), mount), DirPath::parse("/a/b/"));

    ASSERT_EQ(absolutize(FilePath::parse("/zips.json"), mount), FilePath::parse("/data/zips.json"));
    ASSERT_EQ(absolutize(DirPath::root(), mount), mount);
    ASSERT_EQ(absolutize(CanonPath("/x/y"), mount), CanonPath("/data/x/y"));

    /* Everything is below the root. */
    ASSERT_EQ(relativize(FilePath::parse("/a/b"), DirPath::root()), FilePath::parse("/a/b"));

    ASSERT_THROW(relativize(FilePath::parse("/database/x"), mount), BadPath);
}

} // namespace fedfs
