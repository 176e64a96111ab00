#include "fedfs/util/canon-path.hh"

#include <gtest/gtest.h>

namespace fedfs {

TEST(CanonPath, basic)
{
    {
        CanonPath p("/");
        ASSERT_EQ(p.abs(), "/");
        ASSERT_EQ(p.rel(), "");
        ASSERT_EQ(p.baseName(), std::nullopt);
        ASSERT_FALSE(p.parent());
        ASSERT_EQ(p.depth(), 0u);
    }

    {
        CanonPath p("/data//");
        ASSERT_EQ(p.abs(), "/data");
        ASSERT_EQ(p.rel(), "data");
        ASSERT_EQ(*p.baseName(), "data");
        ASSERT_EQ(p.parent()->abs(), "/");
        ASSERT_EQ(p.depth(), 1u);
    }

    {
        CanonPath p("data/zips.json");
        ASSERT_EQ(p.abs(), "/data/zips.json");
        ASSERT_EQ(*p.baseName(), "zips.json");
        ASSERT_EQ(p.parent()->abs(), "/data");
        ASSERT_EQ(p.depth(), 2u);
    }
}

TEST(CanonPath, dots)
{
    ASSERT_EQ(CanonPath("/a/./b/../c").abs(), "/a/c");
    ASSERT_EQ(CanonPath("/../../a").abs(), "/a");
    ASSERT_EQ(CanonPath("/a/b/../..").abs(), "/");
}

TEST(CanonPath, nullBytes)
{
    std::string s = "/hello/world";
    s[8] = '\0';
    ASSERT_THROW(CanonPath("/").push(std::string(1, '\0')), BadCanonPath);
    ASSERT_THROW(CanonPath(std::string_view(s)), BadCanonPath);
    ASSERT_THROW(CanonPath(s, CanonPath::root), BadCanonPath);
}

TEST(CanonPath, relativeToRoot)
{
    CanonPath base("/views");
    ASSERT_EQ(CanonPath("/data/zips.json", base).abs(), "/data/zips.json");
    ASSERT_EQ(CanonPath("zips.json", base).abs(), "/views/zips.json");
    ASSERT_EQ(CanonPath("../data/zips.json", base).abs(), "/data/zips.json");
}

TEST(CanonPath, pop)
{
    CanonPath p("a/b/c");
    p.pop();
    ASSERT_EQ(p.abs(), "/a/b");
    p.pop();
    p.pop();
    ASSERT_TRUE(p.isRoot());
}

TEST(CanonPath, removePrefix)
{
    CanonPath p1("data");
    CanonPath p2("data/a/b.json");
    ASSERT_EQ(p2.removePrefix(p1).abs(), "/a/b.json");
    ASSERT_EQ(p1.removePrefix(p1).abs(), "/");
    ASSERT_EQ(p1.removePrefix(CanonPath::root).abs(), "/data");
}

TEST(CanonPath, iter)
{
    std::vector<std::string_view> ss;
    for (auto c : CanonPath("a//data/zips.json//"))
        ss.push_back(c);
    ASSERT_EQ(ss, std::vector<std::string_view>({"a", "data", "zips.json"}));

    ss.clear();
    for (auto c : CanonPath::root)
        ss.push_back(c);
    ASSERT_TRUE(ss.empty());
}

TEST(CanonPath, concat)
{
    ASSERT_EQ((CanonPath("/data") / CanonPath("archive/x")).abs(), "/data/archive/x");
    ASSERT_EQ((CanonPath::root / CanonPath("/a")).abs(), "/a");
    ASSERT_EQ((CanonPath("/a") / CanonPath::root).abs(), "/a");
    ASSERT_EQ((CanonPath::root / "data" / "zips.json").abs(), "/data/zips.json");
}

TEST(CanonPath, within)
{
    ASSERT_TRUE(CanonPath("data").isWithin(CanonPath("data")));
    ASSERT_FALSE(CanonPath("data").isStrictlyWithin(CanonPath("data")));
    ASSERT_FALSE(CanonPath("data").isWithin(CanonPath("dat")));
    ASSERT_FALSE(CanonPath("data2/x").isWithin(CanonPath("data")));
    ASSERT_TRUE(CanonPath("data/x").isStrictlyWithin(CanonPath("data")));
    ASSERT_TRUE(CanonPath("/").isWithin(CanonPath("/")));
    ASSERT_TRUE(CanonPath("/a/b").isWithin(CanonPath("/")));
}

TEST(CanonPath, sort)
{
    /* Children sort directly after their parent. */
    ASSERT_FALSE(CanonPath("data") < CanonPath("data"));
    ASSERT_TRUE(CanonPath("data") < CanonPath("data/x"));
    ASSERT_TRUE(CanonPath("data/x") < CanonPath("data!"));
    ASSERT_TRUE(CanonPath("data/zzz") < CanonPath("data-archive"));
}

} // namespace fedfs
