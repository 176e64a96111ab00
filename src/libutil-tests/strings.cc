#include <gtest/gtest.h>

#include "fedfs/util/strings.hh"

namespace fedfs {

TEST(concatStringsSep, basic)
{
    ASSERT_EQ(concatStringsSep(" -> ", Strings({"/a", "/b", "/a"})), "/a -> /b -> /a");
    ASSERT_EQ(concatStringsSep(",", Strings{}), "");
    ASSERT_EQ(concatStringsSep(", ", std::vector<std::string>({"city"})), "city");
}

TEST(concatStrings, mixed)
{
    std::string_view b = "b";
    ASSERT_EQ(concatStrings("a", b, std::string("c")), "abc");
}

TEST(replaceStrings, basic)
{
    ASSERT_EQ(replaceStrings("a.b.c", ".", "/"), "a/b/c");
    ASSERT_EQ(replaceStrings("aaa", "a", "aa"), "aaaaaa");
    ASSERT_EQ(replaceStrings("abc", "", "x"), "abc");
}

TEST(trim, basic)
{
    ASSERT_EQ(trim("  a b \n"), "a b");
    ASSERT_EQ(trim("\t\t"), "");
}

TEST(stripIndentation, basic)
{
    ASSERT_EQ(stripIndentation("\n    a\n      b\n"), "\na\n  b\n");
    ASSERT_EQ(stripIndentation("one line"), "one line\n");
}

TEST(filterANSIEscapes, basic)
{
    auto s = "\e[31merror:\e[0m path '\e[35;1m/data/\e[0m' does not exist";
    ASSERT_EQ(filterANSIEscapes(s, true), "error: path '/data/' does not exist");
    ASSERT_EQ(filterANSIEscapes("plain"), "plain");
}

TEST(string2Int, basic)
{
    ASSERT_EQ(string2Int<unsigned int>("42"), 42u);
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("12x"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>(""), std::nullopt);
}

TEST(hasPrefix, basic)
{
    ASSERT_TRUE(hasPrefix("/database", "/data"));
    ASSERT_FALSE(hasPrefix("/da", "/data"));
    ASSERT_TRUE(hasSuffix("/data/", "/"));
    ASSERT_FALSE(hasSuffix("/data", "/"));
}

} // namespace fedfs
