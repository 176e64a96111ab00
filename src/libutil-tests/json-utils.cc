#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fedfs/util/json-utils.hh"

namespace fedfs {

static const nlohmann::json mounting = R"({
    "backend": { "kind": "memory", "params": { "host": "localhost", "port": "5432" } },
    "count": 3,
    "tags": []
})"_json;

TEST(valueAt, nested)
{
    auto & backend = getObject(valueAt(getObject(mounting), "backend"));
    ASSERT_EQ(getString(valueAt(backend, "kind")), "memory");
}

TEST(valueAt, missingMemberIsNamed)
{
    try {
        valueAt(getObject(mounting), "view");
        FAIL() << "expected an error";
    } catch (Error & e) {
        ASSERT_THAT(e.msg(), ::testing::HasSubstr("view"));
    }
}

TEST(optionalValueAt, presentAndAbsent)
{
    auto & obj = getObject(mounting);
    auto * count = optionalValueAt(obj, "count");
    ASSERT_NE(count, nullptr);
    ASSERT_EQ(*count, 3);
    ASSERT_EQ(optionalValueAt(obj, "vars"), nullptr);
}

TEST(getObject, wrongType)
{
    auto & obj = getObject(mounting);
    ASSERT_THROW(getObject(valueAt(obj, "tags")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "count")), Error);
    ASSERT_THROW(getObject(nlohmann::json("memory")), Error);
}

TEST(getString, wrongType)
{
    auto & obj = getObject(mounting);
    ASSERT_THROW(getString(valueAt(obj, "backend")), Error);
    ASSERT_THROW(getString(valueAt(obj, "count")), Error);
    ASSERT_THROW(getString(nlohmann::json(false)), Error);
}

TEST(getStringMap, params)
{
    auto & params = valueAt(getObject(valueAt(getObject(mounting), "backend")), "params");
    ASSERT_EQ(getStringMap(params), (StringMap{{"host", "localhost"}, {"port", "5432"}}));
    ASSERT_TRUE(getStringMap(nlohmann::json::object()).empty());
    ASSERT_THROW(getStringMap(R"([])"_json), Error);
}

TEST(getStringMap, nonStringMemberIsNamed)
{
    try {
        getStringMap(R"({ "host": "localhost", "port": 5432 })"_json);
        FAIL() << "expected an error";
    } catch (Error & e) {
        ASSERT_THAT(e.what(), ::testing::HasSubstr("port"));
    }
}

} // namespace fedfs
