#include <gtest/gtest.h>

#include "fedfs/mount/errors.hh"
#include "fedfs/mount/mount-config.hh"

namespace fedfs {

TEST(MountConfig, mountType)
{
    ASSERT_EQ(mountType(ViewConfig{.query = "select * from zips"}), "view");
    ASSERT_EQ(mountType(BackendConfig{.kind = "mongodb"}), "mongodb");
}

TEST(MountConfig, pathKind)
{
    MountConfig view = ViewConfig{.query = "select * from zips"};
    MountConfig backend = BackendConfig{.kind = "memory"};

    ASSERT_NO_THROW(checkMountPathKind(FilePath::parse("/v.json"), view));
    ASSERT_NO_THROW(checkMountPathKind(DirPath::parse("/data/"), backend));
    ASSERT_NO_THROW(checkMountPathKind(DirPath::root(), backend));

    ASSERT_THROW(checkMountPathKind(DirPath::parse("/v/"), view), PathTypeMismatch);
    ASSERT_THROW(checkMountPathKind(FilePath::parse("/data"), backend), PathTypeMismatch);
}

TEST(MountConfig, viewToJSON)
{
    MountConfig config = ViewConfig{
        .query = "select city from zips where pop > :min",
        .defaultVars = {{"min", 100000}},
    };

    auto json = mountConfigToJSON(config);

    ASSERT_EQ(json, nlohmann::json::parse(R"({
        "view": {
            "query": "select city from zips where pop > :min",
            "vars": { "min": 100000 }
        }
    })"));

    ASSERT_EQ(mountConfigFromJSON(json), config);
}

TEST(MountConfig, backendToJSON)
{
    MountConfig config = BackendConfig{
        .kind = "mongodb",
        .params = {{"connectionUri", "mongodb://localhost"}, {"database", "test"}},
    };

    auto json = mountConfigToJSON(config);

    ASSERT_EQ(json["backend"]["kind"], "mongodb");
    ASSERT_EQ(json["backend"]["params"]["database"], "test");
    ASSERT_EQ(mountConfigFromJSON(json), config);
}

TEST(MountConfig, fromJSONDefaults)
{
    ASSERT_EQ(
        mountConfigFromJSON(nlohmann::json::parse(R"({"backend": {"kind": "memory"}})")),
        MountConfig(BackendConfig{.kind = "memory"}));

    ASSERT_EQ(
        mountConfigFromJSON(nlohmann::json::parse(R"({"view": {"query": "select * from zips"}})")),
        MountConfig(ViewConfig{.query = "select * from zips"}));
}

TEST(MountConfig, fromJSONErrors)
{
    ASSERT_THROW(mountConfigFromJSON(nlohmann::json::parse("{}")), Error);
    ASSERT_THROW(mountConfigFromJSON(nlohmann::json::parse("[]")), Error);
    ASSERT_THROW(mountConfigFromJSON(nlohmann::json::parse(R"({"mongodb": {}})")), Error);
    ASSERT_THROW(mountConfigFromJSON(nlohmann::json::parse(R"({"view": {}})")), Error);
    ASSERT_THROW(
        mountConfigFromJSON(nlohmann::json::parse(R"({"view": {"query": "q"}, "backend": {"kind": "memory"}})")),
        Error);
    ASSERT_THROW(
        mountConfigFromJSON(nlohmann::json::parse(R"({"backend": {"kind": "memory", "params": {"port": 27017}}})")),
        Error);
}

} // namespace fedfs
