#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "fedfs/mount/globals.hh"
#include "fedfs/mount/mount-config-store.hh"
#include "fedfs/mount/tests/gmock-matchers.hh"
#include "fedfs/util/file-system.hh"
#include "fedfs/util/finally.hh"

namespace fedfs {

using testing::HasSubstrIgnoreANSI;
using ::testing::IsEmpty;
using ::testing::ThrowsMessage;

class JSONMountConfigStoreTest : public ::testing::Test
{
protected:
    AutoDelete tmpDir{createTempDir()};
    std::filesystem::path file = tmpDir.path() / "mounts.json";

    static MountConfigs sample()
    {
        return {
            {DirPath::parse("/data/"), BackendConfig{.kind = "memory", .params = {{"name", "zips"}}}},
            {FilePath::parse("/views/v.json"),
             ViewConfig{.query = "select * from zips", .defaultVars = {{"state", "NY"}}}},
        };
    }
};

TEST_F(JSONMountConfigStoreTest, missingFileIsEmpty)
{
    auto store = makeJSONMountConfigStore(file);
    ASSERT_THAT(store->load(), IsEmpty());
    ASSERT_FALSE(pathExists(file));
}

TEST_F(JSONMountConfigStoreTest, saveAndLoad)
{
    auto store = makeJSONMountConfigStore(file);
    for (auto & [path, config] : sample())
        store->save(path, config);

    ASSERT_TRUE(pathExists(file));

    /* A second store on the same file sees the same mounts. */
    ASSERT_EQ(makeJSONMountConfigStore(file)->load(), sample());

    store->remove(DirPath::parse("/data/"));
    auto res = makeJSONMountConfigStore(file)->load();
    ASSERT_EQ(res.size(), 1u);
    ASSERT_EQ(res[0].first, AnyPath(FilePath::parse("/views/v.json")));

    /* Removing something that isn't there is not an error. */
    store->remove(DirPath::parse("/nothing/"));
}

TEST_F(JSONMountConfigStoreTest, fileFormat)
{
    auto store = makeJSONMountConfigStore(file);
    for (auto & [path, config] : sample())
        store->save(path, config);

    auto json = nlohmann::json::parse(readFile(file));
    ASSERT_EQ(json["mountings"]["/data/"]["backend"]["kind"], "memory");
    ASSERT_EQ(json["mountings"]["/data/"]["backend"]["params"]["name"], "zips");
    ASSERT_EQ(json["mountings"]["/views/v.json"]["view"]["query"], "select * from zips");
    ASSERT_EQ(json["mountings"]["/views/v.json"]["view"]["vars"]["state"], "NY");
}

TEST_F(JSONMountConfigStoreTest, saveReplaces)
{
    auto store = makeJSONMountConfigStore(file);
    store->save(DirPath::parse("/data/"), BackendConfig{.kind = "memory"});
    store->save(DirPath::parse("/data/"), BackendConfig{.kind = "counting"});

    auto res = store->load();
    ASSERT_EQ(res.size(), 1u);
    ASSERT_EQ(res[0].second, MountConfig(BackendConfig{.kind = "counting"}));
}

TEST_F(JSONMountConfigStoreTest, invalidJSON)
{
    writeFileAtomic(file, "{ not json");
    ASSERT_THAT(
        [&]() { makeJSONMountConfigStore(file)->load(); },
        ThrowsMessage<Error>(HasSubstrIgnoreANSI("is not valid JSON")));
}

TEST_F(JSONMountConfigStoreTest, invalidMount)
{
    writeFileAtomic(file, R"({"mountings": {"/data/": {"tape": {}}}})");
    ASSERT_THAT(
        [&]() { makeJSONMountConfigStore(file)->load(); },
        ThrowsMessage<Error>(HasSubstrIgnoreANSI("exactly one of the keys")));

    writeFileAtomic(file, R"({"mountings": {"data": {"backend": {"kind": "memory"}}}})");
    ASSERT_THROW(makeJSONMountConfigStore(file)->load(), BadPath);
}

TEST(EphemeralMountConfigStore, initialAndMutations)
{
    auto store = makeEphemeralMountConfigStore({{DirPath::parse("/b/"), BackendConfig{.kind = "memory"}}});
    store->save(DirPath::parse("/a/"), BackendConfig{.kind = "memory"});

    auto res = store->load();
    ASSERT_EQ(res.size(), 2u);
    ASSERT_EQ(res[0].first, AnyPath(DirPath::parse("/a/")));

    store->remove(DirPath::parse("/b/"));
    ASSERT_EQ(store->load().size(), 1u);
}

TEST(OpenMountConfigStore, followsSetting)
{
    AutoDelete tmpDir{createTempDir()};
    auto file = tmpDir.path() / "mounts.json";

    auto saved = mountSettings.mountConfigFile.get();
    Finally restore([&]() { mountSettings.mountConfigFile = saved; });

    mountSettings.mountConfigFile = "";
    openMountConfigStore()->save(DirPath::parse("/a/"), BackendConfig{.kind = "memory"});
    ASSERT_FALSE(pathExists(file));

    mountSettings.mountConfigFile = file.string();
    openMountConfigStore()->save(DirPath::parse("/a/"), BackendConfig{.kind = "memory"});
    ASSERT_TRUE(pathExists(file));
    ASSERT_EQ(openMountConfigStore()->load().size(), 1u);
}

} // namespace fedfs
