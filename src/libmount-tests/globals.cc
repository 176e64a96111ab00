#include <gtest/gtest.h>

#include <stdlib.h>

#include "fedfs/mount/globals.hh"
#include "fedfs/mount/mount-manager.hh"
#include "fedfs/mount/tests/mini-sql.hh"
#include "fedfs/util/file-system.hh"
#include "fedfs/util/finally.hh"

namespace fedfs {

/**
 * Restores the settings the tests below change.
 */
class MountSettingsTest : public ::testing::Test
{
protected:
    std::string savedFile = mountSettings.mountConfigFile.get();
    unsigned int savedPageSize = mountSettings.defaultPageSize.get();
    bool savedPersist = mountSettings.persistMounts.get();

    AutoDelete tmpDir{createTempDir()};

    void TearDown() override
    {
        unsetenv("FEDFS_CONF");
        unsetenv("FEDFS_CONFIG");
        mountSettings.mountConfigFile = savedFile;
        mountSettings.defaultPageSize = savedPageSize;
        mountSettings.persistMounts = savedPersist;
    }
};

TEST_F(MountSettingsTest, fromEnvironment)
{
    setenv("FEDFS_CONFIG", "default-page-size = 7\npersist-mounts = false", 1);

    initLibMount();

    ASSERT_EQ(mountSettings.defaultPageSize.get(), 7u);
    ASSERT_FALSE(mountSettings.persistMounts.get());
}

TEST_F(MountSettingsTest, fromFile)
{
    auto conf = tmpDir.path() / "fedfs.conf";
    writeFileAtomic(conf, "# page size\ndefault-page-size = 12\n");
    setenv("FEDFS_CONF", conf.c_str(), 1);
    setenv("FEDFS_CONFIG", "default-page-size = 13", 1);

    initLibMount();

    /* Inline settings win over the file. */
    ASSERT_EQ(mountSettings.defaultPageSize.get(), 13u);
}

TEST_F(MountSettingsTest, badFile)
{
    setenv("FEDFS_CONF", (tmpDir.path() / "missing.conf").c_str(), 1);
    ASSERT_THROW(initLibMount(), SysError);
}

TEST_F(MountSettingsTest, openMountManager)
{
    auto file = tmpDir.path() / "mounts.json";
    writeFileAtomic(
        file,
        R"({"mountings": {"/data/": {"backend": {"kind": "memory"}}, "/v.json": {"view": {"query": "select * from /data/x.json"}}}})");
    mountSettings.mountConfigFile = file.string();
    mountSettings.persistMounts = true;

    auto compiler = make_ref<MiniSqlCompiler>();

    {
        auto manager = openMountManager(compiler);
        ASSERT_EQ(manager->mounts().size(), 2u);
        ASSERT_EQ(manager->mountType(DirPath::parse("/data/")), "memory");

        manager->mount(DirPath::parse("/more/"), BackendConfig{.kind = "memory"});
    }

    /* The new mount was persisted and comes back. */
    auto manager = openMountManager(compiler);
    ASSERT_EQ(manager->mounts().size(), 3u);

    mountSettings.persistMounts = false;
    auto manager2 = openMountManager(compiler);
    manager2->unmount(DirPath::parse("/more/"));
    ASSERT_EQ(openMountManager(compiler)->mounts().size(), 3u);
}

} // namespace fedfs
