#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "fedfs/mount/mount-table.hh"
#include "fedfs/mount/tests/path.hh"

namespace fedfs {

static ref<const MountEntry> backendAt(std::string_view path)
{
    return make_ref<const MountEntry>(MountEntry{
        .path = DirPath::parse(path),
        .config = BackendConfig{.kind = "memory"},
    });
}

static ref<const MountEntry> viewAt(std::string_view path)
{
    return make_ref<const MountEntry>(MountEntry{
        .path = FilePath::parse(path),
        .config = ViewConfig{.query = "select * from zips"},
    });
}

static std::optional<std::string> deepest(const MountTable & table, std::string_view path)
{
    if (auto entry = table.deepestEnclosingMount(parseAnyPath(path)))
        return showPath(entry->path);
    return std::nullopt;
}

TEST(MountTable, deepestEnclosingMount)
{
    auto table = MountTable()
                     .insert(backendAt("/data/"))
                     .insert(backendAt("/data/archive/"))
                     .insert(viewAt("/data/views/big.json"))
                     .insert(backendAt("/database/"));

    ASSERT_EQ(deepest(table, "/data/"), "/data/");
    ASSERT_EQ(deepest(table, "/data/zips.json"), "/data/");
    ASSERT_EQ(deepest(table, "/data/archive/"), "/data/archive/");
    ASSERT_EQ(deepest(table, "/data/archive/2019/x.json"), "/data/archive/");
    ASSERT_EQ(deepest(table, "/data/archive"), "/data/");
    ASSERT_EQ(deepest(table, "/database/x"), "/database/");

    /* A view covers only its own file. */
    ASSERT_EQ(deepest(table, "/data/views/big.json"), "/data/views/big.json");
    ASSERT_EQ(deepest(table, "/data/views/big.json/"), "/data/");
    ASSERT_EQ(deepest(table, "/data/views/big.json/x"), "/data/");

    ASSERT_EQ(deepest(table, "/"), std::nullopt);
    ASSERT_EQ(deepest(table, "/other/x"), std::nullopt);
    ASSERT_EQ(deepest(table, "/dat/"), std::nullopt);

    /* A mount at the root covers everything. */
    auto withRoot = table.insert(backendAt("/"));
    ASSERT_EQ(deepest(withRoot, "/other/x"), "/");
    ASSERT_EQ(deepest(withRoot, "/"), "/");
}

TEST(MountTable, insertIsPersistent)
{
    MountTable empty;
    auto one = empty.insert(backendAt("/data/"));

    ASSERT_TRUE(empty.empty());
    ASSERT_EQ(one.size(), 1);

    auto two = one.insert(backendAt("/data/archive/"));
    ASSERT_EQ(one.size(), 1);
    ASSERT_EQ(two.size(), 2);

    /* Unchanged entries are shared. */
    ASSERT_EQ(two.lookup(CanonPath("/data")), one.lookup(CanonPath("/data")));
}

TEST(MountTable, insertAtExistingPathFails)
{
    auto table = MountTable().insert(backendAt("/data/"));

    ASSERT_THROW(table.insert(backendAt("/data/")), MountExists);

    /* A view and a directory with the same name are the same location. */
    ASSERT_THROW(table.insert(viewAt("/data")), MountExists);

    ASSERT_EQ(table.size(), 1);
}

TEST(MountTable, insertThenRemoveRestoresTable)
{
    auto before = MountTable().insert(backendAt("/data/")).insert(viewAt("/v.json"));
    auto after = before.insert(backendAt("/data/archive/")).remove(CanonPath("/data/archive"));

    ASSERT_EQ(before, after);
    ASSERT_NE(before, before.insert(backendAt("/x/")));
}

TEST(MountTable, removeMissingFails)
{
    auto table = MountTable().insert(backendAt("/data/"));
    ASSERT_THROW(table.remove(CanonPath("/data/archive")), MountNotFound);
    ASSERT_THROW(MountTable().remove(CanonPath::root), MountNotFound);
}

TEST(MountTable, mountsBelow)
{
    auto table = MountTable()
                     .insert(backendAt("/data/"))
                     .insert(backendAt("/data/archive/"))
                     .insert(viewAt("/data/v.json"))
                     .insert(backendAt("/data/x/y/"))
                     .insert(backendAt("/data-old/"))
                     .insert(backendAt("/database/"));

    auto paths = [&](std::string_view dir) {
        std::vector<std::string> res;
        for (auto & entry : table.mountsBelow(DirPath::parse(dir)))
            res.push_back(showPath(entry->path));
        return res;
    };

    ASSERT_EQ(paths("/data/"), (std::vector<std::string>{"/data/archive/", "/data/v.json", "/data/x/y/"}));
    ASSERT_EQ(paths("/data/x/"), (std::vector<std::string>{"/data/x/y/"}));
    ASSERT_EQ(paths("/data/archive/"), (std::vector<std::string>{}));
    ASSERT_EQ(paths("/").size(), 6);
}

/**
 * The mount with the longest mount point that contains `path`,
 * computed the slow way.
 */
static std::shared_ptr<const MountEntry> longestPrefix(const MountTable & table, const FilePath & path)
{
    std::shared_ptr<const MountEntry> best;
    for (auto & [mountPoint, entry] : table.all())
        if (path.canon().isStrictlyWithin(mountPoint) && (!best || best->key().depth() < mountPoint.depth()))
            best = entry;
    return best;
}

RC_GTEST_PROP(MountTable, deepestEnclosingMountIsLongestPrefix, (const std::vector<DirPath> & mountPoints, const FilePath & path))
{
    MountTable table;
    for (auto & mountPoint : mountPoints)
        if (!table.lookup(mountPoint.canon()))
            table = table.insert(make_ref<const MountEntry>(MountEntry{
                .path = mountPoint,
                .config = BackendConfig{.kind = "memory"},
            }));

    RC_ASSERT(table.deepestEnclosingMount(path) == longestPrefix(table, path));
}

RC_GTEST_PROP(MountTable, insertThenRemoveIsIdentity, (const std::vector<DirPath> & mountPoints, const DirPath & extra))
{
    MountTable table;
    for (auto & mountPoint : mountPoints)
        if (!table.lookup(mountPoint.canon()))
            table = table.insert(make_ref<const MountEntry>(MountEntry{
                .path = mountPoint,
                .config = BackendConfig{.kind = "memory"},
            }));

    RC_PRE(!table.lookup(extra.canon()));

    auto entry = make_ref<const MountEntry>(MountEntry{.path = extra, .config = ViewConfig{}});
    RC_ASSERT(table.insert(entry).remove(extra.canon()) == table);
}

} // namespace fedfs
