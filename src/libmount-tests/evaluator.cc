#include "fedfs/mount/tests/gmock-matchers.hh"
#include "fedfs/mount/tests/libmount.hh"

namespace fedfs {

using testing::HasSubstrIgnoreANSI;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::ThrowsMessage;

class EvaluatorTest : public LibMountTest
{
protected:

    static Records cities(std::initializer_list<std::string_view> names)
    {
        Records res;
        for (auto & name : names)
            res.push_back({{"city", name}});
        return res;
    }
};

TEST_F(EvaluatorTest, readBackendFile)
{
    mountZips();

    ASSERT_THAT(names(manager->evaluator()->list(dir("/data/"))), ElementsAre("zips.json"));
    ASSERT_EQ(readAll(file("/data/zips.json")), zips());
}

TEST_F(EvaluatorTest, readWindow)
{
    mountZips();

    auto res = drainCursor(*manager->evaluator()->read(file("/data/zips.json"), 1, 2));
    ASSERT_EQ(res, Records(zips().begin() + 1, zips().begin() + 3));
}

TEST_F(EvaluatorTest, readUnmounted)
{
    mountZips();

    try {
        manager->evaluator()->read(file("/elsewhere/zips.json"));
        FAIL() << "reading outside every mount should fail";
    } catch (PathNotFound & e) {
        ASSERT_EQ(e.path, CanonPath("/elsewhere/zips.json"));
    }
}

TEST_F(EvaluatorTest, missingFileReportsGlobalPath)
{
    mountZips();

    try {
        manager->evaluator()->read(file("/data/missing.json"));
        FAIL() << "reading a missing file should fail";
    } catch (PathNotFound & e) {
        ASSERT_EQ(e.path, CanonPath("/data/missing.json"));
        ASSERT_THAT(e.message(), HasSubstrIgnoreANSI("/data/missing.json"));
    }
}

TEST_F(EvaluatorTest, view)
{
    mountZips();
    manager->mount(file("/views/bigcities.json"), ViewConfig{.query = "select city from zips where pop > 100000"});

    ASSERT_EQ(readAll(file("/views/bigcities.json")), cities({"NEW YORK", "BOULDER", "CHICAGO"}));

    ASSERT_THAT(
        showListing(manager->evaluator()->list(dir("/views/"))), ElementsAre("bigcities.json@ (view)"));
    ASSERT_THAT(
        showListing(manager->evaluator()->list(file("/views/bigcities.json"))),
        ElementsAre("bigcities.json@ (view)"));
    ASSERT_TRUE(manager->evaluator()->exists(file("/views/bigcities.json")));
}

TEST_F(EvaluatorTest, viewReadWindow)
{
    mountZips();
    manager->mount(file("/views/bigcities.json"), ViewConfig{.query = "select city from zips where pop > 100000"});

    auto res = drainCursor(*manager->evaluator()->read(file("/views/bigcities.json"), 1, 5));
    ASSERT_EQ(res, cities({"BOULDER", "CHICAGO"}));
}

TEST_F(EvaluatorTest, viewRelativeTable)
{
    mountZips();
    manager->mount(file("/data/small.json"), ViewConfig{.query = "select city from zips.json where pop < 10000"});

    ASSERT_EQ(readAll(file("/data/small.json")), cities({"BARRE"}));

    /* The view shows up next to the file it reads from. */
    ASSERT_THAT(
        showListing(manager->evaluator()->list(dir("/data/"))), ElementsAre("small.json@ (view)", "zips.json"));
}

TEST_F(EvaluatorTest, viewVariables)
{
    mountZips();
    manager->mount(
        file("/views/state.json"),
        ViewConfig{.query = "select city from zips where state = :state", .defaultVars = {{"state", "NY"}}});

    ASSERT_EQ(readAll(file("/views/state.json")), cities({"NEW YORK"}));
    ASSERT_EQ(readAll(file("/views/state.json"), {{"state", "VT"}}), cities({"BARRE"}));
}

TEST_F(EvaluatorTest, viewUnboundVariable)
{
    mountZips();
    manager->mount(file("/views/state.json"), ViewConfig{.query = "select city from zips where state = :state"});

    ASSERT_THAT(
        [&]() { readAll(file("/views/state.json")); },
        ThrowsMessage<QueryError>(HasSubstrIgnoreANSI("state")));
}

TEST_F(EvaluatorTest, viewOfView)
{
    mountZips();
    manager->mount(file("/views/big.json"), ViewConfig{.query = "select city, pop from zips where pop > 100000"});
    manager->mount(file("/views/huge.json"), ViewConfig{.query = "select city from big.json where pop > 1000000"});

    ASSERT_EQ(readAll(file("/views/huge.json")), cities({"NEW YORK", "CHICAGO"}));

    /* Only the innermost query can run in the backend. */
    ASSERT_EQ(counters->pushedDownQueries.load(), 1u);
}

TEST_F(EvaluatorTest, viewCycle)
{
    manager->mount(file("/views/a.json"), ViewConfig{.query = "select * from b.json"});
    manager->mount(file("/views/b.json"), ViewConfig{.query = "select * from a.json"});

    ASSERT_THAT(
        [&]() { readAll(file("/views/a.json")); },
        ThrowsMessage<ViewCycle>(HasSubstrIgnoreANSI("/views/a.json -> /views/b.json -> /views/a.json")));
}

TEST_F(EvaluatorTest, viewIsReadOnly)
{
    mountZips();
    manager->mount(file("/views/bigcities.json"), ViewConfig{.query = "select city from zips where pop > 100000"});
    auto evaluator = manager->evaluator();

    ASSERT_THROW(evaluator->write(file("/views/bigcities.json"), {}), ReadOnlyMount);
    ASSERT_THROW(evaluator->append(file("/views/bigcities.json"), {}), ReadOnlyMount);
    ASSERT_THROW(evaluator->remove(file("/views/bigcities.json")), ReadOnlyMount);
    ASSERT_THROW(
        evaluator->move(file("/views/bigcities.json"), file("/data/x.json"), MoveSemantics::Overwrite), ReadOnlyMount);
}

TEST_F(EvaluatorTest, queryPushedDown)
{
    mountZips();

    auto res = drainCursor(*manager->evaluator()->query("select city from zips where pop > 1000000", DirPath::root()));
    ASSERT_EQ(res, cities({"NEW YORK", "CHICAGO"}));
    ASSERT_EQ(counters->pushedDownQueries.load(), 1u);
}

TEST_F(EvaluatorTest, queryInCore)
{
    counters->nativeQueries = false;
    mountZips();

    auto res = drainCursor(*manager->evaluator()->query("select city from zips where pop > 1000000", DirPath::root()));
    ASSERT_EQ(res, cities({"NEW YORK", "CHICAGO"}));
    ASSERT_EQ(counters->pushedDownQueries.load(), 0u);
}

TEST_F(EvaluatorTest, queryRelativeToBase)
{
    mountZips();

    auto res = drainCursor(*manager->evaluator()->query("select city from zips.json where state = 'CO'", dir("/data/")));
    ASSERT_EQ(res, cities({"BOULDER"}));
}

TEST_F(EvaluatorTest, queryVariables)
{
    mountZips();

    auto res = drainCursor(
        *manager->evaluator()->query("select city from zips where pop < :max", DirPath::root(), {{"max", 10000}}));
    ASSERT_EQ(res, cities({"BARRE"}));
}

TEST_F(EvaluatorTest, badQuery)
{
    mountZips();

    ASSERT_THROW(manager->evaluator()->query("delete everything", DirPath::root()), QueryError);
}

TEST_F(EvaluatorTest, nestedMountShowsInParent)
{
    mountZips();
    manager->mount(dir("/data/archive/"), counting());

    ASSERT_THAT(
        showListing(manager->evaluator()->list(dir("/data/"))), ElementsAre("archive@ (counting)", "zips.json"));
    ASSERT_THAT(manager->evaluator()->list(dir("/data/archive/")), IsEmpty());
}

TEST_F(EvaluatorTest, mountHidesNativeEntry)
{
    mountZips();
    manager->evaluator()->write(file("/data/archive/old.json"), zips());
    manager->evaluator()->write(file("/data/other/x.json"), zips());

    manager->mount(dir("/data/archive/"), counting());
    manager->mount(dir("/data/extra/"), BackendConfig{.kind = "memory"});

    ASSERT_THAT(
        showListing(manager->evaluator()->list(dir("/data/"))),
        ElementsAre("archive@ (counting)", "extra@ (memory)", "other/", "zips.json"));

    /* The new mount serves the path, not the backend below it. */
    ASSERT_THROW(readAll(file("/data/archive/old.json")), PathNotFound);
    ASSERT_FALSE(manager->evaluator()->exists(file("/data/archive/old.json")));
}

TEST_F(EvaluatorTest, mountPointIsNotAFile)
{
    mountZips();
    manager->mount(dir("/data/archive/"), counting());
    auto evaluator = manager->evaluator();

    ASSERT_THAT(
        [&]() { evaluator->write(file("/data/archive"), zips()); },
        ThrowsMessage<CrossMountOperation>(HasSubstrIgnoreANSI("a backend is mounted at")));
    ASSERT_THROW(evaluator->append(file("/data/archive"), zips()), CrossMountOperation);
    ASSERT_THROW(evaluator->remove(file("/data/archive")), CrossMountOperation);
    ASSERT_THROW(
        evaluator->move(file("/data/zips.json"), file("/data/archive"), MoveSemantics::Overwrite), CrossMountOperation);

    /* Nothing reached the backend around the mount point. */
    ASSERT_EQ(readAll(file("/data/zips.json")), zips());
    ASSERT_THAT(
        showListing(evaluator->list(dir("/data/"))), ElementsAre("archive@ (counting)", "zips.json"));
}

TEST_F(EvaluatorTest, mountPointHidesNativeFile)
{
    mountZips();
    manager->evaluator()->write(file("/data/archive"), zips());

    manager->mount(dir("/data/archive/"), counting());
    auto evaluator = manager->evaluator();

    ASSERT_THROW(readAll(file("/data/archive")), PathNotFound);
    ASSERT_FALSE(evaluator->exists(file("/data/archive")));
    ASSERT_THROW(evaluator->list(file("/data/archive")), PathNotFound);
    ASSERT_THROW(drainCursor(*evaluator->query("select * from /data/archive", DirPath::root())), PathNotFound);
    ASSERT_THAT(
        showListing(evaluator->list(dir("/data/"))), ElementsAre("archive@ (counting)", "zips.json"));

    /* Unmounting uncovers the file again. */
    manager->unmount(dir("/data/archive/"));
    ASSERT_EQ(readAll(file("/data/archive")), zips());
}

TEST_F(EvaluatorTest, lazyMissingFileReportsGlobalPath)
{
    counters->lazyReads = true;
    mountZips();

    auto cursor = manager->evaluator()->read(file("/data/missing.json"));
    try {
        cursor->more(10);
        FAIL() << "paging through a missing file should fail";
    } catch (PathNotFound & e) {
        ASSERT_EQ(e.path, CanonPath("/data/missing.json"));
    }

    ASSERT_EQ(readAll(file("/data/zips.json")), zips());
}

TEST_F(EvaluatorTest, lazyBackendErrorNamesMount)
{
    counters->lazyReads = true;
    counters->onRead = []() { throw Error("connection reset"); };
    mountZips();

    auto cursor = manager->evaluator()->read(file("/data/zips.json"));
    ASSERT_THAT(
        [&]() { cursor->more(10); },
        ThrowsMessage<Error>(HasSubstrIgnoreANSI("in the backend mounted at '/data/'")));
}

TEST_F(EvaluatorTest, intermediateDirectories)
{
    manager->mount(dir("/a/b/c/"), counting());
    manager->mount(file("/a/x/v.json"), ViewConfig{.query = "select * from zips"});

    auto evaluator = manager->evaluator();

    ASSERT_THAT(showListing(evaluator->list(DirPath::root())), ElementsAre("a/"));
    ASSERT_THAT(showListing(evaluator->list(dir("/a/"))), ElementsAre("b/", "x/"));
    ASSERT_THAT(showListing(evaluator->list(dir("/a/b/"))), ElementsAre("c@ (counting)"));
    ASSERT_THAT(showListing(evaluator->list(dir("/a/x/"))), ElementsAre("v.json@ (view)"));

    ASSERT_THROW(evaluator->list(dir("/b/")), PathNotFound);
    ASSERT_THROW(evaluator->list(dir("/a/b/c/d/")), PathNotFound);
}

TEST_F(EvaluatorTest, rootMount)
{
    manager->mount(DirPath::root(), BackendConfig{.kind = "memory"});
    mountZips();

    manager->evaluator()->write(file("/top.json"), zips());

    ASSERT_THAT(showListing(manager->evaluator()->list(DirPath::root())), ElementsAre("data@ (counting)", "top.json"));
    ASSERT_EQ(readAll(file("/data/zips.json")), zips());
}

TEST_F(EvaluatorTest, appendAndPartialWrite)
{
    mountZips();
    auto evaluator = manager->evaluator();

    auto res = evaluator->append(file("/data/zips.json"), {{{"city", "NOWHERE"}}, "not an object"});
    ASSERT_EQ(res.written, 1u);
    ASSERT_EQ(res.errors.size(), 1u);
    ASSERT_EQ(res.errors[0].index, 1u);

    ASSERT_EQ(readAll(file("/data/zips.json")).size(), zips().size() + 1);
}

TEST_F(EvaluatorTest, removeFileAndDirectory)
{
    mountZips();
    auto evaluator = manager->evaluator();
    evaluator->write(file("/data/sub/a.json"), zips());

    evaluator->remove(file("/data/zips.json"));
    ASSERT_FALSE(evaluator->exists(file("/data/zips.json")));

    evaluator->remove(dir("/data/sub/"));
    ASSERT_THAT(evaluator->list(dir("/data/")), IsEmpty());

    ASSERT_THROW(evaluator->remove(file("/data/zips.json")), PathNotFound);
}

TEST_F(EvaluatorTest, removeDirectoryWithMount)
{
    mountZips();
    manager->mount(dir("/data/archive/"), counting());

    ASSERT_THAT(
        [&]() { manager->evaluator()->remove(dir("/data/")); },
        ThrowsMessage<CrossMountOperation>(HasSubstrIgnoreANSI("/data/archive/")));

    /* Nothing was deleted. */
    ASSERT_EQ(readAll(file("/data/zips.json")), zips());
}

TEST_F(EvaluatorTest, moveWithinMount)
{
    mountZips();
    auto evaluator = manager->evaluator();

    evaluator->move(file("/data/zips.json"), file("/data/old/zips.json"), MoveSemantics::FailIfExists);
    ASSERT_FALSE(evaluator->exists(file("/data/zips.json")));
    ASSERT_EQ(readAll(file("/data/old/zips.json")), zips());

    evaluator->move(dir("/data/old/"), dir("/data/new/"), MoveSemantics::Overwrite);
    ASSERT_EQ(readAll(file("/data/new/zips.json")), zips());
}

TEST_F(EvaluatorTest, moveAcrossMounts)
{
    mountZips();
    manager->mount(dir("/other/"), counting());
    auto evaluator = manager->evaluator();

    ASSERT_THAT(
        [&]() { evaluator->move(file("/data/zips.json"), file("/other/zips.json"), MoveSemantics::Overwrite); },
        ThrowsMessage<CrossMountOperation>(HasSubstrIgnoreANSI("different mounts")));

    ASSERT_EQ(readAll(file("/data/zips.json")), zips());
    ASSERT_FALSE(evaluator->exists(file("/other/zips.json")));
}

TEST_F(EvaluatorTest, moveMountPoint)
{
    mountZips();
    manager->mount(dir("/data/archive/"), counting());
    auto evaluator = manager->evaluator();

    ASSERT_THROW(evaluator->move(dir("/data/"), dir("/data/x/"), MoveSemantics::Overwrite), CrossMountOperation);
    ASSERT_THROW(evaluator->move(dir("/data/y/"), dir("/data/"), MoveSemantics::Overwrite), CrossMountOperation);
}

TEST_F(EvaluatorTest, moveDirectoryContainingMount)
{
    manager->mount(DirPath::root(), BackendConfig{.kind = "memory"});
    mountZips();
    auto evaluator = manager->evaluator();
    evaluator->write(file("/top/a.json"), zips());

    ASSERT_THAT(
        [&]() { evaluator->move(dir("/top/"), dir("/data/"), MoveSemantics::Overwrite); },
        ThrowsMessage<CrossMountOperation>(HasSubstrIgnoreANSI("different mounts")));

    evaluator->write(file("/x/a.json"), zips());
    manager->mount(dir("/x/inner/"), counting());
    evaluator = manager->evaluator();

    ASSERT_THAT(
        [&]() { evaluator->move(dir("/x/"), dir("/y/"), MoveSemantics::Overwrite); },
        ThrowsMessage<CrossMountOperation>(HasSubstrIgnoreANSI("is mounted below")));
    ASSERT_TRUE(evaluator->exists(file("/x/a.json")));
}

TEST_F(EvaluatorTest, moveMismatchedKinds)
{
    mountZips();

    ASSERT_THROW(
        manager->evaluator()->move(file("/data/zips.json"), dir("/data/d/"), MoveSemantics::Overwrite), UsageError);
}

TEST_F(EvaluatorTest, exists)
{
    auto evaluator = manager->evaluator();
    ASSERT_FALSE(evaluator->exists(file("/data/zips.json")));

    mountZips();
    evaluator = manager->evaluator();
    ASSERT_TRUE(evaluator->exists(file("/data/zips.json")));
    ASSERT_FALSE(evaluator->exists(file("/data/nope.json")));
}

TEST_F(EvaluatorTest, emptyNamespace)
{
    ASSERT_THROW(manager->evaluator()->list(DirPath::root()), PathNotFound);
    ASSERT_THROW(manager->evaluator()->write(file("/a.json"), zips()), PathNotFound);
}

} // namespace fedfs
