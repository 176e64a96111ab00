#include "fedfs/mount/tests/capture-logger.hh"
#include "fedfs/mount/tests/gmock-matchers.hh"
#include "fedfs/mount/tests/libmount.hh"
#include "fedfs/util/finally.hh"

namespace fedfs {

using testing::HasSubstrIgnoreANSI;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::ThrowsMessage;

class MountManagerTest : public LibMountTest
{ };

/**
 * A store that can be told to fail.
 */
struct FlakyMountConfigStore : MountConfigStore
{
    ref<MountConfigStore> inner = makeEphemeralMountConfigStore();
    bool fail = false;

    MountConfigs load() override
    {
        return inner->load();
    }

    void save(const AnyPath & path, const MountConfig & config) override
    {
        if (fail)
            throw Error("simulated store failure");
        inner->save(path, config);
    }

    void remove(const AnyPath & path) override
    {
        if (fail)
            throw Error("simulated store failure");
        inner->remove(path);
    }
};

TEST_F(MountManagerTest, startsEmpty)
{
    ASSERT_EQ(manager->snapshot()->version, 0u);
    ASSERT_TRUE(manager->snapshot()->table.empty());
    ASSERT_THAT(manager->mounts(), IsEmpty());
}

TEST_F(MountManagerTest, mountAndUnmount)
{
    auto before = manager->snapshot();

    manager->mount(dir("/data/"), counting());
    ASSERT_EQ(manager->snapshot()->version, 1u);
    ASSERT_EQ(counters->live(), 1u);

    auto res = manager->unmount(dir("/data/"));
    ASSERT_THAT(res.warnings, IsEmpty());
    ASSERT_EQ(manager->snapshot()->version, 2u);
    ASSERT_EQ(manager->snapshot()->table, before->table);
    ASSERT_EQ(counters->live(), 0u);
}

TEST_F(MountManagerTest, mountExists)
{
    manager->mount(dir("/data/"), counting());
    auto before = manager->snapshot();

    ASSERT_THAT(
        [&]() { manager->mount(dir("/data/"), BackendConfig{.kind = "memory"}); },
        ThrowsMessage<MountExists>(HasSubstrIgnoreANSI("/data/")));

    /* A trailing slash does not make it a different mount point. */
    ASSERT_THROW(manager->mount(file("/data"), ViewConfig{.query = "select * from zips"}), MountExists);

    /* An occupied path is reported as such even when the new mount
       could not go there anyway. */
    ASSERT_THROW(manager->mount(file("/data"), counting()), MountExists);

    ASSERT_EQ(manager->snapshot()->version, before->version);
    ASSERT_EQ(manager->snapshot()->table, before->table);
    ASSERT_EQ(counters->openAttempts.load(), 1u);
}

TEST_F(MountManagerTest, pathTypeMismatch)
{
    ASSERT_THROW(manager->mount(file("/data.json"), counting()), PathTypeMismatch);
    ASSERT_THROW(manager->mount(dir("/views/"), ViewConfig{.query = "select * from zips"}), PathTypeMismatch);

    ASSERT_EQ(counters->openAttempts.load(), 0u);
    ASSERT_EQ(manager->snapshot()->version, 0u);
}

TEST_F(MountManagerTest, unknownKind)
{
    ASSERT_THAT(
        [&]() { manager->mount(dir("/data/"), BackendConfig{.kind = "tape"}); },
        ThrowsMessage<UnknownBackendKind>(HasSubstrIgnoreANSI("tape")));
    ASSERT_FALSE(manager->lookupMountConfig(dir("/data/")));
}

TEST_F(MountManagerTest, failedOpenLeavesNothingBehind)
{
    counters->failOpen = true;

    ASSERT_THAT(
        [&]() { manager->mount(dir("/data/"), counting()); },
        ThrowsMessage<BackendConnectError>(HasSubstrIgnoreANSI("simulated connection failure")));

    ASSERT_EQ(counters->openAttempts.load(), 1u);
    ASSERT_EQ(counters->live(), 0u);
    ASSERT_TRUE(manager->snapshot()->table.empty());
    ASSERT_THAT(store->load(), IsEmpty());

    counters->failOpen = false;
    manager->mount(dir("/data/"), counting());
    ASSERT_EQ(counters->live(), 1u);
}

TEST_F(MountManagerTest, invalidViewQuery)
{
    ASSERT_THAT(
        [&]() { manager->mount(file("/views/v.json"), ViewConfig{.query = "select from"}); },
        ThrowsMessage<QueryError>(HasSubstrIgnoreANSI("/views/v.json")));
    ASSERT_FALSE(manager->mountType(file("/views/v.json")));
}

TEST_F(MountManagerTest, unmountMissing)
{
    ASSERT_THROW(manager->unmount(dir("/data/")), MountNotFound);

    manager->mount(dir("/data/"), counting());

    /* Unmounting is by exact path only. */
    ASSERT_THROW(manager->unmount(dir("/data/sub/")), MountNotFound);
    ASSERT_THROW(manager->unmount(DirPath::root()), MountNotFound);
    ASSERT_EQ(manager->snapshot()->version, 1u);
}

TEST_F(MountManagerTest, releaseFailureIsAWarning)
{
    manager->mount(dir("/data/"), counting());
    counters->failRelease = true;

    LogCapture capture;
    auto res = manager->unmount(dir("/data/"));

    ASSERT_THAT(res.warnings, ElementsAre(HasSubstrIgnoreANSI("simulated release failure")));
    ASSERT_THAT(capture->messages(lvlWarn), ElementsAre(HasSubstrIgnoreANSI("simulated release failure")));
    ASSERT_FALSE(manager->lookupMountConfig(dir("/data/")));
    ASSERT_EQ(counters->releases.load(), 1u);
}

TEST_F(MountManagerTest, lookupAndType)
{
    manager->mount(dir("/data/"), counting());
    ViewConfig view{.query = "select city from zips", .defaultVars = {{"limit", 3}}};
    manager->mount(file("/views/v.json"), view);

    ASSERT_EQ(manager->lookupMountConfig(dir("/data/")), MountConfig(counting()));
    ASSERT_EQ(manager->lookupMountConfig(file("/views/v.json")), MountConfig(view));
    ASSERT_FALSE(manager->lookupMountConfig(dir("/data/sub/")));

    ASSERT_EQ(manager->mountType(dir("/data/")), "counting");
    ASSERT_EQ(manager->mountType(file("/views/v.json")), "view");
    ASSERT_EQ(manager->mountType(dir("/nothing/")), std::nullopt);

    auto all = manager->mounts();
    ASSERT_EQ(all.size(), 2u);
    ASSERT_EQ(all[0].first, AnyPath(dir("/data/")));
    ASSERT_EQ(all[1].first, AnyPath(file("/views/v.json")));
}

TEST_F(MountManagerTest, writeThrough)
{
    manager->mount(dir("/data/"), counting());
    manager->mount(file("/views/v.json"), ViewConfig{.query = "select * from zips"});

    ASSERT_EQ(store->load(), manager->mounts());

    manager->unmount(dir("/data/"));
    auto saved = store->load();
    ASSERT_EQ(saved.size(), 1u);
    ASSERT_EQ(saved[0].first, AnyPath(file("/views/v.json")));
}

TEST_F(MountManagerTest, noWriteThrough)
{
    MountManager manager2(registry, compiler, store, false);
    manager2.mount(dir("/data/"), counting());
    ASSERT_THAT(store->load(), IsEmpty());
}

TEST_F(MountManagerTest, storeFailureRollsBack)
{
    auto flaky = make_ref<FlakyMountConfigStore>();
    MountManager manager2(registry, compiler, flaky);

    flaky->fail = true;
    ASSERT_THAT(
        [&]() { manager2.mount(dir("/data/"), counting()); },
        ThrowsMessage<Error>(HasSubstrIgnoreANSI("simulated store failure")));
    ASSERT_EQ(manager2.snapshot()->version, 0u);
    ASSERT_EQ(counters->live(), 0u);

    flaky->fail = false;
    manager2.mount(dir("/data/"), counting());

    flaky->fail = true;
    ASSERT_THROW(manager2.unmount(dir("/data/")), Error);
    ASSERT_TRUE(manager2.lookupMountConfig(dir("/data/")));
    ASSERT_EQ(counters->live(), 1u);
}

TEST_F(MountManagerTest, mountAll)
{
    auto saved = makeEphemeralMountConfigStore({
        {dir("/data/"), counting()},
        {file("/views/v.json"), ViewConfig{.query = "select * from zips"}},
    });
    MountManager manager2(registry, compiler, saved);

    manager2.mountAll();

    ASSERT_EQ(manager2.mounts(), saved->load());
    ASSERT_EQ(manager2.snapshot()->version, 2u);
    ASSERT_EQ(counters->live(), 1u);
}

TEST_F(MountManagerTest, mountAllStopsAtFailure)
{
    auto saved = makeEphemeralMountConfigStore({
        {dir("/a/"), counting()},
        {dir("/b/"), BackendConfig{.kind = "tape"}},
    });
    MountManager manager2(registry, compiler, saved);

    ASSERT_THAT(
        [&]() { manager2.mountAll(); },
        ThrowsMessage<UnknownBackendKind>(HasSubstrIgnoreANSI("mount configuration store")));
    ASSERT_TRUE(manager2.lookupMountConfig(dir("/a/")));
    ASSERT_FALSE(manager2.lookupMountConfig(dir("/b/")));
}

TEST_F(MountManagerTest, destructorReleases)
{
    {
        MountManager manager2(registry, compiler, makeEphemeralMountConfigStore());
        manager2.mount(dir("/a/"), counting());
        manager2.mount(dir("/b/"), counting());
        ASSERT_EQ(counters->live(), 2u);
    }
    ASSERT_EQ(counters->live(), 0u);
}

TEST_F(MountManagerTest, oldEvaluatorAfterUnmount)
{
    mountZips();
    auto old = manager->evaluator();

    manager->unmount(dir("/data/"));

    /* The old evaluator still sees the mount, but its backend is gone. */
    ASSERT_TRUE(old->mountTable().lookup(CanonPath("/data")));
    ASSERT_THROW(old->read(file("/data/zips.json")), BackendUnavailable);
    ASSERT_THROW(old->write(file("/data/zips.json"), zips()), BackendUnavailable);

    ASSERT_THROW(manager->evaluator()->read(file("/data/zips.json")), PathNotFound);
}

TEST_F(MountManagerTest, cursorAfterUnmount)
{
    mountZips();
    auto cursor = manager->evaluator()->read(file("/data/zips.json"));

    manager->unmount(dir("/data/"));

    ASSERT_THROW(cursor->more(1), BackendUnavailable);
    cursor->close();
}

TEST_F(MountManagerTest, unmountDuringRead)
{
    bool armed = false;
    counters->onRead = [&]() {
        if (armed) {
            armed = false;
            manager->unmount(dir("/data/"));
        }
    };
    mountZips();

    armed = true;
    ASSERT_THAT(
        [&]() { readAll(file("/data/zips.json")); },
        ThrowsMessage<BackendUnavailable>(HasSubstrIgnoreANSI("/data/")));
    ASSERT_FALSE(manager->lookupMountConfig(dir("/data/")));
}

TEST_F(MountManagerTest, remountIsFresh)
{
    mountZips();
    manager->unmount(dir("/data/"));
    manager->mount(dir("/data/"), counting());

    ASSERT_THAT(manager->evaluator()->list(dir("/data/")), IsEmpty());
    ASSERT_EQ(counters->opens.load(), 2u);
    ASSERT_EQ(counters->live(), 1u);
}

TEST_F(MountManagerTest, logsMounts)
{
    auto savedVerbosity = verbosity;
    verbosity = lvlInfo;
    Finally restore([&]() { verbosity = savedVerbosity; });

    LogCapture capture;
    manager->mount(dir("/data/"), counting());
    manager->unmount(dir("/data/"));

    ASSERT_THAT(
        capture->messages(lvlInfo),
        ElementsAre(HasSubstrIgnoreANSI("mounted counting at '/data/'"), HasSubstrIgnoreANSI("unmounted '/data/'")));
}

} // namespace fedfs
