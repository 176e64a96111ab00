#include "fedfs/mount/tests/libmount.hh"
#include "fedfs/util/sync.hh"
#include "fedfs/util/thread-pool.hh"

namespace fedfs {

class ConcurrencyTest : public LibMountTest
{ };

TEST_F(ConcurrencyTest, mountDistinctPaths)
{
    ThreadPool pool(8);

    for (int i = 0; i < 32; ++i)
        pool.enqueue([this, i]() { manager->mount(dir(fmt("/m%d/", i)), counting()); });

    pool.process();

    ASSERT_EQ(manager->mounts().size(), 32u);
    ASSERT_EQ(manager->snapshot()->version, 32u);
    ASSERT_EQ(counters->live(), 32u);
}

TEST_F(ConcurrencyTest, mountSamePath)
{
    ThreadPool pool(8);
    Sync<std::pair<unsigned int, unsigned int>> outcomes;

    for (int i = 0; i < 16; ++i)
        pool.enqueue([&]() {
            try {
                manager->mount(dir("/data/"), counting());
                outcomes.lock()->first++;
            } catch (MountExists &) {
                outcomes.lock()->second++;
            }
        });

    pool.process();

    auto res = *outcomes.lock();
    ASSERT_EQ(res.first, 1u);
    ASSERT_EQ(res.second, 15u);
    ASSERT_EQ(manager->snapshot()->version, 1u);

    /* The losers never opened a backend. */
    ASSERT_EQ(counters->openAttempts.load(), 1u);
}

TEST_F(ConcurrencyTest, readersSeeConsistentSnapshots)
{
    mountZips();

    ThreadPool pool(8);
    std::atomic<unsigned int> reads{0};

    for (int i = 0; i < 16; ++i)
        pool.enqueue([&, i]() {
            auto path = dir(fmt("/extra%d/", i));
            manager->mount(path, counting());
            manager->unmount(path);
        });

    for (int i = 0; i < 64; ++i)
        pool.enqueue([&]() {
            auto snapshot = manager->snapshot();
            /* Whatever else changes, the zips mount stays. */
            ASSERT_EQ(drainCursor(*snapshot->evaluator->read(file("/data/zips.json"))), zips());
            reads++;
        });

    pool.process();

    ASSERT_EQ(reads.load(), 64u);
    ASSERT_EQ(manager->snapshot()->version, 1u + 32u);
    ASSERT_EQ(counters->live(), 1u);
}

TEST_F(ConcurrencyTest, queriesWhileMounting)
{
    mountZips();

    ThreadPool pool(8);
    Sync<std::vector<Records>> pages;

    for (int i = 0; i < 8; ++i) {
        pool.enqueue([&, i]() {
            manager->mount(file(fmt("/views/v%d.json", i)), ViewConfig{.query = "select * from zips"});
        });
        pool.enqueue([&]() {
            auto h = manager->openQuery(DirPath::root(), "select city from zips where pop > 100000");
            pages.lock()->push_back(manager->more(h, 10));
            manager->close(h);
        });
    }

    pool.process();

    auto res = pages.lock();
    ASSERT_EQ(res->size(), 8u);
    for (auto & page : *res)
        ASSERT_EQ(page.size(), 3u);
    ASSERT_EQ(manager->mounts().size(), 9u);
}

} // namespace fedfs
