#include "fedfs/mount/globals.hh"
#include "fedfs/mount/tests/capture-logger.hh"
#include "fedfs/mount/tests/gmock-matchers.hh"
#include "fedfs/mount/tests/libmount.hh"
#include "fedfs/util/finally.hh"

namespace fedfs {

using testing::HasSubstrIgnoreANSI;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::ThrowsMessage;

class ResultHandlesTest : public LibMountTest
{
protected:

    void SetUp() override
    {
        mountZips();
    }
};

TEST_F(ResultHandlesTest, pages)
{
    auto h = manager->openQuery(DirPath::root(), "select city from zips");

    ASSERT_EQ(manager->more(h, 2).size(), 2u);
    ASSERT_EQ(manager->more(h, 2).size(), 2u);

    auto last = manager->more(h, 2);
    ASSERT_EQ(last, (Records{{{"city", "BARRE"}}}));

    /* The empty page closes the handle. */
    ASSERT_THAT(manager->more(h, 2), IsEmpty());
    ASSERT_THROW(manager->more(h, 2), UnknownHandle);
}

TEST_F(ResultHandlesTest, defaultPageSize)
{
    auto saved = mountSettings.defaultPageSize.get();
    Finally restore([&]() { mountSettings.defaultPageSize = saved; });
    mountSettings.defaultPageSize = 3;

    auto h = manager->openQuery(DirPath::root(), "select * from zips");
    ASSERT_EQ(manager->more(h).size(), 3u);
    ASSERT_EQ(manager->more(h).size(), 2u);
}

TEST_F(ResultHandlesTest, relativeToBase)
{
    auto h = manager->openQuery(dir("/data/"), "select city from zips.json where state = :state", {{"state", "IL"}});
    ASSERT_EQ(manager->more(h, 10), (Records{{{"city", "CHICAGO"}}}));
}

TEST_F(ResultHandlesTest, close)
{
    auto h = manager->openQuery(DirPath::root(), "select * from zips");
    manager->close(h);

    ASSERT_THAT(
        [&]() { manager->more(h, 1); }, ThrowsMessage<UnknownHandle>(HasSubstrIgnoreANSI("is not open")));

    /* Closing twice is fine. */
    manager->close(h);
    manager->close(ResultHandle{12345});
}

TEST_F(ResultHandlesTest, closeFailureIsAWarning)
{
    auto h = manager->openQuery(DirPath::root(), "select * from zips");
    counters->failCursorClose = true;

    LogCapture capture;
    manager->close(h);

    ASSERT_THAT(capture->messages(lvlWarn), ElementsAre(HasSubstrIgnoreANSI("simulated cursor close failure")));
    ASSERT_THROW(manager->more(h, 1), UnknownHandle);
}

TEST_F(ResultHandlesTest, closeFailureOnLastPage)
{
    auto h = manager->openQuery(DirPath::root(), "select * from zips");
    counters->failCursorClose = true;

    LogCapture capture;
    ASSERT_EQ(manager->more(h, 100).size(), 5u);
    ASSERT_THAT(manager->more(h, 100), IsEmpty());

    ASSERT_THAT(capture->messages(lvlWarn), ElementsAre(HasSubstrIgnoreANSI("simulated cursor close failure")));
    ASSERT_THROW(manager->more(h, 1), UnknownHandle);
}

TEST_F(ResultHandlesTest, handlesAreNotReused)
{
    auto h1 = manager->openQuery(DirPath::root(), "select * from zips");
    manager->close(h1);
    auto h2 = manager->openQuery(DirPath::root(), "select * from zips");
    auto h3 = manager->openQuery(DirPath::root(), "select * from zips");

    ASSERT_LT(h1, h2);
    ASSERT_LT(h2, h3);
}

TEST_F(ResultHandlesTest, independentCursors)
{
    auto h1 = manager->openQuery(DirPath::root(), "select city from zips");
    auto h2 = manager->openQuery(DirPath::root(), "select city from zips");

    ASSERT_EQ(manager->more(h1, 1), (Records{{{"city", "NEW YORK"}}}));
    ASSERT_EQ(manager->more(h1, 1), (Records{{{"city", "BOULDER"}}}));
    ASSERT_EQ(manager->more(h2, 1), (Records{{{"city", "NEW YORK"}}}));
}

TEST_F(ResultHandlesTest, badQueryAllocatesNothing)
{
    MonotonicSeq seq(7);
    ResultHandleTable results(seq);

    ASSERT_THROW(results.openQuery(*manager->evaluator(), DirPath::root(), "select", {}), QueryError);
    ASSERT_EQ(results.size(), 0u);

    auto h = results.openQuery(*manager->evaluator(), DirPath::root(), "select * from zips", {});
    ASSERT_EQ(h, ResultHandle{7});
    ASSERT_EQ(results.size(), 1u);
}

TEST_F(ResultHandlesTest, cursorOutlivesUnmount)
{
    auto h = manager->openQuery(DirPath::root(), "select * from zips");
    manager->unmount(dir("/data/"));

    ASSERT_THROW(manager->more(h, 1), BackendUnavailable);
    manager->close(h);
}

TEST(MonotonicSeq, increases)
{
    MonotonicSeq seq(41);
    ASSERT_EQ(seq.next(), 41u);
    ASSERT_EQ(seq.next(), 42u);

    MonotonicSeq random(MonotonicSeq::randomStart());
    auto first = random.next();
    ASSERT_EQ(random.next(), first + 1);
}

} // namespace fedfs
