#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fedfs/util/error.hh"
#include "fedfs/util/strings.hh"

namespace fedfs {

MakeError(TestError, Error);
MakeError(NestedTestError, TestError);

static std::string plain(const BaseError & e)
{
    return filterANSIEscapes(e.what(), true);
}

TEST(Error, message)
{
    TestError e("cannot mount '%s' at '%s'", "memory", "/data/");
    ASSERT_EQ(e.message(), "cannot mount '" ANSI_WARNING "memory" ANSI_NORMAL "' at '" ANSI_WARNING "/data/" ANSI_NORMAL "'");
    ASSERT_EQ(plain(e), "error: cannot mount 'memory' at '/data/'");
}

TEST(Error, hierarchy)
{
    try {
        throw NestedTestError("nested");
    } catch (TestError & e) {
        ASSERT_EQ(plain(e), "error: nested");
    }

    ASSERT_THROW(throw TestError("x"), Error);
    ASSERT_THROW(throw UsageError("x"), Error);
}

TEST(Error, addTrace)
{
    TestError e("inner problem");
    auto before = plain(e);

    e.addTrace("while doing '%s'", "something");
    ASSERT_TRUE(e.hasTrace());
    ASSERT_NE(plain(e), before);
    ASSERT_THAT(plain(e), ::testing::HasSubstr("while doing 'something'"));

    /* The most recent context is the one shown. */
    e.addTrace("while doing something else");
    ASSERT_THAT(plain(e), ::testing::HasSubstr("something else"));
}

TEST(Error, percentInArgument)
{
    TestError e("bad value '%s'", "100%");
    ASSERT_EQ(plain(e), "error: bad value '100%'");
}

TEST(SysError, ambientErrno)
{
    errno = ENOENT;
    SysError e("opening '%s'", "/nonexistent");
    ASSERT_EQ(e.errNo, ENOENT);
    ASSERT_THAT(plain(e), ::testing::HasSubstr("opening '/nonexistent'"));
    ASSERT_THAT(plain(e), ::testing::HasSubstr(strerror(ENOENT)));
}

} // namespace fedfs
