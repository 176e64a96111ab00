#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fedfs/mount/backend-registry.hh"
#include "fedfs/mount/errors.hh"
#include "fedfs/mount/memory-backend.hh"
#include "fedfs/mount/tests/counting-backend.hh"
#include "fedfs/mount/tests/gmock-matchers.hh"

namespace fedfs {

using testing::HasSubstrIgnoreANSI;
using ::testing::ThrowsMessage;

TEST(BackendRegistry, memoryIsRegisteredGlobally)
{
    ASSERT_NE(BackendRegistry::global().lookup("memory"), nullptr);
    ASSERT_TRUE(BackendRegistry::global().kinds().contains("memory"));
}

TEST(BackendRegistry, duplicateKind)
{
    BackendRegistry registry;
    registry.add<MemoryBackend>();
    ASSERT_THROW(registry.add<MemoryBackend>(), Error);
    ASSERT_EQ(registry.kinds(), StringSet{"memory"});
}

TEST(BackendRegistry, unknownKind)
{
    BackendRegistry registry;
    EXPECT_THAT(
        [&]() { registry.open(BackendConfig{.kind = "mongodb"}); },
        ThrowsMessage<UnknownBackendKind>(HasSubstrIgnoreANSI("unknown backend kind 'mongodb'")));
}

TEST(BackendRegistry, openFailureIsAConnectError)
{
    auto counters = std::make_shared<BackendCounters>();
    counters->failOpen = true;

    BackendRegistry registry;
    registry.add("counting", makeCountingBackendFactory(counters));

    EXPECT_THAT(
        [&]() { registry.open(BackendConfig{.kind = "counting"}); },
        ThrowsMessage<BackendConnectError>(HasSubstrIgnoreANSI("simulated connection failure")));

    ASSERT_EQ(counters->openAttempts.load(), 1u);
    ASSERT_EQ(counters->opens.load(), 0u);
}

TEST(BackendRegistry, badParameters)
{
    BackendRegistry registry;
    registry.add<MemoryBackend>();

    ASSERT_THROW(registry.open(BackendConfig{.kind = "memory", .params = {{"host", "localhost"}}}), BackendConnectError);

    auto opened = registry.open(BackendConfig{.kind = "memory"});
    ASSERT_TRUE(opened.release);
    opened.release();
}

} // namespace fedfs
