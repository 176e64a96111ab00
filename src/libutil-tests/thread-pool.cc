#include "fedfs/util/thread-pool.hh"
#include <gtest/gtest.h>

#include <atomic>

namespace fedfs {

TEST(threadpool, correctValue)
{
    ThreadPool pool(3);
    int sum = 0;
    std::mutex mtx;
    for (int i = 0; i < 20; i++) {
        pool.enqueue([&] {
            std::lock_guard<std::mutex> lock(mtx);
            sum += 1;
        });
    }
    pool.process();
    ASSERT_EQ(sum, 20);
}

TEST(threadpool, workItemsCanEnqueue)
{
    ThreadPool pool(2);
    std::atomic<int> count{0};
    for (int i = 0; i < 4; i++)
        pool.enqueue([&] {
            count++;
            pool.enqueue([&] { count++; });
        });
    pool.process();
    ASSERT_EQ(count.load(), 8);
}

TEST(threadpool, properlyHandlesDirectExceptions)
{
    struct TestExn
    {};

    ThreadPool pool(3);
    pool.enqueue([&] { throw TestExn(); });
    EXPECT_THROW(pool.process(), TestExn);
}

TEST(threadpool, propagatesErrors)
{
    ThreadPool pool(3);
    for (int i = 0; i < 5; i++)
        pool.enqueue([i] {
            if (i == 3)
                throw Error("work item %d failed", i);
        });
    EXPECT_THROW(pool.process(), Error);
}

} // namespace fedfs
