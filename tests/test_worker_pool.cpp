#include "jb/core/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <chrono>
#include <thread>

using namespace jb::core;
using namespace std::chrono_literals;

// submit() hands back the job's result
TEST(WorkerPoolTest, SubmitReturnsResult)
{
    worker_pool pool(2);
    auto fut = pool.submit([] { return 42; });
    EXPECT_EQ(fut.get(), 42);
    EXPECT_EQ(pool.size(), 2u);
}

// wait_idle() returns only after every job finished
TEST(WorkerPoolTest, WaitIdleDrainsQueue)
{
    worker_pool pool(3);
    std::atomic<int> done{0};

    for (int i = 0; i < 20; ++i) {
        pool.submit([&done] {
            std::this_thread::sleep_for(1ms);
            ++done;
        });
    }

    pool.wait_idle();
    EXPECT_EQ(done.load(), 20);
}

// Exceptions travel through the future
TEST(WorkerPoolTest, ExceptionReachesFuture)
{
    worker_pool pool(1);
    auto fut = pool.submit([]() -> int { throw std::runtime_error("nope"); });
    EXPECT_THROW(fut.get(), std::runtime_error);

    // pool still works afterwards
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

// Queued jobs still run when the pool is destroyed
TEST(WorkerPoolTest, DestructorRunsQueuedJobs)
{
    std::atomic<int> done{0};
    {
        worker_pool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&done] { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 5);
}

// background_task cancel flag and completion
TEST(WorkerPoolTest, BackgroundTaskCancelAndWait)
{
    worker_pool pool(1);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    std::atomic<bool> saw_cancel{false};

    auto fut = pool.submit([cancelled, &saw_cancel] {
        for (int i = 0; i < 200 && !cancelled->load(); ++i) {
            std::this_thread::sleep_for(1ms);
        }
        saw_cancel = cancelled->load();
    });

    background_task task{cancelled, fut.share()};
    EXPECT_TRUE(task.pending());

    task.cancel();
    task.wait();
    EXPECT_FALSE(task.pending());
    EXPECT_TRUE(saw_cancel.load());

    background_task empty;
    EXPECT_FALSE(empty.pending());
    empty.cancel();
    empty.wait();
}
