#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <relay/common/task_executor.h>
#include <relay/transfer/subsystem_loggers.h>

using namespace relay::common;
using namespace std::chrono;

namespace
{

relay::common::Logger& logger()
{
    return relay::transfer::executorLogger();
}

} // anonymous

TEST(TaskExecutor, ExecutesTasks)
{
    TaskExecutor executor(4, logger());

    std::vector<std::future<bool>> results;

    for (auto i = 0; i < 16; ++i)
    {
        auto promise = std::make_shared<std::promise<bool>>();

        results.emplace_back(promise->get_future());

        executor.execute([promise](const Task& task) {
            promise->set_value(task.cancelled());
        });
    }

    for (auto& result : results)
    {
        ASSERT_EQ(std::future_status::ready, result.wait_for(seconds(8)));
        EXPECT_FALSE(result.get());
    }
}

TEST(TaskExecutor, RespectsWorkerLimit)
{
    std::atomic<std::size_t> active{0};
    std::atomic<std::size_t> peak{0};
    std::atomic<std::size_t> remaining{8};

    std::mutex lock;
    std::condition_variable cv;

    TaskExecutor executor(2, logger());

    for (auto i = 0; i < 8; ++i)
    {
        executor.execute([&](const Task&) {
            auto current = ++active;

            auto previous = peak.load();

            while (previous < current && !peak.compare_exchange_weak(previous, current))
                ;

            std::this_thread::sleep_for(milliseconds(10));

            --active;

            std::lock_guard<std::mutex> guard(lock);

            if (!--remaining)
                cv.notify_all();
        });
    }

    std::unique_lock<std::mutex> guard(lock);

    ASSERT_TRUE(cv.wait_for(guard, seconds(8), [&]() { return !remaining; }));

    EXPECT_LE(peak.load(), 2u);
}

TEST(TaskExecutor, DelaysTasks)
{
    std::promise<steady_clock::time_point> executed;

    TaskExecutor executor(1, logger());

    auto started = steady_clock::now();

    executor.execute([&](const Task&) {
        executed.set_value(steady_clock::now());
    }, milliseconds(100));

    auto result = executed.get_future();

    ASSERT_EQ(std::future_status::ready, result.wait_for(seconds(8)));
    EXPECT_GE(result.get() - started, milliseconds(100));
}

TEST(TaskExecutor, RunsEarliestTaskFirst)
{
    std::mutex lock;
    std::vector<int> order;
    std::promise<void> done;

    TaskExecutor executor(1, logger());

    auto record = [&](int value) {
        return [&, value](const Task&) {
            std::lock_guard<std::mutex> guard(lock);

            order.emplace_back(value);

            if (order.size() == 3)
                done.set_value();
        };
    }; // record

    executor.execute(record(3), milliseconds(150));
    executor.execute(record(1), milliseconds(50));
    executor.execute(record(2), milliseconds(100));

    ASSERT_EQ(std::future_status::ready,
              done.get_future().wait_for(seconds(8)));

    EXPECT_EQ(std::vector<int>({1, 2, 3}), order);
}

TEST(TaskExecutor, CancelsPendingTasksWhenDestroyed)
{
    std::atomic<bool> called{false};
    std::atomic<bool> cancelled{false};

    {
        TaskExecutor executor(1, logger());

        executor.execute([&](const Task& task) {
            cancelled = task.cancelled();
            called = true;
        }, hours(1));
    }

    EXPECT_TRUE(called);
    EXPECT_TRUE(cancelled);
}

TEST(TaskExecutor, CancelledTaskStillRunsItsFunction)
{
    TaskExecutor executor(1, logger());

    std::atomic<unsigned int> calls{0};
    std::atomic<bool> cancelled{false};

    auto task = executor.execute([&](const Task& task) {
        cancelled = task.cancelled();
        ++calls;
    }, hours(1));

    EXPECT_TRUE(task.cancel());
    EXPECT_TRUE(task.cancelled());
    EXPECT_TRUE(task.completed());
    EXPECT_EQ(1u, calls.load());
    EXPECT_TRUE(cancelled);

    // Only ever run once.
    EXPECT_FALSE(task.cancel());
    EXPECT_FALSE(task.complete());
    EXPECT_EQ(1u, calls.load());
}

TEST(TaskExecutor, ExceptionsDoNotKillWorkers)
{
    std::promise<void> executed;

    TaskExecutor executor(1, logger());

    executor.execute([](const Task&) {
        throw std::runtime_error("task failed");
    });

    executor.execute([&](const Task&) {
        executed.set_value();
    });

    EXPECT_EQ(std::future_status::ready,
              executed.get_future().wait_for(seconds(8)));
}

TEST(TaskExecutor, CountsPendingTasks)
{
    TaskExecutor executor(0, logger());

    // Always at least one worker.
    EXPECT_EQ(1u, executor.maxWorkers());

    executor.execute([](const Task&) {}, hours(1));
    executor.execute([](const Task&) {}, hours(2));

    EXPECT_EQ(2u, executor.pending());
}

TEST(TaskQueue, OrdersTasksByDeadline)
{
    TaskQueue queue;

    auto now = Clock::now();

    queue.push(Task([](const Task&) {}, logger(), now + seconds(2)));
    queue.push(Task([](const Task&) {}, logger(), now + seconds(1)));
    queue.push(Task([](const Task&) {}, logger(), now + seconds(3)));

    EXPECT_EQ(now + seconds(1), queue.when());
    EXPECT_FALSE(queue.ready(now));
    EXPECT_TRUE(queue.ready(now + seconds(1)));

    EXPECT_EQ(now + seconds(1), queue.pop().when());
    EXPECT_EQ(now + seconds(2), queue.pop().when());
    EXPECT_EQ(now + seconds(3), queue.pop().when());

    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.pop());
    EXPECT_EQ(Clock::time_point::max(), queue.when());
}

TEST(TaskQueue, IgnoresCompletedTasks)
{
    TaskQueue queue;

    Task task([](const Task&) {}, logger(), Clock::now());

    EXPECT_TRUE(task.complete());

    queue.push(task);
    queue.push(Task());

    EXPECT_TRUE(queue.empty());
}
