#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <relay/common/logger_forward.h>
#include <relay/common/task_queue.h>

namespace relay
{
namespace common
{

// Runs tasks on a bounded pool of worker threads.
//
// Workers are started on demand, one at a time, until the limit is
// reached. Tasks still queued when the executor is destroyed are
// cancelled.
class TaskExecutor
{
    // Executes tasks until the executor is destroyed.
    void work();

    // Signalled when a task is queued or we're shutting down.
    std::condition_variable mCV;

    // Workers waiting for something to do.
    std::size_t mIdle;

    mutable std::mutex mLock;

    Logger& mLogger;

    std::size_t mMaxWorkers;

    TaskQueue mTasks;

    bool mTerminating;

    std::vector<std::thread> mWorkers;

public:
    TaskExecutor(std::size_t maxWorkers, Logger& logger);

    TaskExecutor(const TaskExecutor& other) = delete;

    ~TaskExecutor();

    TaskExecutor& operator=(const TaskExecutor& rhs) = delete;

    // Run function no earlier than when.
    Task execute(std::function<void(const Task&)> function,
                 Clock::time_point when);

    template<typename Rep, typename Period>
    Task execute(std::function<void(const Task&)> function,
                 std::chrono::duration<Rep, Period> delay)
    {
        return execute(std::move(function), Clock::now() + delay);
    }

    Task execute(std::function<void(const Task&)> function)
    {
        return execute(std::move(function), Clock::now());
    }

    std::size_t maxWorkers() const;

    // How many tasks are waiting to run?
    std::size_t pending() const;
}; // TaskExecutor

} // common
} // relay

