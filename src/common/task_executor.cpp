#include <cassert>

#include <relay/common/logging.h>
#include <relay/common/task_executor.h>

namespace relay
{
namespace common
{

void TaskExecutor::work()
{
    LogDebug1(mLogger, "Worker started");

    std::unique_lock<std::mutex> lock(mLock);

    while (!mTerminating)
    {
        if (!mTasks.ready())
        {
            ++mIdle;

            // Any change to the queue wakes us so we can recompute the
            // deadline we're waiting for.
            if (mTasks.empty())
                mCV.wait(lock);
            else
                mCV.wait_until(lock, mTasks.when());

            --mIdle;

            continue;
        }

        auto task = mTasks.pop();

        lock.unlock();

        task.complete();

        lock.lock();
    }

    LogDebug1(mLogger, "Worker stopped");
}

TaskExecutor::TaskExecutor(std::size_t maxWorkers, Logger& logger)
  : mCV()
  , mIdle(0)
  , mLock()
  , mLogger(logger)
  , mMaxWorkers(maxWorkers ? maxWorkers : 1)
  , mTasks()
  , mTerminating(false)
  , mWorkers()
{
    LogDebugF(mLogger, "Executor started: at most %zu worker(s)", mMaxWorkers);
}

TaskExecutor::~TaskExecutor()
{
    {
        std::lock_guard<std::mutex> guard(mLock);

        mTerminating = true;
    }

    mCV.notify_all();

    for (auto& worker : mWorkers)
        worker.join();

    std::vector<Task> pending;

    {
        std::lock_guard<std::mutex> guard(mLock);

        while (!mTasks.empty())
            pending.emplace_back(mTasks.pop());
    }

    LogDebugF(mLogger,
              "Executor stopped: Cancelling %zu pending task(s)",
              pending.size());

    for (auto& task : pending)
        task.cancel();
}

Task TaskExecutor::execute(std::function<void(const Task&)> function,
                           Clock::time_point when)
{
    assert(function);

    Task task(std::move(function), mLogger, when);

    std::unique_lock<std::mutex> lock(mLock);

    if (mTerminating)
    {
        lock.unlock();

        task.cancel();

        return task;
    }

    mTasks.push(task);

    // Everyone's busy: Hire some help if we can.
    if (!mIdle && mWorkers.size() < mMaxWorkers)
        mWorkers.emplace_back(&TaskExecutor::work, this);

    lock.unlock();

    // Wake everyone as the new task may be due before what they're waiting for.
    mCV.notify_all();

    return task;
}

std::size_t TaskExecutor::maxWorkers() const
{
    return mMaxWorkers;
}

std::size_t TaskExecutor::pending() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mTasks.size();
}

} // common
} // relay

