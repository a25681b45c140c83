#include <atomic>
#include <stdexcept>
#include <utility>

#include <relay/common/logging.h>
#include <relay/common/task_queue.h>

namespace relay
{
namespace common
{

struct Task::State
{
    State(std::function<void(const Task&)> function,
          Logger& logger,
          Clock::time_point when)
      : mFunction(std::move(function))
      , mLogger(logger)
      , mWhen(when)
    {
    }

    std::function<void(const Task&)> mFunction;
    Logger& mLogger;
    Clock::time_point mWhen;

    // Set by whoever gets to run the function.
    std::atomic<bool> mClaimed{false};

    std::atomic<bool> mCancelled{false};
}; // State

bool Task::run(bool cancel)
{
    if (!mState)
        return false;

    auto claimed = false;

    if (!mState->mClaimed.compare_exchange_strong(claimed, true))
        return false;

    mState->mCancelled = cancel;

    // Moved out so the closure is released once we're done.
    auto function = std::move(mState->mFunction);

    try
    {
        function(*this);
    }
    catch (std::exception& exception)
    {
        LogWarningF(mState->mLogger,
                    "Task threw an exception: %s",
                    exception.what());
    }

    return true;
}

Task::Task(std::function<void(const Task&)> function,
           Logger& logger,
           Clock::time_point when)
  : mState(std::make_shared<State>(std::move(function), logger, when))
{
}

Task::operator bool() const
{
    return mState != nullptr;
}

bool Task::operator!() const
{
    return mState == nullptr;
}

bool Task::cancel()
{
    return run(true);
}

bool Task::cancelled() const
{
    return mState && mState->mCancelled;
}

bool Task::complete()
{
    return run(false);
}

bool Task::completed() const
{
    return mState && mState->mClaimed;
}

Clock::time_point Task::when() const
{
    if (mState)
        return mState->mWhen;

    return Clock::time_point::max();
}

bool TaskQueue::Later::operator()(const Task& lhs, const Task& rhs) const
{
    return lhs.when() > rhs.when();
}

TaskQueue::~TaskQueue()
{
    while (!mTasks.empty())
        pop().cancel();
}

bool TaskQueue::empty() const
{
    return mTasks.empty();
}

Task TaskQueue::pop()
{
    if (mTasks.empty())
        return Task();

    auto task = mTasks.top();

    mTasks.pop();

    return task;
}

void TaskQueue::push(Task task)
{
    if (task && !task.completed())
        mTasks.push(std::move(task));
}

bool TaskQueue::ready(Clock::time_point now) const
{
    return now >= when();
}

std::size_t TaskQueue::size() const
{
    return mTasks.size();
}

Clock::time_point TaskQueue::when() const
{
    if (mTasks.empty())
        return Clock::time_point::max();

    return mTasks.top().when();
}

} // common
} // relay

