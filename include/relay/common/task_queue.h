#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <queue>
#include <vector>

#include <relay/common/logger_forward.h>
#include <relay/common/task_queue_forward.h>

namespace relay
{
namespace common
{

using Clock = std::chrono::steady_clock;

// A function scheduled to run no earlier than some deadline.
//
// The function runs exactly once: Either when the task is completed or
// when it is cancelled. It can call cancelled() to learn which.
class Task
{
    friend class TaskQueue;

    struct State;

    std::shared_ptr<State> mState;

    // Run the function if nobody else has.
    bool run(bool cancel);

public:
    Task() = default;

    Task(std::function<void(const Task&)> function,
         Logger& logger,
         Clock::time_point when);

    explicit operator bool() const;

    bool operator!() const;

    // Run the function as cancelled.
    //
    // Returns false if the function has already run.
    bool cancel();

    bool cancelled() const;

    // Run the function.
    //
    // Returns false if the function has already run.
    bool complete();

    bool completed() const;

    Clock::time_point when() const;
}; // Task

// Orders tasks by deadline.
//
// Tasks still queued when the queue is destroyed are cancelled.
class TaskQueue
{
    struct Later
    {
        bool operator()(const Task& lhs, const Task& rhs) const;
    }; // Later

    std::priority_queue<Task, std::vector<Task>, Later> mTasks;

public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue& other) = delete;

    ~TaskQueue();

    TaskQueue& operator=(const TaskQueue& rhs) = delete;

    bool empty() const;

    // Remove the task with the earliest deadline.
    Task pop();

    void push(Task task);

    // Is the earliest task due?
    bool ready(Clock::time_point now = Clock::now()) const;

    std::size_t size() const;

    // When the earliest task is due, or time_point::max() if none are queued.
    Clock::time_point when() const;
}; // TaskQueue

} // common
} // relay

