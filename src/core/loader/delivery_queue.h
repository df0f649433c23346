#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace cphoto
{
// Single-threaded delivery context.
// Any thread may post; tasks only run when the owning thread pumps the queue,
// in the order they were posted. A task is never run inline by PostTask().
class DeliveryQueue
{
public:
    using Task = std::function<void()>;

    void PostTask(Task task);

    // Runs the tasks queued at the time of the call. Tasks posted while these run are
    // left for the next call. Returns the number of tasks run.
    // An exception from a task propagates; the tasks behind it stay queued.
    std::size_t RunPending();

    // Blocks up to `timeout` for at least one task, then behaves like RunPending().
    std::size_t WaitAndRunPending(std::chrono::milliseconds timeout);

    std::size_t PendingCount() const;

private:
    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::deque<Task> m_tasks;
};
} // namespace cphoto
