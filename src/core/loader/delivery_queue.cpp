#include "core/loader/delivery_queue.h"

#include <iterator>
#include <utility>

namespace cphoto
{
void DeliveryQueue::PostTask(Task task)
{
    if (!task)
        return;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
}

std::size_t DeliveryQueue::RunPending()
{
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        batch.swap(m_tasks);
    }

    // Run outside the lock so tasks may post follow-ups. If a task throws, the tasks
    // after it go back to the front of the queue for the next pump.
    std::size_t ran = 0;
    try
    {
        while (!batch.empty())
        {
            Task t = std::move(batch.front());
            batch.pop_front();
            ++ran;
            t();
        }
    }
    catch (...)
    {
        {
            std::lock_guard<std::mutex> lock(m_mu);
            m_tasks.insert(m_tasks.begin(),
                           std::make_move_iterator(batch.begin()),
                           std::make_move_iterator(batch.end()));
        }
        throw;
    }
    return ran;
}

std::size_t DeliveryQueue::WaitAndRunPending(std::chrono::milliseconds timeout)
{
    {
        std::unique_lock<std::mutex> lock(m_mu);
        if (!m_cv.wait_for(lock, timeout, [&]() { return !m_tasks.empty(); }))
            return 0;
    }
    return RunPending();
}

std::size_t DeliveryQueue::PendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_tasks.size();
}
} // namespace cphoto
