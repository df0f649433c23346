#include "core/loader/load_dispatcher.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <istream>
#include <memory>
#include <string>
#include <utility>

namespace cphoto
{
LoadDispatcher::LoadDispatcher(ResourceProvider& provider,
                               ImageDecoder& decoder,
                               DeliveryQueue& delivery,
                               ResultSink sink,
                               int worker_count,
                               bool debug_logging)
    : m_provider(provider)
    , m_decoder(decoder)
    , m_delivery(delivery)
    , m_sink(std::move(sink))
    , m_worker_count(std::max(1, worker_count))
    , m_debug(debug_logging)
{
}

LoadDispatcher::~LoadDispatcher()
{
    Stop();

    std::lock_guard<std::mutex> lock(m_mu);
    if (!m_jobs.empty())
        std::fprintf(stderr, "[dispatcher] destroyed without running; dropping %zu queued job(s)\n", m_jobs.size());
}

void LoadDispatcher::Start()
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_running)
        return;
    m_running = true;
    m_stopping = false;

    m_workers.clear();
    m_workers.reserve((size_t)m_worker_count);
    for (int i = 0; i < m_worker_count; ++i)
        m_workers.emplace_back([this]() { WorkerLoop(); });

    if (m_debug)
        std::fprintf(stderr, "[dispatcher] started %d worker(s), %zu queued\n", m_worker_count, m_jobs.size());
}

void LoadDispatcher::Stop()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (!m_running)
            return;
        m_stopping = true;
        workers.swap(m_workers);
    }
    m_cv.notify_all();

    for (auto& t : workers)
    {
        if (t.joinable())
            t.join();
    }

    std::lock_guard<std::mutex> lock(m_mu);
    m_running = false;
    m_stopping = false;
}

bool LoadDispatcher::IsRunning() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_running;
}

void LoadDispatcher::Submit(LoadRequest request)
{
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (m_debug)
            std::fprintf(stderr, "[dispatcher] queue token %d: %s\n", request.token, request.locator.c_str());
        m_jobs.push_back(std::move(request));
    }
    m_cv.notify_one();
}

std::size_t LoadDispatcher::PendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_jobs.size() + m_executing;
}

void LoadDispatcher::WorkerLoop()
{
    for (;;)
    {
        LoadRequest job;
        {
            std::unique_lock<std::mutex> lock(m_mu);
            m_cv.wait(lock, [&]() { return m_stopping || !m_jobs.empty(); });
            // Stopping only ends the loop once the queue is drained.
            if (m_jobs.empty())
                return;
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
            ++m_executing;
        }

        LoadResult res;
        res.image = Execute(job);
        res.token = job.token;
        res.target = job.target;
        // A throwing cookie copy still produces a result, just without the cookie.
        try
        {
            res.cookie = job.cookie;
        }
        catch (const std::exception& e)
        {
            std::fprintf(stderr, "[dispatcher] token %d: failed to copy cookie: %s\n", job.token, e.what());
        }
        catch (...)
        {
            std::fprintf(stderr, "[dispatcher] token %d: failed to copy cookie: unknown exception\n", job.token);
        }
        res.request = std::move(job);

        // Payload is handed off by value; the worker keeps no reference to it.
        ResultSink sink = m_sink;
        m_delivery.PostTask([sink, r = std::move(res)]() mutable
        {
            if (sink)
                sink(std::move(r));
        });

        {
            std::lock_guard<std::mutex> lock(m_mu);
            --m_executing;
        }
    }
}

ImageHandle LoadDispatcher::Execute(const LoadRequest& request)
{
    std::unique_ptr<std::istream> stream;
    std::string err;

    bool opened = false;
    try
    {
        opened = m_provider.OpenResourceStream(request.locator, stream, err);
    }
    catch (const std::exception& e)
    {
        opened = false;
        err = e.what();
    }
    catch (...)
    {
        opened = false;
        err = "unknown exception";
    }

    if (!opened || !stream)
    {
        std::fprintf(stderr, "[dispatcher] Error opening photo stream (token %d): %s\n",
                     request.token, err.empty() ? request.locator.c_str() : err.c_str());
        return nullptr;
    }

    ImageHandle image;
    bool decoded = false;
    try
    {
        decoded = m_decoder.Decode(*stream, request.locator, image, err);
    }
    catch (const std::exception& e)
    {
        decoded = false;
        err = e.what();
    }
    catch (...)
    {
        decoded = false;
        err = "unknown exception";
    }

    if (!decoded)
    {
        std::fprintf(stderr, "[dispatcher] Problem with image (token %d, %s): %s, using default image\n",
                     request.token, request.locator.c_str(), err.c_str());
        return nullptr;
    }

    if (m_debug)
    {
        if (image)
            std::fprintf(stderr, "[dispatcher] loaded token %d: %s (%dx%d)\n",
                         request.token, request.locator.c_str(), image->width, image->height);
        else
            std::fprintf(stderr, "[dispatcher] token %d decoded to nothing: %s\n",
                         request.token, request.locator.c_str());
    }
    return image;
}
} // namespace cphoto
