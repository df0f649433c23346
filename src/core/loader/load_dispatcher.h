#pragma once

#include "core/loader/delivery_queue.h"
#include "core/loader/load_types.h"
#include "io/photo/image_decoder.h"
#include "io/photo/resource_provider.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cphoto
{
// Background photo loader.
//
// Submitted requests are opened and decoded on worker threads; every request produces
// exactly one LoadResult, posted to the DeliveryQueue and handed to the result sink when
// the owner thread pumps that queue. Open/decode failures are logged and become an absent
// image. There is no cancellation: queued jobs always run, even across Stop().
class LoadDispatcher
{
public:
    using ResultSink = std::function<void(LoadResult&&)>;

    LoadDispatcher(ResourceProvider& provider,
                   ImageDecoder& decoder,
                   DeliveryQueue& delivery,
                   ResultSink sink,
                   int worker_count = 1,
                   bool debug_logging = false);
    ~LoadDispatcher();

    LoadDispatcher(const LoadDispatcher&) = delete;
    LoadDispatcher& operator=(const LoadDispatcher&) = delete;

    void Start();

    // Lets the workers finish every queued job, then joins them.
    // Requests submitted while stopped wait for the next Start().
    void Stop();

    bool IsRunning() const;

    // Never blocks on I/O.
    void Submit(LoadRequest request);

    // Queued + executing jobs.
    std::size_t PendingCount() const;

    int WorkerCount() const { return m_worker_count; }

private:
    void WorkerLoop();
    ImageHandle Execute(const LoadRequest& request);

    ResourceProvider& m_provider;
    ImageDecoder& m_decoder;
    DeliveryQueue& m_delivery;
    ResultSink m_sink;
    int m_worker_count = 1;
    bool m_debug = false;

    std::vector<std::thread> m_workers;
    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::deque<LoadRequest> m_jobs;
    std::size_t m_executing = 0;
    bool m_running = false;
    bool m_stopping = false;
};
} // namespace cphoto
