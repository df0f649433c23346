#pragma once

#include "core/loader/completion_router.h"
#include "core/loader/delivery_queue.h"
#include "core/loader/load_dispatcher.h"
#include "core/loader/loader_config.h"

#include <any>
#include <memory>
#include <string>

namespace cphoto
{
// Public entry point: async contact photo loads delivered on the owner thread.
//
// Typical use from the owner (UI) thread:
//
//   if (tracker.ShouldLoad(caller))
//   {
//       tracker.SetIdentity(caller);
//       loader.RequestLoad(caller, token, registry.PhotoLocatorFor(caller), cookie, listener);
//   }
//   ...
//   delivery.RunPending(); // once per frame / loop iteration
//
// The loader does not own its collaborators; they must outlive it. Results still queued on
// the DeliveryQueue when the loader is destroyed are dropped (and logged) when pumped.
class AsyncPhotoLoader
{
public:
    AsyncPhotoLoader(const LoaderConfig& cfg,
                     ResourceProvider& provider,
                     ImageDecoder& decoder,
                     TargetRegistry& registry,
                     DeliveryQueue& delivery);
    ~AsyncPhotoLoader();

    AsyncPhotoLoader(const AsyncPhotoLoader&) = delete;
    AsyncPhotoLoader& operator=(const AsyncPhotoLoader&) = delete;

    void Start();
    void Stop();

    // Never blocks, never throws. An empty locator is rejected (logged, no callback).
    void RequestLoad(TargetHandle identity,
                     int token,
                     const std::string& locator,
                     std::any cookie,
                     LoadCompleteListener listener);

    std::size_t PendingCount() const { return m_dispatcher.PendingCount(); }
    std::uint64_t DeliveredCount() const { return m_router->DeliveredCount(); }

private:
    bool m_debug = false;
    // Shared so queued delivery tasks can tell whether the loader still exists.
    std::shared_ptr<CompletionRouter> m_router;
    LoadDispatcher m_dispatcher;
};
} // namespace cphoto
