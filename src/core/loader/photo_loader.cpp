#include "core/loader/photo_loader.h"

#include <cstdio>
#include <utility>

namespace cphoto
{
AsyncPhotoLoader::AsyncPhotoLoader(const LoaderConfig& cfg,
                                   ResourceProvider& provider,
                                   ImageDecoder& decoder,
                                   TargetRegistry& registry,
                                   DeliveryQueue& delivery)
    : m_debug(cfg.debug_logging)
    , m_router(std::make_shared<CompletionRouter>(registry, cfg.debug_logging))
    , m_dispatcher(provider, decoder, delivery,
                   [router = std::weak_ptr<CompletionRouter>(m_router)](LoadResult&& r)
                   {
                       if (auto live = router.lock())
                       {
                           live->OnResult(std::move(r));
                           return;
                       }
                       std::fprintf(stderr, "[photo_loader] token %d: loader destroyed, dropping result\n", r.token);
                   },
                   cfg.worker_count, cfg.debug_logging)
{
}

AsyncPhotoLoader::~AsyncPhotoLoader()
{
    Stop();
}

void AsyncPhotoLoader::Start()
{
    m_dispatcher.Start();
}

void AsyncPhotoLoader::Stop()
{
    m_dispatcher.Stop();
}

void AsyncPhotoLoader::RequestLoad(TargetHandle identity,
                                   int token,
                                   const std::string& locator,
                                   std::any cookie,
                                   LoadCompleteListener listener)
{
    // Without a locator there is nothing to fetch; the caller keeps its placeholder.
    if (locator.empty())
    {
        std::fprintf(stderr, "[photo_loader] token %d: locator is missing\n", token);
        return;
    }

    if (m_debug)
        std::fprintf(stderr, "[photo_loader] begin loading token %d: %s, displaying default image for now\n",
                     token, locator.c_str());

    LoadRequest req;
    req.token = token;
    req.target = identity;
    req.locator = locator;
    req.cookie = std::move(cookie);
    req.listener = std::move(listener);
    m_dispatcher.Submit(std::move(req));
}
} // namespace cphoto
