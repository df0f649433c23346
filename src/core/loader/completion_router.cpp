#include "core/loader/completion_router.h"

#include <cstdio>

namespace cphoto
{
void CompletionRouter::OnResult(LoadResult&& result)
{
    ++m_delivered;

    if (m_registry.IsAlive(result.target))
    {
        if (result.image)
            m_registry.AttachCachedImage(result.target, result.image);

        // The cache counts as current even when the load came back empty.
        m_registry.MarkCachedPhotoCurrent(result.target);
    }
    else if (m_debug && !result.target.IsNull())
    {
        std::fprintf(stderr, "[photo_loader] token %d: target released before load finished\n", result.token);
    }

    const LoadCompleteListener& listener = result.request.listener;
    if (!listener)
        return;

    if (m_debug)
        std::fprintf(stderr, "[photo_loader] notifying listener: token %d %s (%s)\n",
                     result.token, result.request.locator.c_str(), result.image ? "image" : "default");
    listener(result.token, result.cookie, result.image);
}
} // namespace cphoto
