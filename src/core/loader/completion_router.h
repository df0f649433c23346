#pragma once

#include "core/loader/load_types.h"
#include "core/loader/target_registry.h"

#include <cstdint>

namespace cphoto
{
// Applies finished loads on the delivery thread.
//
// Caches a present image onto the target's CallerInfo, marks the cached photo current,
// then notifies the request's listener. It does not check whether the slot has moved on
// to another target since the request was issued: listeners filter by token/cookie.
class CompletionRouter
{
public:
    explicit CompletionRouter(TargetRegistry& registry, bool debug_logging = false)
        : m_registry(registry)
        , m_debug(debug_logging)
    {
    }

    void OnResult(LoadResult&& result);

    std::uint64_t DeliveredCount() const { return m_delivered; }

private:
    TargetRegistry& m_registry;
    bool m_debug = false;
    std::uint64_t m_delivered = 0;
};
} // namespace cphoto
