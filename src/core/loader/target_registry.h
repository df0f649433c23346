#pragma once

#include "core/loader/image.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cphoto
{
// Opaque identity of a target entity (e.g. the caller info attached to a live call).
// Handles compare by value; a slot that is released and reused gets a new generation,
// so two records with identical contents never share a handle.
struct TargetHandle
{
    std::uint32_t index = 0;
    std::uint32_t generation = 0; // 0 => null handle

    bool IsNull() const { return generation == 0; }
    bool operator==(const TargetHandle& o) const
    {
        // Every null handle is the same "no identity", whatever its index.
        if (IsNull() || o.IsNull())
            return IsNull() && o.IsNull();
        return index == o.index && generation == o.generation;
    }
    bool operator!=(const TargetHandle& o) const { return !(*this == o); }
};

struct CallerInfo
{
    std::int64_t person_id = 0;
    std::string name;

    // Explicit locator; when empty the contact photo locator is derived from person_id.
    std::string photo_locator;

    // Written back on the delivery thread when a load completes.
    ImageHandle cached_photo;
    bool is_cached_photo_current = false;
};

// Builds "content://contacts/<person_id>/photo".
std::string ContactPhotoLocator(std::int64_t person_id);

// Arena of CallerInfo records addressed by TargetHandle.
// Not thread-safe: owned by the delivery (UI) thread.
class TargetRegistry
{
public:
    TargetHandle Create(CallerInfo info);

    // Returns false for null or stale handles.
    bool Release(TargetHandle handle);

    bool IsAlive(TargetHandle handle) const;

    // Returns nullptr for null or stale handles.
    CallerInfo* Find(TargetHandle handle);
    const CallerInfo* Find(TargetHandle handle) const;

    bool AttachCachedImage(TargetHandle handle, ImageHandle image);
    bool MarkCachedPhotoCurrent(TargetHandle handle);

    // Empty when the handle is not alive.
    std::string PhotoLocatorFor(TargetHandle handle) const;

    std::size_t Size() const { return m_live; }

private:
    struct Slot
    {
        std::uint32_t generation = 1;
        bool alive = false;
        CallerInfo info;
    };

    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_free;
    std::size_t m_live = 0;
};
} // namespace cphoto
