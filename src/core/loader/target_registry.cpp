#include "core/loader/target_registry.h"

#include <utility>

namespace cphoto
{
std::string ContactPhotoLocator(std::int64_t person_id)
{
    return "content://contacts/" + std::to_string(person_id) + "/photo";
}

TargetHandle TargetRegistry::Create(CallerInfo info)
{
    std::uint32_t index = 0;
    if (!m_free.empty())
    {
        index = m_free.back();
        m_free.pop_back();
    }
    else
    {
        index = (std::uint32_t)m_slots.size();
        m_slots.emplace_back();
    }

    Slot& s = m_slots[index];
    s.alive = true;
    s.info = std::move(info);
    ++m_live;

    TargetHandle h;
    h.index = index;
    h.generation = s.generation;
    return h;
}

bool TargetRegistry::Release(TargetHandle handle)
{
    if (!IsAlive(handle))
        return false;

    Slot& s = m_slots[handle.index];
    s.alive = false;
    s.info = CallerInfo{};
    // Skip 0 on wrap so a recycled slot never produces the null handle.
    if (++s.generation == 0)
        s.generation = 1;
    m_free.push_back(handle.index);
    --m_live;
    return true;
}

bool TargetRegistry::IsAlive(TargetHandle handle) const
{
    if (handle.IsNull() || handle.index >= m_slots.size())
        return false;
    const Slot& s = m_slots[handle.index];
    return s.alive && s.generation == handle.generation;
}

CallerInfo* TargetRegistry::Find(TargetHandle handle)
{
    if (!IsAlive(handle))
        return nullptr;
    return &m_slots[handle.index].info;
}

const CallerInfo* TargetRegistry::Find(TargetHandle handle) const
{
    if (!IsAlive(handle))
        return nullptr;
    return &m_slots[handle.index].info;
}

bool TargetRegistry::AttachCachedImage(TargetHandle handle, ImageHandle image)
{
    CallerInfo* info = Find(handle);
    if (!info)
        return false;
    info->cached_photo = std::move(image);
    return true;
}

bool TargetRegistry::MarkCachedPhotoCurrent(TargetHandle handle)
{
    CallerInfo* info = Find(handle);
    if (!info)
        return false;
    info->is_cached_photo_current = true;
    return true;
}

std::string TargetRegistry::PhotoLocatorFor(TargetHandle handle) const
{
    const CallerInfo* info = Find(handle);
    if (!info)
        return {};
    if (!info->photo_locator.empty())
        return info->photo_locator;
    return ContactPhotoLocator(info->person_id);
}
} // namespace cphoto
