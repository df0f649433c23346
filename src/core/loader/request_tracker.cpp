#include "core/loader/request_tracker.h"

namespace cphoto
{
bool RequestTracker::ShouldLoadForConnection(const Connection* connection) const
{
    if (!connection)
        return !m_current.IsNull();

    if (!connection->caller.has_value())
        return true;

    return ShouldLoad(*connection->caller);
}

std::string RequestTracker::PhotoLocator(const TargetRegistry& registry) const
{
    if (m_current.IsNull())
        return {};
    return registry.PhotoLocatorFor(m_current);
}
} // namespace cphoto
