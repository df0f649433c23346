#pragma once

#include "core/loader/target_registry.h"

#include <optional>
#include <string>

namespace cphoto
{
// A live connection (call leg) that may or may not have caller info attached yet.
struct Connection
{
    std::optional<TargetHandle> caller;
};

// Per-slot photo request state.
//
// Used by a slot's owner to decide whether a new request targets a different entity
// than the one currently shown or loading. This is what keeps rapid call/connection
// changes from issuing duplicate loads. Owner-thread only.
class RequestTracker
{
public:
    enum class DisplayMode : int
    {
        Undefined = 0,
        ShowingImage = -1,
        ShowingDefault = -2,
    };

    // True iff `identity` differs from the current identity.
    // Null equals null; null differs from any live handle.
    bool ShouldLoad(TargetHandle identity) const { return m_current != identity; }

    // Null connection: load only if something is currently shown.
    // No caller attached yet: always load.
    bool ShouldLoadForConnection(const Connection* connection) const;

    void SetIdentity(TargetHandle identity) { m_current = identity; }
    TargetHandle CurrentIdentity() const { return m_current; }

    // Locator for the current identity's photo; empty when there is none.
    std::string PhotoLocator(const TargetRegistry& registry) const;

    void SetDisplayMode(DisplayMode mode) { m_display_mode = mode; }
    DisplayMode GetDisplayMode() const { return m_display_mode; }

private:
    TargetHandle m_current;
    DisplayMode m_display_mode = DisplayMode::Undefined;
};
} // namespace cphoto
