// =============================================================================
// SlideBridge - Common Types
// Display names for enums (log lines and host-facing messages).
// =============================================================================

#include "slidebridge/common/Types.h"

namespace SlideBridge
{

const char* toString(ResolutionStatus status)
{
    switch (status)
    {
    case ResolutionStatus::Active:   return "active";
    case ResolutionStatus::Resolved: return "resolved";
    case ResolutionStatus::Closed:   return "closed";
    case ResolutionStatus::Unknown:  return "unknown";
    }
    return "unknown";
}

const char* toString(Freshness freshness)
{
    switch (freshness)
    {
    case Freshness::Fresh:       return "fresh";
    case Freshness::StaleCached: return "stale-cached";
    case Freshness::Unknown:     return "unknown";
    }
    return "unknown";
}

const char* toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NotAttached:           return "NotAttached";
    case ErrorKind::WindowAmbiguous:       return "WindowAmbiguous";
    case ErrorKind::SubscriptionLost:      return "SubscriptionLost";
    case ErrorKind::ResolutionUnavailable: return "ResolutionUnavailable";
    case ErrorKind::FocusNotFound:         return "FocusNotFound";
    case ErrorKind::RequestRejected:       return "RequestRejected";
    }
    return "Unknown";
}

const char* toString(FocusStatus status)
{
    switch (status)
    {
    case FocusStatus::Success:        return "success";
    case FocusStatus::NotFound:       return "not_found";
    case FocusStatus::PaneNotVisible: return "pane_not_visible";
    }
    return "not_found";
}

} // namespace SlideBridge
