// =============================================================================
// SlideBridge - Interface Descriptor
// Dispatch-id lookup over the hand-declared event table.
// =============================================================================

#include "slidebridge/automation/InterfaceDescriptor.h"

namespace SlideBridge
{

std::optional<AppEventKind> eventKindFromDispId(int32_t dispId)
{
    for (const auto& entry : kApplicationEvents)
    {
        if (entry.dispId == dispId)
            return entry.kind;
    }
    return std::nullopt;
}

const EventDescriptor& describe(AppEventKind kind)
{
    for (const auto& entry : kApplicationEvents)
    {
        if (entry.kind == kind)
            return entry;
    }
    return kApplicationEvents[0];
}

} // namespace SlideBridge
