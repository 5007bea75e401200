#pragma once
// =============================================================================
// SlideBridge - WindowResolver
// Maps an event payload to the document window that produced it.
//
// Primary: ask the payload for its owning window. A payload that only names
// a presentation with several windows yields an inferred owner; the focused
// window wins over it when it shows the same presentation. Fallbacks, in order:
//   1. OS focused-window handle matched against the open windows
//   2. the window the application flags as active
//   3. the application's active-window accessor (may be stale)
// Every fallback is logged as degraded confidence: a wrong answer announces
// another document's comments.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <cstdint>
#include <functional>
#include <optional>

namespace SlideBridge
{

class AppSession;
class EventPayload;

enum class ResolutionConfidence : uint8_t
{
    Direct,          // payload reported its owner
    InferredOwner,   // payload named a presentation; one of its windows picked
    FocusedWindow,   // fallback 1
    ActiveFlag,      // fallback 2
    ActiveAccessor,  // fallback 3
    Unresolved,
};

struct WindowResolution
{
    std::optional<WindowKey> window;
    ResolutionConfidence confidence = ResolutionConfidence::Unresolved;

    bool degraded() const { return confidence != ResolutionConfidence::Direct; }
};

class WindowResolver
{
public:
    // Returns the platform's focused top-level window handle (0 if unknown).
    using FocusedWindowProvider = std::function<uintptr_t()>;

    explicit WindowResolver(FocusedWindowProvider focusedWindow = {});

    void setFocusedWindowProvider(FocusedWindowProvider focusedWindow);

    // payload may be null (attach-time seeding): the fallback chain runs alone.
    WindowResolution resolve(const EventPayload* payload, AppSession& session) const;

private:
    FocusedWindowProvider focusedWindow_;
};

const char* toString(ResolutionConfidence confidence);

} // namespace SlideBridge
