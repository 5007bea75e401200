// =============================================================================
// SlideBridge - WindowResolver
// Event-to-window disambiguation with a logged fallback chain.
// =============================================================================

#include "slidebridge/logic/WindowResolver.h"
#include "slidebridge/automation/AppSession.h"
#include "slidebridge/support/DebugLog.h"

namespace SlideBridge
{

WindowResolver::WindowResolver(FocusedWindowProvider focusedWindow)
    : focusedWindow_(std::move(focusedWindow))
{
}

void WindowResolver::setFocusedWindowProvider(FocusedWindowProvider focusedWindow)
{
    focusedWindow_ = std::move(focusedWindow);
}

WindowResolution WindowResolver::resolve(const EventPayload* payload, AppSession& session) const
{
    WindowResolution result;

    // ── Primary: the payload's own parent window ──
    std::optional<WindowKey> inferred;
    if (payload)
    {
        if (auto owner = payload->owningWindow(); owner && !owner->empty())
        {
            if (!payload->ownerInferred())
            {
                result.window = *owner;
                result.confidence = ResolutionConfidence::Direct;
                return result;
            }
            inferred = *owner;
        }
    }

    const std::vector<DocumentWindowHandle> open = session.openWindows();
    const uintptr_t focused = focusedWindow_ ? focusedWindow_() : 0;

    // ── Inferred owner: the focused window decides between the deck's windows ──
    if (inferred)
    {
        for (const auto& w : open)
        {
            if (focused != 0 && w.key.hwnd == focused && w.key.presentation == inferred->presentation)
            {
                logWarning("window resolved from focused window handle (degraded confidence)");
                result.window = w.key;
                result.confidence = ResolutionConfidence::FocusedWindow;
                return result;
            }
        }
        logWarning("window inferred from the presentation's windows (degraded confidence)");
        result.window = *inferred;
        result.confidence = ResolutionConfidence::InferredOwner;
        return result;
    }

    // ── Fallback 1: OS focused window ──
    if (focused != 0)
    {
        for (const auto& w : open)
        {
            if (w.key.hwnd == focused)
            {
                logWarning("window resolved from focused window handle (degraded confidence)");
                result.window = w.key;
                result.confidence = ResolutionConfidence::FocusedWindow;
                return result;
            }
        }
    }

    // ── Fallback 2: application "active" flag ──
    for (const auto& w : open)
    {
        if (w.active)
        {
            logWarning("window resolved from active flag (degraded confidence)");
            result.window = w.key;
            result.confidence = ResolutionConfidence::ActiveFlag;
            return result;
        }
    }

    // ── Fallback 3: active-window accessor (may lag) ──
    if (auto active = session.activeWindow(); active && !active->empty())
    {
        logWarning("window resolved from active-window accessor (may be stale)");
        result.window = *active;
        result.confidence = ResolutionConfidence::ActiveAccessor;
        return result;
    }

    logWarning(std::string("window resolution failed: ") + toString(ErrorKind::WindowAmbiguous));
    return result;
}

const char* toString(ResolutionConfidence confidence)
{
    switch (confidence)
    {
    case ResolutionConfidence::Direct:         return "direct";
    case ResolutionConfidence::InferredOwner:  return "inferred_owner";
    case ResolutionConfidence::FocusedWindow:  return "focused_window";
    case ResolutionConfidence::ActiveFlag:     return "active_flag";
    case ResolutionConfidence::ActiveAccessor: return "active_accessor";
    case ResolutionConfidence::Unresolved:     return "unresolved";
    }
    return "unresolved";
}

} // namespace SlideBridge
