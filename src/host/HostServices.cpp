// =============================================================================
// SlideBridge - QueuedHost
// Lock-free hand-off of announcements and responses to a polling host.
// =============================================================================

#include "slidebridge/host/HostServices.h"
#include "slidebridge/support/DebugLog.h"

namespace SlideBridge
{

void QueuedHost::announce(const std::string& text)
{
    if (text.empty())
        return;
    if (!announcements_.push(text))
    {
        // Log on the first drop only; the host is not draining.
        if (dropped_.fetch_add(1, std::memory_order_relaxed) == 0)
            logWarning("announcement queue full, dropping speech");
    }
}

HostFocus QueuedHost::currentFocus()
{
    HostFocus focus;
    focus.windowHandle = focusWindow_.load(std::memory_order_acquire);
    return focus;
}

void QueuedHost::post(BridgeResponse response)
{
    if (!responses_.push(std::move(response)))
    {
        if (dropped_.fetch_add(1, std::memory_order_relaxed) == 0)
            logWarning("response queue full, dropping response");
    }
}

std::optional<std::string> QueuedHost::pollAnnouncement()
{
    return announcements_.pop();
}

std::optional<BridgeResponse> QueuedHost::pollResponse()
{
    return responses_.pop();
}

void QueuedHost::setFocusWindow(uintptr_t hwnd)
{
    focusWindow_.store(hwnd, std::memory_order_release);
}

uint64_t QueuedHost::droppedCount() const
{
    return dropped_.load(std::memory_order_relaxed);
}

} // namespace SlideBridge
