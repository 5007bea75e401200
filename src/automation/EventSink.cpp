// =============================================================================
// SlideBridge - EventSink
// Event-kind dispatch table. Runs on the worker thread, synchronously inside
// the protocol callback, so handlers must stay cheap.
// =============================================================================

#include "slidebridge/automation/EventSink.h"
#include "slidebridge/support/DebugLog.h"

#include <exception>
#include <string>

namespace SlideBridge
{

void EventDispatcher::setHandler(AppEventKind kind, Handler handler)
{
    const size_t slot = static_cast<size_t>(kind);
    if (slot < handlers_.size())
        handlers_[slot] = std::move(handler);
}

void EventDispatcher::clearHandlers()
{
    for (auto& h : handlers_)
        h = nullptr;
}

bool EventDispatcher::dispatch(const AppEvent& event) noexcept
{
    const size_t slot = static_cast<size_t>(event.kind);
    if (slot >= handlers_.size() || !handlers_[slot])
        return false;

    try
    {
        handlers_[slot](event);
        ++delivered_;
        return true;
    }
    catch (const std::exception& e)
    {
        ++failed_;
        logError(std::string("event handler for ") + describe(event.kind).name +
                 " failed: " + e.what());
    }
    catch (...)
    {
        ++failed_;
        logError(std::string("event handler for ") + describe(event.kind).name +
                 " failed with a non-standard exception");
    }
    return false;
}

bool EventDispatcher::dispatchById(int32_t dispId, std::shared_ptr<const EventPayload> payload) noexcept
{
    auto kind = eventKindFromDispId(dispId);
    if (!kind)
        return false; // not a declared event

    AppEvent event;
    event.kind = *kind;
    event.payload = std::move(payload);
    return dispatch(event);
}

} // namespace SlideBridge
