#pragma once
// =============================================================================
// SlideBridge - EventSink
// Tagged dispatch table keyed by event kind. The wire-level callback (COM
// IDispatch::Invoke in ComEventSink) translates its arguments into an AppEvent
// and hands it here; internal handlers never see the wire shape.
//
// dispatch() never throws: a failure escaping into the protocol's dispatch
// machinery can silently disable all future event delivery.
// =============================================================================

#include "slidebridge/automation/InterfaceDescriptor.h"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>

namespace SlideBridge
{

class EventPayload;

struct AppEvent
{
    AppEventKind kind = AppEventKind::WindowSelectionChange;
    std::shared_ptr<const EventPayload> payload;  // may be null
};

class EventDispatcher
{
public:
    using Handler = std::function<void(const AppEvent&)>;

    void setHandler(AppEventKind kind, Handler handler);
    void clearHandlers();

    // Returns false when no handler is registered or the handler failed.
    // Failures are logged, never propagated.
    bool dispatch(const AppEvent& event) noexcept;

    // Wire-level entry: unknown dispatch ids are ignored.
    bool dispatchById(int32_t dispId, std::shared_ptr<const EventPayload> payload) noexcept;

    uint64_t deliveredCount() const { return delivered_; }
    uint64_t failedCount() const { return failed_; }

private:
    std::array<Handler, kAppEventKindCount> handlers_{};
    uint64_t delivered_ = 0;
    uint64_t failed_ = 0;
};

} // namespace SlideBridge
