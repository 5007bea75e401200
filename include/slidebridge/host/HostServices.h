#pragma once
// =============================================================================
// SlideBridge - HostServices
// What the bridge consumes from the screen-reading host. The worker calls
// these from its own thread; implementations must be thread-safe and must
// never block on the host's speech pipeline.
// =============================================================================

#include "slidebridge/common/LockFreeQueue.h"
#include "slidebridge/common/Types.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace SlideBridge
{

// Read-only snapshot of the host's focus object, used for window
// disambiguation only.
struct HostFocus
{
    uintptr_t windowHandle = 0;
};

class HostServices
{
public:
    virtual ~HostServices() = default;

    // Fire-and-forget, queued for speech.
    virtual void announce(const std::string& text) = 0;

    virtual HostFocus currentFocus() = 0;

    // Response channel (slide_changed, focus_result, error).
    virtual void post(BridgeResponse response) = 0;
};

// Default host adapter: queues everything for a host that polls from its own
// thread (the C ABI and the console harness use this).
// Producer: worker thread. Consumer: host thread.
class QueuedHost : public HostServices
{
public:
    void announce(const std::string& text) override;
    HostFocus currentFocus() override;
    void post(BridgeResponse response) override;

    // Host thread
    std::optional<std::string> pollAnnouncement();
    std::optional<BridgeResponse> pollResponse();
    void setFocusWindow(uintptr_t hwnd);

    // Items dropped because the host stopped draining.
    uint64_t droppedCount() const;

private:
    LockFreeQueue<std::string, 128> announcements_;
    LockFreeQueue<BridgeResponse, 64> responses_;
    std::atomic<uintptr_t> focusWindow_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace SlideBridge
