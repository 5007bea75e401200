#pragma once
// =============================================================================
// SlideBridge - Bridge Channels
// All cross-thread data in one place. The host thread writes requests and
// settings; the worker thread reads them and publishes a few status atomics.
// Worker-owned state (the slide cache) is never reachable from here.
// =============================================================================

#include "slidebridge/common/Types.h"
#include "slidebridge/common/LockFreeQueue.h"
#include "slidebridge/support/SettingsManager.h"
#include <atomic>
#include <memory>

namespace SlideBridge
{

struct BridgeChannels
{
    // -- Request queue: host thread → worker thread --
    LockFreeQueue<BridgeRequest> requestQueue;

    // -- Written by worker thread, read by host --
    std::atomic<bool>    attached{false};
    std::atomic<int64_t> lastEventTime{0};
    std::atomic<uint64_t> reattachCount{0};

    // -- Settings snapshot: written by host thread, read by worker --
    // Worker checks settingsVersion (one atomic int) per cycle.
    // Only does the heavier shared_ptr atomic_load when version changes.
    std::shared_ptr<const SettingsSnapshot> settingsSnapshot;
    std::atomic<uint64_t> settingsVersion{0};
};

// SettingsManager observer: publishes a new snapshot for the worker.
void publishSettings(const SettingsSnapshot& settings, void* channels);

} // namespace SlideBridge
