#pragma once
// =============================================================================
// SlideBridge - AutomationWorker
// Dedicated apartment thread: the only code that calls into the automation
// protocol. Each cycle:
//   1. pump messages with a bounded wait (event callbacks run here)
//   2. process queued events, then drain host requests
//   3. attach if unattached (retried every cycle, never blocks the host)
//   4. liveness / staleness checks and due resolution-status reads
//
// The host talks to it only through submit() and the HostServices queues.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace SlideBridge
{

struct BridgeChannels;
class AccessibilityTree;
class AutomationConnector;
class HostServices;
class MessagePump;
class SavedFileReader;

class AutomationWorker
{
public:
    struct Dependencies
    {
        std::shared_ptr<AutomationConnector> connector;
        std::shared_ptr<HostServices> host;
        std::unique_ptr<SavedFileReader> fileReader;                      // may be null
        std::function<std::unique_ptr<AccessibilityTree>()> treeFactory;  // runs on the worker
        std::unique_ptr<MessagePump> pump;
        std::function<uintptr_t()> foregroundWindow;                      // may be empty
    };

    // Stops with the configured shutdownTimeoutMs.
    ~AutomationWorker();

    // Starts the thread and waits for it to enter its apartment. Returns
    // false when the apartment could not be entered.
    bool start(std::shared_ptr<BridgeChannels> channels, Dependencies deps);

    // Host thread (single producer). Never blocks. False when the request
    // queue is full.
    bool submit(const BridgeRequest& request);

    // Signals the worker and waits up to timeoutMs for it to release the
    // subscription and leave its apartment. On timeout the thread is detached
    // and finishes on its own; returns false.
    bool stop(int timeoutMs);

    bool isRunning() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

} // namespace SlideBridge
