#pragma once
// =============================================================================
// SlideBridge - BridgeHost
// Component wiring and lifecycle for one bridge instance: settings, channels,
// the queued host adapter and the automation worker. Host thread only.
// Used by the C ABI and the console harness.
// =============================================================================

#include "slidebridge/common/Types.h"
#include "slidebridge/support/SettingsManager.h"

#include <memory>
#include <string>

namespace SlideBridge
{

struct BridgeChannels;
class AutomationConnector;
class AutomationWorker;
class QueuedHost;

class BridgeHost
{
public:
    BridgeHost();
    ~BridgeHost();

    BridgeHost(const BridgeHost&) = delete;
    BridgeHost& operator=(const BridgeHost&) = delete;

    // Loads settings (empty path = default location; a missing file keeps
    // defaults) and starts the worker. A null connector uses the platform's.
    bool start(const std::string& configPath = std::string(),
               std::shared_ptr<AutomationConnector> connector = nullptr);

    // Stops within the configured shutdown timeout. Safe to call twice.
    bool stop();

    bool submit(const BridgeRequest& request);

    bool isRunning() const;
    bool isAttached() const;

    QueuedHost& host() { return *host_; }
    SettingsManager& settings() { return settings_; }

private:
    SettingsManager settings_;
    std::shared_ptr<BridgeChannels> channels_;
    std::shared_ptr<QueuedHost> host_;
    std::unique_ptr<AutomationWorker> worker_;
};

} // namespace SlideBridge
