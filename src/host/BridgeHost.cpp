// =============================================================================
// SlideBridge - BridgeHost
// =============================================================================

#include "slidebridge/host/BridgeHost.h"
#include "slidebridge/automation/AutomationWorker.h"
#include "slidebridge/automation/ComAppSession.h"
#include "slidebridge/automation/MessagePump.h"
#include "slidebridge/common/BridgeChannels.h"
#include "slidebridge/host/HostServices.h"
#include "slidebridge/navigation/AccessibilityTree.h"
#include "slidebridge/resolution/SavedFileReader.h"
#include "slidebridge/support/DebugLog.h"

namespace SlideBridge
{

BridgeHost::BridgeHost()
    : channels_(std::make_shared<BridgeChannels>())
    , host_(std::make_shared<QueuedHost>())
    , worker_(std::make_unique<AutomationWorker>())
{
    settings_.addObserver(publishSettings, channels_.get());
}

BridgeHost::~BridgeHost()
{
    stop();
}

bool BridgeHost::start(const std::string& configPath, std::shared_ptr<AutomationConnector> connector)
{
    if (worker_->isRunning())
        return true;

    std::string path = configPath.empty() ? SettingsManager::getDefaultConfigPath() : configPath;
    if (!path.empty() && !settings_.loadFromFile(path.c_str()))
        logDebug("no usable config at " + path + ", using defaults");

    // Publish even when nothing was loaded so the worker starts configured.
    publishSettings(*settings_.snapshot(), channels_.get());

    AutomationWorker::Dependencies deps;
    deps.connector = connector ? std::move(connector) : createComConnector();
    deps.host = host_;
    deps.fileReader = createPlatformFileReader();
    deps.treeFactory = []() { return createPlatformAccessibilityTree(); };
    deps.pump = createPlatformPump();
    deps.foregroundWindow = platformForegroundWindow;
    return worker_->start(channels_, std::move(deps));
}

bool BridgeHost::stop()
{
    if (!worker_->isRunning())
        return true;
    return worker_->stop(settings_.snapshot()->shutdownTimeoutMs);
}

bool BridgeHost::submit(const BridgeRequest& request)
{
    return worker_->submit(request);
}

bool BridgeHost::isRunning() const
{
    return worker_->isRunning();
}

bool BridgeHost::isAttached() const
{
    return channels_->attached.load(std::memory_order_acquire);
}

} // namespace SlideBridge
