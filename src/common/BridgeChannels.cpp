// =============================================================================
// SlideBridge - Bridge Channels
// Settings hand-off from the host thread to the worker.
// =============================================================================

#include "slidebridge/common/BridgeChannels.h"

namespace SlideBridge
{

// Runs on host thread. Worker detects via settingsVersion atomic.
void publishSettings(const SettingsSnapshot& settings, void* channels)
{
    auto* ch = static_cast<BridgeChannels*>(channels);
    auto snap = std::make_shared<const SettingsSnapshot>(settings);
    std::atomic_store(&ch->settingsSnapshot, snap);
    ch->settingsVersion.fetch_add(1, std::memory_order_release);
}

} // namespace SlideBridge
