#pragma once
// =============================================================================
// SlideBridge - ComAppSession
// Platform entry points for the automation layer. On Windows the connector
// attaches to the running application through the running-object table and
// advises a ComEventSink; elsewhere it never attaches.
// =============================================================================

#include "slidebridge/automation/AppSession.h"

#include <cstdint>
#include <memory>

namespace SlideBridge
{

std::shared_ptr<AutomationConnector> createComConnector();

// Foreground top-level window, 0 when unavailable.
uintptr_t platformForegroundWindow();

} // namespace SlideBridge
