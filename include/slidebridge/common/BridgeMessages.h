#pragma once
// =============================================================================
// SlideBridge - Worker Thread Messages
// Thread messages posted to the automation worker's apartment thread.
// Win32 only.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

namespace SlideBridge
{

// Wakes the bounded message-pump wait so queued requests are drained promptly.
static constexpr UINT WM_BRIDGE_WAKE = WM_APP + 1;

// Asks the worker loop to exit (posted during shutdown).
static constexpr UINT WM_BRIDGE_STOP = WM_APP + 2;

} // namespace SlideBridge
