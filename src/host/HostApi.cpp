// =============================================================================
// SlideBridge - Host C ABI
// Thin adapter over one process-wide BridgeHost. Nothing may throw across
// the boundary.
// =============================================================================

#include "slidebridge/host/HostApi.h"
#include "slidebridge/host/BridgeHost.h"
#include "slidebridge/host/HostServices.h"
#include "slidebridge/support/DebugLog.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <memory>

namespace
{

std::unique_ptr<SlideBridge::BridgeHost> g_bridge;

} // namespace

using namespace SlideBridge;

extern "C" {

int sbStart(const char* configPath)
{
    try
    {
        if (g_bridge && g_bridge->isRunning())
            return 1;
        g_bridge = std::make_unique<BridgeHost>();
        if (g_bridge->start(configPath ? std::string(configPath) : std::string()))
            return 1;
        g_bridge.reset();
    }
    catch (const std::exception& e)
    {
        logError(std::string("sbStart failed: ") + e.what());
        g_bridge.reset();
    }
    return 0;
}

int sbStop(void)
{
    if (!g_bridge)
        return 1;
    bool clean = g_bridge->stop();
    g_bridge.reset();
    return clean ? 1 : 0;
}

int sbSubmit(int32_t request, int32_t argument)
{
    if (!g_bridge || request < SB_NAVIGATE_SLIDE || request > SB_READ_COMMENTS)
        return 0;

    BridgeRequest r;
    r.kind = static_cast<RequestKind>(request);
    r.argument = argument;
    return g_bridge->submit(r) ? 1 : 0;
}

int sbPollAnnouncement(char* buffer, int32_t bufferSize)
{
    if (!g_bridge || !buffer || bufferSize <= 0)
        return 0;

    auto text = g_bridge->host().pollAnnouncement();
    if (!text)
        return 0;

    const size_t copied = std::min(text->size(), static_cast<size_t>(bufferSize - 1));
    std::memcpy(buffer, text->data(), copied);
    buffer[copied] = '\0';
    return static_cast<int>(text->size());
}

int sbPollResponse(SbResponse* out)
{
    if (!g_bridge || !out)
        return 0;

    auto response = g_bridge->host().pollResponse();
    if (!response)
        return 0;

    const SlideSnapshot& snap = response->snapshot;
    out->kind = static_cast<int32_t>(response->kind);
    out->slideIndex = response->slideIndex;
    out->commentCount = snap.commentCount;
    out->notesPresent = snap.notesPresent ? 1 : 0;
    out->active = snap.resolution.active;
    out->resolved = snap.resolution.resolved;
    out->unknown = snap.resolution.unknown;
    out->freshness = static_cast<int32_t>(snap.freshness);
    out->focusStatus = static_cast<int32_t>(response->focus);
    out->error = static_cast<int32_t>(response->error);
    return 1;
}

void sbSetFocusWindow(uintptr_t hwnd)
{
    if (g_bridge)
        g_bridge->host().setFocusWindow(hwnd);
}

int sbIsAttached(void)
{
    return g_bridge && g_bridge->isAttached() ? 1 : 0;
}

} // extern "C"
