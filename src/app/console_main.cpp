// =============================================================================
// SlideBridge - Console Harness
// Runs the bridge against the live application and prints what a
// screen-reading host would speak.
//
// Controls:
//   n / p   next / previous slide
//   1..9    focus comment by ordinal
//   r       refresh resolution status
//   o       read speaker notes
//   c       read all comments
//   a       re-announce current slide
//   q       quit
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>
#include <conio.h>

#include "slidebridge/host/BridgeHost.h"
#include "slidebridge/host/HostServices.h"

#include <cstdio>
#include <string>

using namespace SlideBridge;

static const char* responseName(ResponseKind kind)
{
    switch (kind)
    {
    case ResponseKind::SlideChanged: return "slide_changed";
    case ResponseKind::FocusResult:  return "focus_result";
    case ResponseKind::Error:        return "error";
    }
    return "?";
}

static void drain(BridgeHost& bridge)
{
    while (auto text = bridge.host().pollAnnouncement())
        std::printf("  > %s\n", text->c_str());

    while (auto response = bridge.host().pollResponse())
    {
        switch (response->kind)
        {
        case ResponseKind::SlideChanged:
            std::printf("  [%s] slide %d, %d comments, %d resolved (%s)\n", responseName(response->kind),
                        response->slideIndex, response->snapshot.commentCount,
                        response->snapshot.resolution.resolved, toString(response->snapshot.freshness));
            break;
        case ResponseKind::FocusResult:
            std::printf("  [%s] %s\n", responseName(response->kind), toString(response->focus));
            break;
        case ResponseKind::Error:
            std::printf("  [%s] %s\n", responseName(response->kind), toString(response->error));
            break;
        }
    }
}

static bool requestFor(int key, BridgeRequest& out)
{
    out = BridgeRequest();
    switch (key)
    {
    case 'n': out.kind = RequestKind::NavigateSlide; out.argument = 1; return true;
    case 'p': out.kind = RequestKind::NavigateSlide; out.argument = -1; return true;
    case 'r': out.kind = RequestKind::RefreshStatus; return true;
    case 'o': out.kind = RequestKind::ReadNotes; return true;
    case 'c': out.kind = RequestKind::ReadComments; return true;
    case 'a': out.kind = RequestKind::ReannounceSlide; return true;
    default: break;
    }
    if (key >= '1' && key <= '9')
    {
        out.kind = RequestKind::FocusComment;
        out.argument = key - '0';
        return true;
    }
    return false;
}

int main(int argc, char** argv)
{
    BridgeHost bridge;
    if (!bridge.start(argc > 1 ? argv[1] : std::string()))
    {
        std::fprintf(stderr, "SlideBridge: worker failed to start\n");
        return 1;
    }

    std::printf("SlideBridge console. n/p navigate, 1-9 focus comment, r o c a, q quits.\n");

    bool wasAttached = false;
    for (;;)
    {
        bool attached = bridge.isAttached();
        if (attached != wasAttached)
        {
            std::printf(attached ? "-- attached\n" : "-- waiting for presentation editor\n");
            wasAttached = attached;
        }

        if (_kbhit())
        {
            int key = _getch();
            if (key == 'q')
                break;
            BridgeRequest request;
            if (requestFor(key, request) && !bridge.submit(request))
                std::printf("  request rejected\n");
        }

        drain(bridge);
        Sleep(30);
    }

    bool clean = bridge.stop();
    drain(bridge);
    return clean ? 0 : 2;
}
