#pragma once
// =============================================================================
// SlideBridge - AppSession
// The attached application as the worker sees it. Every method is a remote
// call and must only be used on the worker thread that attached it.
//
// The COM implementation lives in ComAppSession.cpp; unit tests substitute a
// scripted double.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SlideBridge
{

class EventDispatcher;

// One observation of a window's visible slide.
struct SlideObservation
{
    int  slideIndex = 0;     // 1-based
    int  slideCount = 0;
    int  commentCount = 0;
    bool notesPresent = false;
    bool inSlideShow = false;
};

// The argument delivered with an application event. Valid only for the
// duration of the dispatch.
class EventPayload
{
public:
    virtual ~EventPayload() = default;

    // The document window the payload itself reports as its owner. This is
    // the only answer immune to the application's lagging active-window
    // accessor. Empty when the payload cannot say.
    virtual std::optional<WindowKey> owningWindow() const = 0;

    // True when the payload only names a presentation with several windows
    // and owningWindow() picked one of them.
    virtual bool ownerInferred() const { return false; }

    // Presentation identity (full path or title), empty when unavailable.
    virtual std::string presentation() const = 0;
};

class AppSession
{
public:
    virtual ~AppSession() = default;

    // Cheap liveness probe. False means the application went away.
    virtual bool ping() = 0;

    virtual std::vector<DocumentWindowHandle> openWindows() = 0;

    // The application's own "active window" accessor. May lag behind the
    // real event source during rapid window switching.
    virtual std::optional<WindowKey> activeWindow() = 0;

    virtual std::optional<SlideObservation> observe(const WindowKey& window) = 0;
    virtual std::vector<CommentRecord> comments(const WindowKey& window, int slideIndex) = 0;
    virtual std::optional<std::string> notesText(const WindowKey& window, int slideIndex) = 0;
    virtual bool goToSlide(const WindowKey& window, int slideIndex) = 0;

    virtual std::optional<int> viewType(const WindowKey& window) = 0;
    virtual bool setViewType(const WindowKey& window, int viewType) = 0;

    // Saved file path; empty when the presentation was never saved.
    virtual std::optional<std::string> savedPath(const WindowKey& window) = 0;
    virtual std::optional<bool> hasUnsavedChanges(const WindowKey& window) = 0;

    // Ribbon command toggle-state query and execution.
    virtual std::optional<bool> isCommandPressed(const std::string& commandId) = 0;
    virtual bool executeCommand(const std::string& commandId) = 0;

    // Office user display name, empty when not configured.
    virtual std::string userDisplayName() = 0;

    // Ends event delivery. Called exactly once, on the worker thread, before
    // the session is destroyed. No other method is called afterwards.
    virtual void releaseSubscription() = 0;
};

class AutomationConnector
{
public:
    virtual ~AutomationConnector() = default;

    // Locates the running application, registers an event sink that forwards
    // to dispatcher, and returns the live session. nullptr when the
    // application is not running or registration failed. Never blocks long.
    virtual std::unique_ptr<AppSession> attach(EventDispatcher& dispatcher) = 0;
};

} // namespace SlideBridge
