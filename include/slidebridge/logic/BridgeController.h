#pragma once
// =============================================================================
// SlideBridge - BridgeController
// Worker-thread logic: turns application events and host requests into
// cache updates, announcements and responses. Owns the StateCache; nothing
// here is touched from any other thread.
//
// Event handlers only resolve the originating window and queue the work;
// processPending() performs the remote calls, strictly in delivery order.
// =============================================================================

#include "slidebridge/automation/EventSink.h"
#include "slidebridge/logic/StateCache.h"
#include "slidebridge/logic/WindowResolver.h"
#include "slidebridge/navigation/FocusNavigator.h"
#include "slidebridge/resolution/ResolutionStatusResolver.h"
#include "slidebridge/support/SettingsManager.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace SlideBridge
{

class AppSession;
class HostServices;
class AccessibilityTree;
class SavedFileReader;

class BridgeController
{
public:
    enum class TickResult
    {
        Ok,
        SessionLost,       // liveness probe failed
        SubscriptionLost,  // events stopped while the slide kept changing
    };

    // reader and tree may be null; neither is owned.
    BridgeController(HostServices& host, SavedFileReader* reader, AccessibilityTree* tree);

    void configure(const SettingsSnapshot& settings);

    // Installs one handler per consumed event kind.
    void registerHandlers(EventDispatcher& dispatcher);

    // Consulted when the host has no focus window to offer.
    void setPlatformFocusProvider(std::function<uintptr_t()> provider);

    // ── Session lifecycle ──
    // Seeds the first observation: the event stream never reports the slide
    // that is showing when the subscription starts.
    void onAttached(AppSession& session, int64_t now);
    void onDetached();
    bool attached() const { return session_ != nullptr; }

    // ── Per-cycle work ──
    void processPending(int64_t now);
    void handleRequest(const BridgeRequest& request, int64_t now);
    TickResult tick(int64_t now);

    // ── Inspection (worker thread / tests) ──
    const StateCache& cache() const { return cache_; }
    std::optional<WindowKey> currentWindow() const { return currentWindow_; }
    int currentSlide() const { return currentSlide_; }
    size_t pendingCount() const { return pending_.size(); }
    int64_t lastEventTime() const { return lastEventTime_; }

private:
    enum class PendingKind
    {
        Observe,
        Saved,
        Closed,
    };

    struct Pending
    {
        PendingKind kind = PendingKind::Observe;
        WindowKey window;
        std::string presentation;
    };

    void onEvent(const AppEvent& event);
    std::optional<WindowKey> targetWindow();

    bool observeWindow(const WindowKey& window, int64_t now, bool forceAnnounce);
    void announceSlide(const WindowKey& window, int slideIndex, bool withMentions);
    void announceMentions(const SlideSnapshot& snapshot);
    void ensureNormalView(const WindowKey& window);
    void rebuildIdentities();

    void navigate(const WindowKey& window, int direction, int64_t now);
    void focusComment(const WindowKey& window, int ordinal);
    void refreshStatus(const WindowKey& window, int64_t now);
    void readNotes(const WindowKey& window);
    void readComments(const WindowKey& window, int64_t now);
    void postError(ErrorKind kind, const std::string& message);

    HostServices& host_;
    SavedFileReader* reader_;
    AppSession* session_ = nullptr;

    SettingsSnapshot settings_;
    StateCache cache_;
    WindowResolver resolver_;
    ResolutionStatusResolver resolution_;
    FocusNavigator navigator_;
    std::function<uintptr_t()> platformFocus_;

    std::deque<Pending> pending_;
    std::optional<WindowKey> currentWindow_;
    int currentSlide_ = 0;
    int slideCount_ = 0;
    std::vector<std::string> identities_;

    int64_t lastEventTime_ = 0;
    int64_t lastProbeTime_ = 0;
};

const char* toString(BridgeController::TickResult result);

} // namespace SlideBridge
