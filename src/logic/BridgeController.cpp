// =============================================================================
// SlideBridge - BridgeController
// Event handling, request handling and periodic checks for the worker.
//
// Announce rule: speak when the visible slide changes or its cached values
// change; a same-value observation is a no-op.
// =============================================================================

#include "slidebridge/logic/BridgeController.h"
#include "slidebridge/automation/AppSession.h"
#include "slidebridge/host/HostServices.h"
#include "slidebridge/logic/AnnouncementFormatter.h"
#include "slidebridge/mention/MentionParser.h"
#include "slidebridge/support/DebugLog.h"

#include <algorithm>
#include <set>

namespace SlideBridge
{

BridgeController::BridgeController(HostServices& host, SavedFileReader* reader, AccessibilityTree* tree)
    : host_(host)
    , reader_(reader)
    , resolution_(reader)
    , navigator_(tree)
{
    resolver_.setFocusedWindowProvider([this]() -> uintptr_t {
        uintptr_t focused = host_.currentFocus().windowHandle;
        if (focused == 0 && platformFocus_)
            focused = platformFocus_();
        return focused;
    });
    configure(settings_);
}

void BridgeController::configure(const SettingsSnapshot& settings)
{
    settings_ = settings;
    resolution_.configure(settings_);

    FocusNavigator::Options options;
    options.paneAutomationIds = settings_.commentsPaneAutomationIds;
    options.paneCommand = settings_.commentsPaneCommand;
    navigator_.setOptions(std::move(options));

    rebuildIdentities();
}

void BridgeController::setPlatformFocusProvider(std::function<uintptr_t()> provider)
{
    platformFocus_ = std::move(provider);
}

void BridgeController::rebuildIdentities()
{
    identities_.clear();
    std::vector<std::string> names = settings_.userIdentities;
    if (session_)
    {
        std::string officeName = session_->userDisplayName();
        if (!officeName.empty())
            names.push_back(std::move(officeName));
    }

    for (const auto& name : names)
    {
        for (auto& variant : MentionParser::identityVariants(name))
        {
            if (std::find(identities_.begin(), identities_.end(), variant) == identities_.end())
                identities_.push_back(std::move(variant));
        }
    }
}

// ─── Events ──────────────────────────────────────────────────────────────────

void BridgeController::registerHandlers(EventDispatcher& dispatcher)
{
    auto handler = [this](const AppEvent& event) { onEvent(event); };
    for (const auto& descriptor : kApplicationEvents)
        dispatcher.setHandler(descriptor.kind, handler);
}

// Runs inside the protocol callback: resolve and queue, nothing more.
void BridgeController::onEvent(const AppEvent& event)
{
    if (!session_)
        return;

    WindowResolution resolution = resolver_.resolve(event.payload.get(), *session_);
    std::optional<WindowKey> window = resolution.window;
    if (!window)
        window = currentWindow_; // best guess, already logged as ambiguous

    Pending work;
    switch (event.kind)
    {
    case AppEventKind::WindowSelectionChange:
    case AppEventKind::SlideShowBegin:     // first slide never gets a NextSlide event
    case AppEventKind::SlideShowNextSlide:
    case AppEventKind::SlideShowEnd:
        if (!window)
            return;
        work.kind = PendingKind::Observe;
        work.window = *window;
        break;
    case AppEventKind::PresentationSave:
        if (!window)
            return;
        work.kind = PendingKind::Saved;
        work.window = *window;
        break;
    case AppEventKind::PresentationClose:
        work.kind = PendingKind::Closed;
        if (event.payload)
            work.presentation = event.payload->presentation();
        if (work.presentation.empty() && window)
            work.presentation = window->presentation;
        if (work.presentation.empty())
            return;
        break;
    case AppEventKind::Count:
        return;
    }
    pending_.push_back(std::move(work));
}

void BridgeController::processPending(int64_t now)
{
    if (pending_.empty())
        return;
    lastEventTime_ = now;

    while (!pending_.empty())
    {
        Pending work = std::move(pending_.front());
        pending_.pop_front();
        if (!session_)
            continue;

        switch (work.kind)
        {
        case PendingKind::Observe:
            observeWindow(work.window, now, false);
            break;
        case PendingKind::Saved:
            resolution_.onSaved(work.window, now);
            break;
        case PendingKind::Closed:
            cache_.discardPresentation(work.presentation);
            resolution_.forget(work.presentation);
            if (currentWindow_ && currentWindow_->presentation == work.presentation)
            {
                currentWindow_.reset();
                currentSlide_ = 0;
                slideCount_ = 0;
            }
            break;
        }
    }
}

// ─── Observation ─────────────────────────────────────────────────────────────

bool BridgeController::observeWindow(const WindowKey& window, int64_t now, bool forceAnnounce)
{
    auto obs = session_->observe(window);
    if (!obs || obs->slideIndex <= 0)
    {
        logDebug("no slide visible in " + window.presentation);
        return false;
    }

    const bool slideChanged = !currentWindow_ || *currentWindow_ != window ||
                              currentSlide_ != obs->slideIndex;
    const bool known = cache_.get(window, obs->slideIndex).has_value();

    bool changed = cache_.update(window, obs->slideIndex, obs->commentCount, obs->notesPresent);
    cache_.setLastKnownSlide(window, obs->slideIndex);

    if (slideChanged || changed || !known)
    {
        changed |= cache_.storeComments(window, obs->slideIndex,
                                        session_->comments(window, obs->slideIndex));
    }

    resolution_.schedule(window, now);
    changed |= resolution_.applyTo(window, obs->slideIndex, *session_, cache_);

    currentWindow_ = window;
    currentSlide_ = obs->slideIndex;
    slideCount_ = obs->slideCount;

    if (slideChanged || changed || forceAnnounce)
        announceSlide(window, obs->slideIndex, slideChanged || forceAnnounce);
    return true;
}

void BridgeController::announceSlide(const WindowKey& window, int slideIndex, bool withMentions)
{
    auto snap = cache_.get(window, slideIndex);
    if (!snap)
        return;

    host_.announce(AnnouncementFormatter::slideChanged(*snap));

    BridgeResponse response;
    response.kind = ResponseKind::SlideChanged;
    response.slideIndex = slideIndex;
    response.snapshot = *snap;
    host_.post(std::move(response));

    if (withMentions && settings_.announceMentions)
        announceMentions(*snap);
}

void BridgeController::announceMentions(const SlideSnapshot& snapshot)
{
    if (identities_.empty() || snapshot.comments.empty())
        return;

    auto matches = MentionParser::findMentions(snapshot.comments, identities_,
                                               settings_.strongMatchThreshold,
                                               settings_.weakMatchThreshold);
    std::set<size_t> comments;
    for (const auto& m : matches)
    {
        // Weak matches are typo-tolerant guesses; not worth speech.
        if (m.tier >= ConfidenceTier::StrongFuzzy)
            comments.insert(m.commentIndex);
    }
    if (!comments.empty())
        host_.announce(AnnouncementFormatter::mentions(comments.size()));
}

void BridgeController::ensureNormalView(const WindowKey& window)
{
    if (!settings_.ensureNormalView)
        return;

    auto view = session_->viewType(window);
    if (!view || *view == ViewType::Normal)
        return;

    logDebug("switching view " + std::to_string(*view) + " to Normal");
    if (session_->setViewType(window, ViewType::Normal))
        host_.announce(AnnouncementFormatter::viewSwitched());
    else
        logWarning("could not switch to Normal view");
}

// ─── Session lifecycle ───────────────────────────────────────────────────────

void BridgeController::onAttached(AppSession& session, int64_t now)
{
    session_ = &session;
    cache_.clear();
    pending_.clear();
    currentWindow_.reset();
    currentSlide_ = 0;
    slideCount_ = 0;
    lastEventTime_ = now;
    lastProbeTime_ = now;
    rebuildIdentities();

    for (const auto& w : session.openWindows())
        cache_.noteWindow(w.key, w.active);

    WindowResolution seed = resolver_.resolve(nullptr, session);
    if (!seed.window)
        return; // no document open yet; the first event will observe

    ensureNormalView(*seed.window);
    observeWindow(*seed.window, now, true);
}

void BridgeController::onDetached()
{
    session_ = nullptr;
    pending_.clear();
    cache_.clear();
    currentWindow_.reset();
    currentSlide_ = 0;
    slideCount_ = 0;

    resolution_ = ResolutionStatusResolver(reader_);
    resolution_.configure(settings_);
}

// ─── Requests ────────────────────────────────────────────────────────────────

std::optional<WindowKey> BridgeController::targetWindow()
{
    if (currentWindow_)
        return currentWindow_;
    return resolver_.resolve(nullptr, *session_).window;
}

void BridgeController::postError(ErrorKind kind, const std::string& message)
{
    BridgeResponse response;
    response.kind = ResponseKind::Error;
    response.error = kind;
    response.message = message;
    host_.post(std::move(response));
}

void BridgeController::handleRequest(const BridgeRequest& request, int64_t now)
{
    if (request.kind == RequestKind::None)
        return;

    if (!session_)
    {
        // Attachment is retried silently; only an explicit action reports it.
        host_.announce(AnnouncementFormatter::notAttached());
        postError(ErrorKind::NotAttached, "presentation editor not running");
        return;
    }

    auto window = targetWindow();
    if (!window)
    {
        postError(ErrorKind::WindowAmbiguous, "no document window");
        return;
    }

    switch (request.kind)
    {
    case RequestKind::NavigateSlide:   navigate(*window, request.argument, now); break;
    case RequestKind::FocusComment:    focusComment(*window, request.argument); break;
    case RequestKind::RefreshStatus:   refreshStatus(*window, now); break;
    case RequestKind::ReadNotes:       readNotes(*window); break;
    case RequestKind::ReannounceSlide:
        ensureNormalView(*window);
        observeWindow(*window, now, true);
        break;
    case RequestKind::ReadComments:    readComments(*window, now); break;
    case RequestKind::None:            break;
    }
}

void BridgeController::navigate(const WindowKey& window, int direction, int64_t now)
{
    if (!currentWindow_ || *currentWindow_ != window || currentSlide_ <= 0)
        observeWindow(window, now, false);
    if (currentSlide_ <= 0)
        return;

    // Zero carries no direction; speak the current slide without moving.
    if (direction == 0)
    {
        announceSlide(window, currentSlide_, false);
        return;
    }

    const int step = direction < 0 ? -1 : 1;
    const int target = std::clamp(currentSlide_ + step, 1, std::max(slideCount_, 1));
    if (target == currentSlide_)
    {
        announceSlide(window, currentSlide_, false);
        return;
    }

    if (!session_->goToSlide(window, target))
    {
        logWarning("navigation to slide " + std::to_string(target) + " failed");
        return;
    }
    observeWindow(window, now, true);
}

void BridgeController::focusComment(const WindowKey& window, int ordinal)
{
    FocusStatus status = FocusStatus::NotFound;

    auto snap = currentSlide_ > 0 ? cache_.get(window, currentSlide_) : std::nullopt;
    const bool inRange = ordinal >= 1 && (!snap || ordinal <= snap->commentCount);
    if (inRange)
        status = navigator_.focusComment(*session_, window, ordinal);

    BridgeResponse response;
    response.kind = ResponseKind::FocusResult;
    response.slideIndex = currentSlide_;
    response.focus = status;
    host_.post(std::move(response));

    if (status != FocusStatus::Success)
    {
        const std::string message = AnnouncementFormatter::focusFailure(status, ordinal);
        host_.announce(message);
        postError(ErrorKind::FocusNotFound, message);
    }
}

void BridgeController::refreshStatus(const WindowKey& window, int64_t now)
{
    resolution_.requestRefresh(window, now);
    resolution_.runDue(now, *session_, cache_);
    // The slide line carries the caveat when the read did not produce fresh data.
    observeWindow(window, now, true);
}

void BridgeController::readNotes(const WindowKey& window)
{
    if (currentSlide_ <= 0)
        return;
    host_.announce(AnnouncementFormatter::notes(currentSlide_, session_->notesText(window, currentSlide_)));
}

void BridgeController::readComments(const WindowKey& window, int64_t now)
{
    if (!observeWindow(window, now, false))
        return;

    // Texts may have been edited without a count change.
    cache_.storeComments(window, currentSlide_, session_->comments(window, currentSlide_));
    resolution_.applyTo(window, currentSlide_, *session_, cache_);

    if (auto snap = cache_.get(window, currentSlide_))
    {
        for (const auto& line : AnnouncementFormatter::commentsReadout(*snap))
            host_.announce(line);
    }
}

// ─── Periodic checks ─────────────────────────────────────────────────────────

BridgeController::TickResult BridgeController::tick(int64_t now)
{
    if (!session_)
        return TickResult::Ok;

    if (now - lastProbeTime_ >= settings_.livenessProbeMs)
    {
        lastProbeTime_ = now;
        if (!session_->ping())
        {
            logWarning(std::string("liveness probe failed: ") + toString(ErrorKind::NotAttached));
            return TickResult::SessionLost;
        }
    }

    if (now - lastEventTime_ >= settings_.subscriptionStaleMs)
    {
        lastEventTime_ = now;
        if (currentWindow_)
        {
            auto obs = session_->observe(*currentWindow_);
            if (obs && obs->slideIndex > 0 && obs->slideIndex != currentSlide_)
            {
                logWarning("slide changed without events: " + std::string(toString(ErrorKind::SubscriptionLost)));
                return TickResult::SubscriptionLost;
            }
        }
    }

    for (const auto& key : resolution_.runDue(now, *session_, cache_))
    {
        // Silent update for the visible slide; speech only on request.
        if (currentWindow_ && key.first == *currentWindow_ && key.second == currentSlide_)
        {
            if (auto snap = cache_.get(key.first, key.second))
            {
                BridgeResponse response;
                response.kind = ResponseKind::SlideChanged;
                response.slideIndex = key.second;
                response.snapshot = *snap;
                host_.post(std::move(response));
            }
        }
    }
    return TickResult::Ok;
}

const char* toString(BridgeController::TickResult result)
{
    switch (result)
    {
    case BridgeController::TickResult::Ok:               return "ok";
    case BridgeController::TickResult::SessionLost:      return "session_lost";
    case BridgeController::TickResult::SubscriptionLost: return "subscription_lost";
    }
    return "ok";
}

} // namespace SlideBridge
