// =============================================================================
// SlideBridge - AutomationWorker
// Worker thread lifecycle and the per-cycle loop.
//
// Nothing may escape a cycle: a dead worker silences the whole bridge. Each
// cycle body is guarded, failures are logged, and the loop continues.
// =============================================================================

#include "slidebridge/automation/AutomationWorker.h"
#include "slidebridge/automation/AppSession.h"
#include "slidebridge/automation/EventSink.h"
#include "slidebridge/automation/MessagePump.h"
#include "slidebridge/common/BridgeChannels.h"
#include "slidebridge/host/HostServices.h"
#include "slidebridge/logic/BridgeController.h"
#include "slidebridge/navigation/AccessibilityTree.h"
#include "slidebridge/resolution/SavedFileReader.h"
#include "slidebridge/support/DebugLog.h"

#include <chrono>
#include <exception>
#include <thread>

namespace SlideBridge
{

// Get current time in milliseconds (monotonic)
static int64_t currentTimeMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// ─── AutomationWorker::Impl ──────────────────────────────────────────────────

struct AutomationWorker::Impl
{
    std::shared_ptr<BridgeChannels> channels;
    Dependencies deps;

    std::thread thread;
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> started{false};
    std::atomic<bool> startFailed{false};
    std::atomic<bool> finished{false};
    std::atomic<int> shutdownTimeoutMs{3000};  // bound used by the destructor

    // Worker thread only
    std::unique_ptr<AppSession> session;
    uint64_t settingsVersion = 0;
    bool settingsApplied = false;
    int pumpWaitMs = 50;
    bool lastAttachFailed = false;

    void threadMain();
    void cycle(BridgeController& controller, EventDispatcher& dispatcher);
    void applySettings(BridgeController& controller);
    void attach(BridgeController& controller, EventDispatcher& dispatcher, int64_t now);
    void dropSession(BridgeController& controller);
};

void AutomationWorker::Impl::threadMain()
{
    if (!deps.pump->enterApartment())
    {
        startFailed.store(true, std::memory_order_release);
        started.store(true, std::memory_order_release);
        finished.store(true, std::memory_order_release);
        return;
    }
    started.store(true, std::memory_order_release);

    {
        // Everything created here belongs to the apartment and is destroyed
        // before leaving it.
        std::unique_ptr<AccessibilityTree> tree = deps.treeFactory ? deps.treeFactory() : nullptr;
        BridgeController controller(*deps.host, deps.fileReader.get(), tree.get());
        controller.setPlatformFocusProvider(deps.foregroundWindow);
        EventDispatcher dispatcher;
        controller.registerHandlers(dispatcher);
        applySettings(controller);

        while (!stopRequested.load(std::memory_order_acquire))
        {
            try
            {
                cycle(controller, dispatcher);
            }
            catch (const std::exception& e)
            {
                logError(std::string("worker cycle failed: ") + e.what());
            }
            catch (...)
            {
                logError("worker cycle failed with a non-standard exception");
            }
        }

        // Release the subscription explicitly, on this thread, exactly once.
        if (session)
            dropSession(controller);
        dispatcher.clearHandlers();
    }

    deps.pump->leaveApartment();
    channels->attached.store(false, std::memory_order_release);
    finished.store(true, std::memory_order_release);
}

void AutomationWorker::Impl::applySettings(BridgeController& controller)
{
    uint64_t v = channels->settingsVersion.load(std::memory_order_acquire);
    if (settingsApplied && v == settingsVersion)
        return;
    settingsVersion = v;
    settingsApplied = true;

    auto snap = std::atomic_load(&channels->settingsSnapshot);
    if (!snap)
        return;

    controller.configure(*snap);
    pumpWaitMs = snap->pumpWaitMs;
    shutdownTimeoutMs.store(snap->shutdownTimeoutMs, std::memory_order_release);
    setMinimumLogLevel(static_cast<LogLevel>(snap->logLevel));
}

void AutomationWorker::Impl::cycle(BridgeController& controller, EventDispatcher& dispatcher)
{
    // 1. Bounded wait; event callbacks are dispatched in here.
    deps.pump->waitAndDispatch(pumpWaitMs);
    if (stopRequested.load(std::memory_order_acquire))
        return;

    const int64_t now = currentTimeMs();
    applySettings(controller);

    // 2. Events first (delivery order), then host requests.
    const bool hadEvents = controller.pendingCount() > 0;
    controller.processPending(now);
    if (hadEvents)
        channels->lastEventTime.store(now, std::memory_order_release);

    while (auto request = channels->requestQueue.pop())
        controller.handleRequest(*request, now);

    // 3. Attach while unattached.
    if (!session)
    {
        attach(controller, dispatcher, now);
        return;
    }

    // 4. Liveness, staleness, scheduled status reads.
    BridgeController::TickResult result = controller.tick(now);
    if (result == BridgeController::TickResult::Ok)
        return;

    logWarning(std::string("dropping session: ") + toString(result));
    dropSession(controller);
    if (result == BridgeController::TickResult::SubscriptionLost)
    {
        channels->reattachCount.fetch_add(1, std::memory_order_relaxed);
        attach(controller, dispatcher, now);
    }
}

void AutomationWorker::Impl::attach(BridgeController& controller, EventDispatcher& dispatcher, int64_t now)
{
    session = deps.connector ? deps.connector->attach(dispatcher) : nullptr;
    if (!session)
    {
        // Log on transitions only, not every cycle.
        if (!lastAttachFailed)
            logDebug(std::string("attach failed: ") + toString(ErrorKind::NotAttached));
        lastAttachFailed = true;
        return;
    }

    if (lastAttachFailed)
        logDebug("attached to presentation editor");
    lastAttachFailed = false;

    channels->attached.store(true, std::memory_order_release);
    channels->lastEventTime.store(now, std::memory_order_release);
    controller.onAttached(*session, now);
}

void AutomationWorker::Impl::dropSession(BridgeController& controller)
{
    controller.onDetached();
    if (session)
    {
        session->releaseSubscription();
        session.reset();
    }
    channels->attached.store(false, std::memory_order_release);
}

// ─── AutomationWorker public interface ───────────────────────────────────────

AutomationWorker::~AutomationWorker()
{
    if (impl_)
        stop(impl_->shutdownTimeoutMs.load(std::memory_order_acquire));
}

bool AutomationWorker::start(std::shared_ptr<BridgeChannels> channels, Dependencies deps)
{
    if (running_.load(std::memory_order_relaxed))
        return true;
    if (!channels || !deps.host || !deps.pump)
        return false;

    impl_ = std::make_shared<Impl>();
    impl_->channels = std::move(channels);
    impl_->deps = std::move(deps);
    if (auto snap = std::atomic_load(&impl_->channels->settingsSnapshot))
        impl_->shutdownTimeoutMs.store(snap->shutdownTimeoutMs, std::memory_order_relaxed);

    // The thread co-owns Impl so a detached thread never outlives its state.
    std::shared_ptr<Impl> impl = impl_;
    impl_->thread = std::thread([impl]() { impl->threadMain(); });

    while (!impl_->started.load(std::memory_order_acquire))
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    if (impl_->startFailed.load(std::memory_order_acquire))
    {
        impl_->thread.join();
        impl_.reset();
        logError("worker could not enter its apartment");
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

bool AutomationWorker::submit(const BridgeRequest& request)
{
    if (!running_.load(std::memory_order_acquire) || !impl_)
        return false;

    if (!impl_->channels->requestQueue.push(request))
    {
        logWarning(std::string("request queue full: ") + toString(ErrorKind::RequestRejected));
        return false;
    }
    impl_->deps.pump->wake();
    return true;
}

bool AutomationWorker::stop(int timeoutMs)
{
    if (!impl_)
        return true;

    impl_->stopRequested.store(true, std::memory_order_release);
    impl_->deps.pump->wake();

    // Join with a timeout: a hung remote call must not hang the host.
    const int64_t deadline = currentTimeMs() + timeoutMs;
    while (!impl_->finished.load(std::memory_order_acquire) && currentTimeMs() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    bool clean = impl_->finished.load(std::memory_order_acquire);
    if (impl_->thread.joinable())
    {
        if (clean)
            impl_->thread.join();
        else
        {
            logWarning("worker did not stop in time, detaching");
            impl_->thread.detach();
        }
    }

    impl_.reset();
    running_.store(false, std::memory_order_release);
    return clean;
}

bool AutomationWorker::isRunning() const
{
    return running_.load(std::memory_order_acquire);
}

} // namespace SlideBridge
