// =============================================================================
// Unit tests for AutomationWorker and BridgeHost
// Runs the real worker thread against a scripted connector and WaitPump.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "slidebridge/automation/AutomationWorker.h"
#include "slidebridge/automation/EventSink.h"
#include "slidebridge/automation/MessagePump.h"
#include "slidebridge/common/BridgeChannels.h"
#include "slidebridge/host/BridgeHost.h"
#include "slidebridge/host/HostServices.h"
#include "slidebridge/navigation/AccessibilityTree.h"
#include "slidebridge/resolution/SavedFileReader.h"
#include "slidebridge/support/DebugLog.h"
#include "fakes/FakeAppSession.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <optional>
#include <thread>

using namespace SlideBridge;
using namespace SlideBridge::Testing;

namespace
{

// Counters the test thread can read while the worker owns the session.
struct SessionCounters
{
    std::atomic<int> attachCalls{0};
    std::atomic<int> releases{0};
    std::atomic<int> observeHangMs{0};  // simulates an unresponsive editor
    std::atomic<bool> inObserve{false};
};

class CountingSession : public FakeAppSession
{
public:
    explicit CountingSession(std::shared_ptr<SessionCounters> counters) : counters_(std::move(counters)) {}
    void releaseSubscription() override { counters_->releases.fetch_add(1); }

    std::optional<SlideObservation> observe(const WindowKey& window) override
    {
        const int hang = counters_->observeHangMs.load();
        if (hang > 0)
        {
            counters_->inObserve.store(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(hang));
            counters_->inObserve.store(false);
        }
        return FakeAppSession::observe(window);
    }

private:
    std::shared_ptr<SessionCounters> counters_;
};

class ScriptedConnector : public AutomationConnector
{
public:
    explicit ScriptedConnector(bool available) : available_(available) {}

    std::shared_ptr<SessionCounters> counters = std::make_shared<SessionCounters>();

    std::unique_ptr<AppSession> attach(EventDispatcher&) override
    {
        counters->attachCalls.fetch_add(1);
        if (!available_)
            return nullptr;

        auto session = std::make_unique<CountingSession>(counters);
        FakeWindow& w = session->addWindow("deck.pptx", 0x10, 2);
        w.active = true;
        w.slides[0].notes = "Welcome everyone";
        return session;
    }

private:
    bool available_;
};

static bool waitFor(const std::function<bool()>& condition, int timeoutMs = 2000)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

struct Fixture
{
    std::shared_ptr<BridgeChannels> channels = std::make_shared<BridgeChannels>();
    std::shared_ptr<QueuedHost> host = std::make_shared<QueuedHost>();
    std::shared_ptr<ScriptedConnector> connector;
    AutomationWorker worker;
    std::vector<std::string> spoken;

    explicit Fixture(bool available)
        : connector(std::make_shared<ScriptedConnector>(available))
    {
        setLogSink([](LogLevel, const std::string&) {});
        SettingsSnapshot settings;
        settings.pumpWaitMs = 5;
        publishSettings(settings, channels.get());
    }

    ~Fixture()
    {
        worker.stop(1000);
        setLogSink(nullptr);
    }

    bool start()
    {
        AutomationWorker::Dependencies deps;
        deps.connector = connector;
        deps.host = host;
        deps.pump = std::make_unique<WaitPump>();
        return worker.start(channels, std::move(deps));
    }

    bool heard(const std::string& text)
    {
        while (auto line = host->pollAnnouncement())
            spoken.push_back(*line);
        return std::find(spoken.begin(), spoken.end(), text) != spoken.end();
    }
};

} // namespace

TEST_CASE("Worker attaches and announces the visible slide", "[AutomationWorker]")
{
    Fixture f(true);
    REQUIRE(f.start());
    REQUIRE(f.worker.isRunning());

    REQUIRE(waitFor([&] { return f.heard("Slide 1, no comments, has notes"); }));
    REQUIRE(f.channels->attached.load());
    REQUIRE(f.connector->counters->attachCalls.load() == 1);
}

TEST_CASE("Submitted request is handled on the worker", "[AutomationWorker]")
{
    Fixture f(true);
    REQUIRE(f.start());
    REQUIRE(waitFor([&] { return f.channels->attached.load(); }));

    BridgeRequest request;
    request.kind = RequestKind::ReadNotes;
    REQUIRE(f.worker.submit(request));
    REQUIRE(waitFor([&] { return f.heard("Notes: Welcome everyone"); }));
}

TEST_CASE("Stop releases the subscription exactly once", "[AutomationWorker]")
{
    Fixture f(true);
    REQUIRE(f.start());
    REQUIRE(waitFor([&] { return f.channels->attached.load(); }));

    REQUIRE(f.worker.stop(1000));
    REQUIRE_FALSE(f.worker.isRunning());
    REQUIRE(f.connector->counters->releases.load() == 1);
    REQUIRE_FALSE(f.channels->attached.load());

    // Second stop is a no-op
    REQUIRE(f.worker.stop(1000));
    REQUIRE(f.connector->counters->releases.load() == 1);
}

TEST_CASE("Stop is bounded while a remote call hangs", "[AutomationWorker]")
{
    Fixture f(true);
    auto counters = f.connector->counters;
    counters->observeHangMs.store(600);
    REQUIRE(f.start());
    REQUIRE(waitFor([&] { return counters->inObserve.load(); }));

    const auto before = std::chrono::steady_clock::now();
    REQUIRE_FALSE(f.worker.stop(100));
    const auto elapsed = std::chrono::steady_clock::now() - before;

    REQUIRE(elapsed < std::chrono::milliseconds(400));
    REQUIRE_FALSE(f.worker.isRunning());
    REQUIRE(counters->releases.load() == 0);

    // The detached thread finishes the call, then releases on its own.
    REQUIRE(waitFor([&] { return counters->releases.load() == 1; }, 3000));
    REQUIRE(waitFor([&] { return !f.channels->attached.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(counters->releases.load() == 1);
}

TEST_CASE("Destructor stops within the configured shutdown timeout", "[AutomationWorker]")
{
    setLogSink([](LogLevel, const std::string&) {});
    auto channels = std::make_shared<BridgeChannels>();
    SettingsSnapshot settings;
    settings.pumpWaitMs = 5;
    settings.shutdownTimeoutMs = 100;
    publishSettings(settings, channels.get());

    auto connector = std::make_shared<ScriptedConnector>(true);
    auto counters = connector->counters;
    counters->observeHangMs.store(1500);

    std::chrono::steady_clock::time_point before;
    {
        AutomationWorker worker;
        AutomationWorker::Dependencies deps;
        deps.connector = connector;
        deps.host = std::make_shared<QueuedHost>();
        deps.pump = std::make_unique<WaitPump>();
        REQUIRE(worker.start(channels, std::move(deps)));
        REQUIRE(waitFor([&] { return counters->inObserve.load(); }));
        before = std::chrono::steady_clock::now();
    }
    const auto elapsed = std::chrono::steady_clock::now() - before;
    REQUIRE(elapsed < std::chrono::milliseconds(1000));

    REQUIRE(waitFor([&] { return counters->releases.load() == 1; }, 4000));
    setLogSink(nullptr);
}

TEST_CASE("Unavailable application is retried and reported on request", "[AutomationWorker]")
{
    Fixture f(false);
    REQUIRE(f.start());
    REQUIRE(waitFor([&] { return f.connector->counters->attachCalls.load() >= 3; }));
    REQUIRE_FALSE(f.channels->attached.load());

    BridgeRequest request;
    request.kind = RequestKind::NavigateSlide;
    request.argument = 1;
    REQUIRE(f.worker.submit(request));

    std::optional<BridgeResponse> response;
    REQUIRE(waitFor([&] {
        if (!response)
            response = f.host->pollResponse();
        return response.has_value();
    }));
    REQUIRE(response->kind == ResponseKind::Error);
    REQUIRE(response->error == ErrorKind::NotAttached);
    REQUIRE(waitFor([&] { return f.heard("Presentation editor not connected"); }));
}

TEST_CASE("Submit before start is rejected", "[AutomationWorker]")
{
    setLogSink([](LogLevel, const std::string&) {});
    AutomationWorker worker;
    BridgeRequest request;
    request.kind = RequestKind::ReadNotes;
    REQUIRE_FALSE(worker.submit(request));
    REQUIRE(worker.stop(100));
    setLogSink(nullptr);
}

TEST_CASE("Start without a pump fails", "[AutomationWorker]")
{
    AutomationWorker worker;
    AutomationWorker::Dependencies deps;
    deps.host = std::make_shared<QueuedHost>();
    REQUIRE_FALSE(worker.start(std::make_shared<BridgeChannels>(), std::move(deps)));
    REQUIRE_FALSE(worker.isRunning());
}

TEST_CASE("WaitPump returns early when woken", "[MessagePump]")
{
    WaitPump pump;
    pump.wake();

    const auto before = std::chrono::steady_clock::now();
    pump.waitAndDispatch(5000);
    const auto elapsed = std::chrono::steady_clock::now() - before;

    REQUIRE(elapsed < std::chrono::milliseconds(1000));
    REQUIRE(pump.wakeCount() == 1);
}

TEST_CASE("BridgeHost runs detached and answers requests", "[BridgeHost]")
{
    setLogSink([](LogLevel, const std::string&) {});
    {
        BridgeHost bridge;
        auto connector = std::make_shared<ScriptedConnector>(false);
        REQUIRE(bridge.start("/tmp/slidebridge_test_missing_config.json", connector));
        REQUIRE(bridge.isRunning());
        REQUIRE_FALSE(bridge.isAttached());

        BridgeRequest request;
        request.kind = RequestKind::ReadComments;
        REQUIRE(bridge.submit(request));

        std::optional<BridgeResponse> response;
        REQUIRE(waitFor([&] {
            if (!response)
                response = bridge.host().pollResponse();
            return response.has_value();
        }));
        REQUIRE(response->error == ErrorKind::NotAttached);

        REQUIRE(bridge.stop());
        REQUIRE_FALSE(bridge.isRunning());
        REQUIRE(bridge.stop());
    }
    setLogSink(nullptr);
}

TEST_CASE("BridgeHost applies loaded settings", "[BridgeHost]")
{
    setLogSink([](LogLevel, const std::string&) {});
    {
        const std::string path = "/tmp/slidebridge_test_host_config.json";
        {
            std::ofstream out(path);
            out << R"({"pumpWaitMs": 10, "announceMentions": false})";
        }

        BridgeHost bridge;
        REQUIRE(bridge.start(path, std::make_shared<ScriptedConnector>(false)));
        REQUIRE(bridge.settings().snapshot()->pumpWaitMs == 10);
        REQUIRE_FALSE(bridge.settings().snapshot()->announceMentions);
        REQUIRE(bridge.stop());
    }
    setLogSink(nullptr);
}
