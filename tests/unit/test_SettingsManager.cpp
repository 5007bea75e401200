// =============================================================================
// Unit tests for SettingsManager
// Pure logic - no Win32 API dependencies.
//
// JSON persistence, validation, corruption recovery, observer pattern.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "slidebridge/support/SettingsManager.h"

#include <cstdio>
#include <fstream>
#include <string>

using namespace SlideBridge;
using Catch::Approx;

// Helper: write a string to a temp file and return the path
static std::string writeTempFile(const std::string& content, const char* name = "test_config.json")
{
    std::string path = std::string("/tmp/slidebridge_test_") + name;
    std::ofstream f(path);
    f << content;
    f.close();
    return path;
}

TEST_CASE("SettingsManager starts with defaults", "[SettingsManager]")
{
    SettingsManager mgr;
    auto snap = mgr.snapshot();

    REQUIRE(snap->pumpWaitMs == 50);
    REQUIRE(snap->shutdownTimeoutMs == 3000);
    REQUIRE(snap->resolutionRefreshMs == 30000);
    REQUIRE(snap->saveRereadDelayMs == 1500);
    REQUIRE(snap->fileRetryAttempts == 5);
    REQUIRE(snap->fileRetryBackoffMs == 250);
    REQUIRE(snap->strongMatchThreshold == Approx(0.85f));
    REQUIRE(snap->weakMatchThreshold == Approx(0.70f));
    REQUIRE(snap->userIdentities.empty());
    REQUIRE(snap->announceMentions == true);
    REQUIRE(snap->ensureNormalView == true);
    REQUIRE(snap->commentsPaneAutomationIds == std::vector<std::string>{"CommentsPane", "NewCommentsPane"});
    REQUIRE(snap->commentsPaneCommand == "ReviewShowComments");
}

TEST_CASE("Load valid JSON parses every field", "[SettingsManager]")
{
    std::string json = R"({
        "pumpWaitMs": 20,
        "shutdownTimeoutMs": 5000,
        "livenessProbeMs": 1000,
        "subscriptionStaleMs": 20000,
        "resolutionRefreshMs": 60000,
        "saveRereadDelayMs": 500,
        "fileRetryAttempts": 3,
        "fileRetryBackoffMs": 100,
        "strongMatchThreshold": 0.9,
        "weakMatchThreshold": 0.75,
        "userIdentities": ["Sarah Johnson", "sarah@example.com"],
        "announceMentions": false,
        "ensureNormalView": false,
        "commentsPaneAutomationIds": ["ModernCommentsPane"],
        "commentsPaneCommand": "ShowComments",
        "logLevel": 0
    })";

    auto path = writeTempFile(json);
    SettingsManager mgr;
    REQUIRE(mgr.loadFromFile(path.c_str()));

    auto snap = mgr.snapshot();
    REQUIRE(snap->pumpWaitMs == 20);
    REQUIRE(snap->shutdownTimeoutMs == 5000);
    REQUIRE(snap->livenessProbeMs == 1000);
    REQUIRE(snap->subscriptionStaleMs == 20000);
    REQUIRE(snap->resolutionRefreshMs == 60000);
    REQUIRE(snap->saveRereadDelayMs == 500);
    REQUIRE(snap->fileRetryAttempts == 3);
    REQUIRE(snap->fileRetryBackoffMs == 100);
    REQUIRE(snap->strongMatchThreshold == Approx(0.9f));
    REQUIRE(snap->weakMatchThreshold == Approx(0.75f));
    REQUIRE(snap->userIdentities == std::vector<std::string>{"Sarah Johnson", "sarah@example.com"});
    REQUIRE(snap->announceMentions == false);
    REQUIRE(snap->ensureNormalView == false);
    REQUIRE(snap->commentsPaneAutomationIds == std::vector<std::string>{"ModernCommentsPane"});
    REQUIRE(snap->commentsPaneCommand == "ShowComments");
    REQUIRE(snap->logLevel == 0);
}

TEST_CASE("Save then load round-trip", "[SettingsManager]")
{
    SettingsSnapshot custom;
    custom.pumpWaitMs = 10;
    custom.resolutionRefreshMs = 5000;
    custom.fileRetryAttempts = 8;
    custom.strongMatchThreshold = 0.95f;
    custom.weakMatchThreshold = 0.8f;
    custom.userIdentities = {"Raj Patel"};
    custom.announceMentions = false;
    custom.commentsPaneCommand = "ReviewComments";
    custom.logLevel = 2;

    SettingsManager mgr1;
    mgr1.applySnapshot(custom);

    std::string path = "/tmp/slidebridge_test_roundtrip.json";
    REQUIRE(mgr1.saveToFile(path.c_str()));

    SettingsManager mgr2;
    REQUIRE(mgr2.loadFromFile(path.c_str()));

    auto snap = mgr2.snapshot();
    REQUIRE(snap->pumpWaitMs == custom.pumpWaitMs);
    REQUIRE(snap->resolutionRefreshMs == custom.resolutionRefreshMs);
    REQUIRE(snap->fileRetryAttempts == custom.fileRetryAttempts);
    REQUIRE(snap->strongMatchThreshold == Approx(custom.strongMatchThreshold));
    REQUIRE(snap->weakMatchThreshold == Approx(custom.weakMatchThreshold));
    REQUIRE(snap->userIdentities == custom.userIdentities);
    REQUIRE(snap->announceMentions == custom.announceMentions);
    REQUIRE(snap->commentsPaneCommand == custom.commentsPaneCommand);
    REQUIRE(snap->logLevel == custom.logLevel);
}

TEST_CASE("Load corrupt JSON returns false, defaults intact", "[SettingsManager]")
{
    auto path = writeTempFile("{invalid json!!!", "corrupt.json");

    SettingsManager mgr;
    REQUIRE_FALSE(mgr.loadFromFile(path.c_str()));
    REQUIRE(mgr.snapshot()->resolutionRefreshMs == 30000);
    REQUIRE(mgr.version() == 0);
}

TEST_CASE("Load missing file returns false, defaults intact", "[SettingsManager]")
{
    SettingsManager mgr;
    REQUIRE_FALSE(mgr.loadFromFile("/tmp/slidebridge_nonexistent_12345.json"));
    REQUIRE(mgr.snapshot()->pumpWaitMs == 50);
}

TEST_CASE("Load JSON with missing fields, defaults fill in", "[SettingsManager]")
{
    auto path = writeTempFile(R"({"fileRetryAttempts": 2})", "partial.json");

    SettingsManager mgr;
    REQUIRE(mgr.loadFromFile(path.c_str()));

    auto snap = mgr.snapshot();
    REQUIRE(snap->fileRetryAttempts == 2);      // Changed
    REQUIRE(snap->fileRetryBackoffMs == 250);   // Default
    REQUIRE(snap->commentsPaneAutomationIds.size() == 2);
}

TEST_CASE("Out-of-range values keep their defaults", "[SettingsManager]")
{
    auto path = writeTempFile(R"({"pumpWaitMs": 0, "fileRetryAttempts": 99,
                                  "resolutionRefreshMs": 10, "logLevel": 7,
                                  "strongMatchThreshold": 1.5})", "range.json");

    SettingsManager mgr;
    REQUIRE(mgr.loadFromFile(path.c_str()));

    auto snap = mgr.snapshot();
    REQUIRE(snap->pumpWaitMs == 50);
    REQUIRE(snap->fileRetryAttempts == 5);
    REQUIRE(snap->resolutionRefreshMs == 30000);
    REQUIRE(snap->logLevel == 1);
    REQUIRE(snap->strongMatchThreshold == Approx(0.85f));
}

TEST_CASE("Weak threshold above strong resets both", "[SettingsManager]")
{
    auto path = writeTempFile(R"({"strongMatchThreshold": 0.6, "weakMatchThreshold": 0.9})", "inverted.json");

    SettingsManager mgr;
    REQUIRE(mgr.loadFromFile(path.c_str()));

    auto snap = mgr.snapshot();
    REQUIRE(snap->strongMatchThreshold == Approx(0.85f));
    REQUIRE(snap->weakMatchThreshold == Approx(0.70f));
}

TEST_CASE("Wrong-typed values are ignored", "[SettingsManager]")
{
    auto path = writeTempFile(R"({"pumpWaitMs": "fast", "announceMentions": 1,
                                  "commentsPaneCommand": "",
                                  "userIdentities": ["Li Wei", 42, ""]})", "types.json");

    SettingsManager mgr;
    REQUIRE(mgr.loadFromFile(path.c_str()));

    auto snap = mgr.snapshot();
    REQUIRE(snap->pumpWaitMs == 50);
    REQUIRE(snap->announceMentions == true);
    REQUIRE(snap->commentsPaneCommand == "ReviewShowComments");
    REQUIRE(snap->userIdentities == std::vector<std::string>{"Li Wei"});
}

TEST_CASE("Empty pane id list keeps the defaults", "[SettingsManager]")
{
    auto path = writeTempFile(R"({"commentsPaneAutomationIds": [], "userIdentities": []})", "empty.json");

    SettingsManager mgr;
    REQUIRE(mgr.loadFromFile(path.c_str()));
    REQUIRE(mgr.snapshot()->commentsPaneAutomationIds.size() == 2);
    REQUIRE(mgr.snapshot()->userIdentities.empty());
}

TEST_CASE("applySnapshot increments version", "[SettingsManager]")
{
    SettingsManager mgr;
    uint64_t v0 = mgr.version();

    SettingsSnapshot snap;
    snap.pumpWaitMs = 25;
    mgr.applySnapshot(snap);

    REQUIRE(mgr.version() > v0);
    REQUIRE(mgr.snapshot()->pumpWaitMs == 25);
}

TEST_CASE("loadFromFile increments version", "[SettingsManager]")
{
    auto path = writeTempFile(R"({"pumpWaitMs": 30})", "version.json");

    SettingsManager mgr;
    uint64_t v0 = mgr.version();

    REQUIRE(mgr.loadFromFile(path.c_str()));
    REQUIRE(mgr.version() > v0);
}

TEST_CASE("Observer sees applied and loaded settings", "[SettingsManager]")
{
    SettingsManager mgr;

    int lastPumpWait = 0;
    mgr.addObserver([](const SettingsSnapshot& snap, void* ud) {
        *static_cast<int*>(ud) = snap.pumpWaitMs;
    }, &lastPumpWait);

    SettingsSnapshot snap;
    snap.pumpWaitMs = 70;
    mgr.applySnapshot(snap);
    REQUIRE(lastPumpWait == 70);

    auto path = writeTempFile(R"({"pumpWaitMs": 15})", "observer.json");
    REQUIRE(mgr.loadFromFile(path.c_str()));
    REQUIRE(lastPumpWait == 15);
}

TEST_CASE("snapshot() returns an immutable copy", "[SettingsManager]")
{
    SettingsManager mgr;
    auto snap1 = mgr.snapshot();

    SettingsSnapshot newSnap;
    newSnap.userIdentities = {"Sarah"};
    mgr.applySnapshot(newSnap);

    REQUIRE(snap1->userIdentities.empty());
    REQUIRE(mgr.snapshot()->userIdentities.size() == 1);
}
