// =============================================================================
// Unit tests for ResolutionStatusResolver
// Saved-file reads go through FakeFileReader; packages come from PptxBuilder.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "slidebridge/resolution/ResolutionStatusResolver.h"
#include "slidebridge/logic/StateCache.h"
#include "slidebridge/support/DebugLog.h"
#include "slidebridge/support/SettingsManager.h"
#include "fakes/FakeAppSession.h"
#include "fakes/FakeFileReader.h"
#include "fakes/PptxBuilder.h"

using namespace SlideBridge;
using namespace SlideBridge::Testing;

namespace
{

// One deck, slide 1 with two comments: first resolved, second active.
struct Fixture
{
    FakeAppSession session;
    FakeFileReader reader;
    StateCache cache;
    WindowKey window{"C:\\decks\\review.pptx", 0x10};

    Fixture()
    {
        setLogSink([](LogLevel, const std::string&) {});

        FakeWindow& w = session.addWindow(window.presentation, window.hwnd, 2);
        w.savedPath = window.presentation;
        w.slides[0].comments = {makeComment("Sarah Johnson", "Fix the chart"),
                                makeComment("Raj Patel", "Source?")};

        PptxBuilder pptx;
        pptx.author("{A1}", "Sarah Johnson").author("{A2}", "Raj Patel");
        int s1 = pptx.addSlide();
        pptx.addSlide();
        pptx.modernComment(s1, "{A1}", "Fix the chart", "resolved");
        pptx.modernComment(s1, "{A2}", "Source?");
        reader.serve(pptx.build());

        observe(1);
    }

    ~Fixture() { setLogSink(nullptr); }

    void observe(int slide)
    {
        auto comments = session.comments(window, slide);
        cache.update(window, slide, static_cast<int>(comments.size()), false);
        cache.storeComments(window, slide, comments);
    }

    SlideSnapshot snap(int slide = 1) { return *cache.get(window, slide); }
};

} // namespace

TEST_CASE("Tier follows the reader's capability", "[ResolutionStatusResolver]")
{
    setLogSink([](LogLevel, const std::string&) {});
    FakeFileReader bypass;
    FakeFileReader shared;
    shared.bypassLocks = false;

    REQUIRE(ResolutionStatusResolver(&bypass).tier() == ResolutionTier::SnapshotRead);
    REQUIRE(ResolutionStatusResolver(&shared).tier() == ResolutionTier::SaveHook);
    REQUIRE(ResolutionStatusResolver(nullptr).tier() == ResolutionTier::Unavailable);
    setLogSink(nullptr);
}

TEST_CASE("Snapshot read merges per-comment statuses", "[ResolutionStatusResolver]")
{
    Fixture f;
    ResolutionStatusResolver resolver(&f.reader);

    resolver.schedule(f.window, 0);
    auto changed = resolver.runDue(0, f.session, f.cache);

    REQUIRE(changed.size() == 1);
    REQUIRE(changed[0].second == 1);
    REQUIRE(f.reader.snapshotReads == 1);
    REQUIRE(f.reader.paths.front() == f.window.presentation);

    SlideSnapshot s = f.snap();
    REQUIRE(s.resolution.resolved == 1);
    REQUIRE(s.resolution.active == 1);
    REQUIRE(s.freshness == Freshness::Fresh);
    REQUIRE(s.comments[0].status == ResolutionStatus::Resolved);
    REQUIRE(s.comments[1].status == ResolutionStatus::Active);
    REQUIRE(s.comments[0].author == "Sarah Johnson");

    // Periodic re-read
    REQUIRE(resolver.nextDue() == int64_t(30000));
}

TEST_CASE("Unsaved edits mark data as stale", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.session.windowList[0].dirty = true;
    ResolutionStatusResolver resolver(&f.reader);

    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    REQUIRE(f.snap().freshness == Freshness::StaleCached);
    REQUIRE(f.snap().resolution.resolved == 1);
}

TEST_CASE("Never-saved deck reports unknown", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.session.windowList[0].savedPath = std::string();
    ResolutionStatusResolver resolver(&f.reader);

    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);

    REQUIRE(f.reader.snapshotReads == 0);
    REQUIRE(f.snap().freshness == Freshness::Unknown);
    REQUIRE(f.snap().resolution.unknown == 2);
    REQUIRE_FALSE(resolver.nextDue().has_value());
}

TEST_CASE("No reader leaves everything unknown", "[ResolutionStatusResolver]")
{
    Fixture f;
    ResolutionStatusResolver resolver(nullptr);

    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    resolver.applyTo(f.window, 1, f.session, f.cache);

    REQUIRE(f.snap().freshness == Freshness::Unknown);
    REQUIRE(f.snap().resolution.unknown == 2);
}

TEST_CASE("Locked file is retried with growing backoff", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.reader.queue(FileReadStatus::Locked);
    f.reader.queue(FileReadStatus::Locked);
    ResolutionStatusResolver resolver(&f.reader);

    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    REQUIRE(resolver.nextDue() == int64_t(250));
    REQUIRE_FALSE(resolver.hasData(f.window.presentation));

    resolver.runDue(250, f.session, f.cache);
    REQUIRE(resolver.nextDue() == int64_t(750));

    resolver.runDue(750, f.session, f.cache);
    REQUIRE(resolver.hasData(f.window.presentation));
    REQUIRE(f.snap().resolution.resolved == 1);
}

TEST_CASE("Persistent lock gives up after the configured attempts", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.reader.bypassLocks = false;
    f.reader.steady = FileReadResult{FileReadStatus::Locked, std::string()};

    SettingsSnapshot settings;
    settings.fileRetryAttempts = 3;
    settings.fileRetryBackoffMs = 100;
    ResolutionStatusResolver resolver(&f.reader);
    resolver.configure(settings);

    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);    // attempt 1 -> due 100
    resolver.runDue(100, f.session, f.cache);  // attempt 2 -> due 300
    resolver.runDue(300, f.session, f.cache);  // attempt 3 -> give up

    REQUIRE(f.reader.sharedReads == 3);
    REQUIRE_FALSE(resolver.nextDue().has_value());
    REQUIRE(f.snap().freshness == Freshness::Unknown);
}

TEST_CASE("Save hook re-reads after the configured delay", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.reader.bypassLocks = false;
    f.reader.steady = FileReadResult{FileReadStatus::Locked, std::string()};

    SettingsSnapshot settings;
    settings.fileRetryAttempts = 1;
    ResolutionStatusResolver resolver(&f.reader);
    resolver.configure(settings);

    // First sight: file held open by the editor, no data.
    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    REQUIRE_FALSE(resolver.hasData(f.window.presentation));

    // Save completes and releases the lock.
    PptxBuilder pptx;
    pptx.author("{A1}", "Sarah Johnson");
    int s1 = pptx.addSlide();
    pptx.modernComment(s1, "{A1}", "Fix the chart", "resolved");
    f.reader.serve(pptx.build());

    resolver.onSaved(f.window, 1000);
    REQUIRE(resolver.nextDue() == int64_t(2500));
    REQUIRE(resolver.runDue(2000, f.session, f.cache).empty());

    resolver.runDue(2500, f.session, f.cache);
    REQUIRE(resolver.hasData(f.window.presentation));
    REQUIRE(f.snap().comments[0].status == ResolutionStatus::Resolved);
    REQUIRE(f.snap().comments[1].status == ResolutionStatus::Unknown);
    REQUIRE(f.snap().freshness == Freshness::Fresh);
    REQUIRE_FALSE(resolver.nextDue().has_value());
}

TEST_CASE("Pending save keeps old data marked stale", "[ResolutionStatusResolver]")
{
    Fixture f;
    ResolutionStatusResolver resolver(&f.reader);
    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    REQUIRE(f.snap().freshness == Freshness::Fresh);

    resolver.onSaved(f.window, 100);
    resolver.applyTo(f.window, 1, f.session, f.cache);
    REQUIRE(f.snap().freshness == Freshness::StaleCached);
    REQUIRE(f.snap().resolution.resolved == 1);
}

TEST_CASE("Windows on one presentation share a read", "[ResolutionStatusResolver]")
{
    Fixture f;
    WindowKey second{f.window.presentation, 0x20};
    FakeWindow& w2 = f.session.addWindow(second.presentation, second.hwnd, 2);
    w2.slides[0].comments = f.session.windowList[0].slides[0].comments;
    auto comments = f.session.comments(second, 1);
    f.cache.update(second, 1, 2, false);
    f.cache.storeComments(second, 1, comments);

    ResolutionStatusResolver resolver(&f.reader);
    resolver.schedule(f.window, 0);
    resolver.schedule(second, 0);
    auto changed = resolver.runDue(0, f.session, f.cache);

    REQUIRE(f.reader.snapshotReads == 1);
    REQUIRE(changed.size() == 2);
    REQUIRE(f.cache.get(second, 1)->resolution.resolved == 1);
}

TEST_CASE("Comment added after the save stays unknown", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.session.windowList[0].slides[0].comments.push_back(makeComment("Li Wei", "New thought"));
    f.observe(1);

    ResolutionStatusResolver resolver(&f.reader);
    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);

    REQUIRE(f.snap().resolution.active == 1);
    REQUIRE(f.snap().resolution.resolved == 1);
    REQUIRE(f.snap().resolution.unknown == 1);
}

TEST_CASE("Forgetting a presentation drops its data", "[ResolutionStatusResolver]")
{
    Fixture f;
    ResolutionStatusResolver resolver(&f.reader);
    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    REQUIRE(resolver.hasData(f.window.presentation));

    resolver.forget(f.window.presentation);
    REQUIRE_FALSE(resolver.hasData(f.window.presentation));
}

TEST_CASE("Failed snapshot read waits for the next periodic read", "[ResolutionStatusResolver]")
{
    Fixture f;
    f.reader.queue(FileReadStatus::Failed);
    ResolutionStatusResolver resolver(&f.reader);

    resolver.schedule(f.window, 0);
    resolver.runDue(0, f.session, f.cache);
    REQUIRE_FALSE(resolver.hasData(f.window.presentation));
    REQUIRE(f.snap().freshness == Freshness::Unknown);
    REQUIRE(resolver.nextDue() == int64_t(30000));

    resolver.runDue(30000, f.session, f.cache);
    REQUIRE(f.reader.snapshotReads == 2);
    REQUIRE(f.reader.sharedReads == 0);
    REQUIRE(f.snap().resolution.resolved == 1);
    REQUIRE(f.snap().freshness == Freshness::Fresh);
}
